#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PriceBar - one OHLC bar with its precomputed indicator columns
// ---------------------------------------------------------------------------
struct PriceBar {
    uint64_t timestamp = 0;

    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;

    // Indicators (NaN until enough history exists to compute them)
    double atr = std::numeric_limits<double>::quiet_NaN();
    double adx = std::numeric_limits<double>::quiet_NaN();
    double sma_fast = std::numeric_limits<double>::quiet_NaN();
    double sma_slow = std::numeric_limits<double>::quiet_NaN();
    double bb_width = std::numeric_limits<double>::quiet_NaN();
};

// ---------------------------------------------------------------------------
// SymbolSeries - ascending-timestamp bars of a single symbol
// ---------------------------------------------------------------------------
struct SymbolSeries {
    std::string symbol;
    std::vector<PriceBar> bars;

    int size() const { return static_cast<int>(bars.size()); }
};

// Validates a series before any computation touches it. Duplicate or
// non-increasing timestamps and inconsistent OHLC values are fatal.
inline void validate_series(const SymbolSeries& series) {
    if (series.symbol.empty()) {
        throw std::invalid_argument("Series has an empty symbol");
    }
    for (int i = 0; i < series.size(); ++i) {
        const auto& b = series.bars[i];
        std::string where = series.symbol + " bar " + std::to_string(i);

        if (i > 0 && b.timestamp <= series.bars[i - 1].timestamp) {
            throw std::invalid_argument(
                where + ": timestamp " + std::to_string(b.timestamp) +
                " does not increase (previous " +
                std::to_string(series.bars[i - 1].timestamp) + ")");
        }
        if (!std::isfinite(b.open) || !std::isfinite(b.high) ||
            !std::isfinite(b.low) || !std::isfinite(b.close)) {
            throw std::invalid_argument(where + ": non-finite price");
        }
        if (b.high < std::max(b.open, b.close) || b.low > std::min(b.open, b.close)) {
            throw std::invalid_argument(where + ": high/low do not bracket open/close");
        }
    }
}

inline void validate_universe(const std::vector<SymbolSeries>& universe) {
    for (size_t i = 0; i < universe.size(); ++i) {
        validate_series(universe[i]);
        for (size_t j = 0; j < i; ++j) {
            if (universe[j].symbol == universe[i].symbol) {
                throw std::invalid_argument("Duplicate series for symbol " +
                                            universe[i].symbol);
            }
        }
    }
}
