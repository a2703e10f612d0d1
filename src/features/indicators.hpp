#pragma once

#include "bars/price_bar.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

// ---------------------------------------------------------------------------
// IndicatorConfig - look-back lengths of the regime input indicators
// ---------------------------------------------------------------------------
struct IndicatorConfig {
    int atr_period = 14;
    int adx_period = 14;
    int sma_fast_period = 20;
    int sma_slow_period = 50;
    int bb_period = 20;
    double bb_num_std = 2.0;
};

namespace indicators {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
constexpr double EPS = 1e-9;

// Trailing simple mean; NaN until `window` finite values are available.
inline std::vector<double> rolling_mean(const std::vector<double>& values, int window) {
    int n = static_cast<int>(values.size());
    std::vector<double> out(n, NaN);
    if (window <= 0) return out;

    double sum = 0.0;
    int valid = 0;
    for (int i = 0; i < n; ++i) {
        if (std::isfinite(values[i])) { sum += values[i]; ++valid; }
        if (i >= window) {
            double dropped = values[i - window];
            if (std::isfinite(dropped)) { sum -= dropped; --valid; }
        }
        if (i >= window - 1 && valid == window) {
            out[i] = sum / static_cast<double>(window);
        }
    }
    return out;
}

// Trailing sample standard deviation (n - 1 denominator).
inline std::vector<double> rolling_std(const std::vector<double>& values, int window) {
    int n = static_cast<int>(values.size());
    std::vector<double> out(n, NaN);
    if (window < 2) return out;

    for (int i = window - 1; i < n; ++i) {
        double sum = 0.0;
        bool ok = true;
        for (int j = i - window + 1; j <= i; ++j) {
            if (!std::isfinite(values[j])) { ok = false; break; }
            sum += values[j];
        }
        if (!ok) continue;
        double mean = sum / static_cast<double>(window);
        double sum_sq = 0.0;
        for (int j = i - window + 1; j <= i; ++j) {
            double d = values[j] - mean;
            sum_sq += d * d;
        }
        out[i] = std::sqrt(sum_sq / static_cast<double>(window - 1));
    }
    return out;
}

inline std::vector<double> true_range(const std::vector<PriceBar>& bars) {
    int n = static_cast<int>(bars.size());
    std::vector<double> tr(n, NaN);
    for (int i = 0; i < n; ++i) {
        double range = bars[i].high - bars[i].low;
        if (i == 0) {
            tr[i] = range;
            continue;
        }
        double prev_close = bars[i - 1].close;
        tr[i] = std::max({range,
                          std::abs(bars[i].high - prev_close),
                          std::abs(bars[i].low - prev_close)});
    }
    return tr;
}

inline std::vector<double> atr(const std::vector<PriceBar>& bars, int period) {
    return rolling_mean(true_range(bars), period);
}

// Simplified ADX: directional movement averaged over `period`, scaled by ATR,
// then DX averaged over another `period` bars.
inline std::vector<double> adx(const std::vector<PriceBar>& bars,
                               const std::vector<double>& atr_values, int period) {
    int n = static_cast<int>(bars.size());
    std::vector<double> plus_dm(n, 0.0);
    std::vector<double> minus_dm(n, 0.0);
    for (int i = 1; i < n; ++i) {
        double up = bars[i].high - bars[i - 1].high;
        double down = bars[i - 1].low - bars[i].low;
        if (up > down && up > 0.0) plus_dm[i] = up;
        if (down > up && down > 0.0) minus_dm[i] = down;
    }

    auto plus_avg = rolling_mean(plus_dm, period);
    auto minus_avg = rolling_mean(minus_dm, period);

    std::vector<double> dx(n, NaN);
    for (int i = 0; i < n; ++i) {
        if (!std::isfinite(plus_avg[i]) || !std::isfinite(minus_avg[i]) ||
            !std::isfinite(atr_values[i])) {
            continue;
        }
        double plus_di = 100.0 * plus_avg[i] / (atr_values[i] + EPS);
        double minus_di = 100.0 * minus_avg[i] / (atr_values[i] + EPS);
        dx[i] = 100.0 * std::abs(plus_di - minus_di) / (plus_di + minus_di + EPS);
    }
    return rolling_mean(dx, period);
}

inline std::vector<double> closes(const std::vector<PriceBar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(b.close);
    return out;
}

// Fills every indicator column that is NaN on a bar. Columns supplied by the
// caller are left untouched.
inline void fill_missing(SymbolSeries& series, const IndicatorConfig& cfg = {}) {
    auto& bars = series.bars;
    int n = static_cast<int>(bars.size());
    if (n == 0) return;

    auto close = closes(bars);
    auto atr_values = atr(bars, cfg.atr_period);

    // ADX is scaled by the ATR the bar actually carries when it has one.
    std::vector<double> atr_for_adx(n);
    for (int i = 0; i < n; ++i) {
        atr_for_adx[i] = std::isfinite(bars[i].atr) ? bars[i].atr : atr_values[i];
    }
    auto adx_values = adx(bars, atr_for_adx, cfg.adx_period);
    auto sma_fast = rolling_mean(close, cfg.sma_fast_period);
    auto sma_slow = rolling_mean(close, cfg.sma_slow_period);
    auto bb_std = rolling_std(close, cfg.bb_period);

    for (int i = 0; i < n; ++i) {
        auto& b = bars[i];
        if (std::isnan(b.atr)) b.atr = atr_values[i];
        if (std::isnan(b.adx)) b.adx = adx_values[i];
        if (std::isnan(b.sma_fast)) b.sma_fast = sma_fast[i];
        if (std::isnan(b.sma_slow)) b.sma_slow = sma_slow[i];
        if (std::isnan(b.bb_width) && std::isfinite(bb_std[i])) {
            b.bb_width = 2.0 * cfg.bb_num_std * bb_std[i];
        }
    }
}

}  // namespace indicators
