#pragma once

#include "backtest/trade_record.hpp"
#include "models/confidence_model.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SimulatorConfig - confidence gating and fixed-fractional risk
// ---------------------------------------------------------------------------
struct SimulatorConfig {
    double initial_equity = 10000.0;
    double risk_fraction = 0.01;      // of current equity, per trade
    double threshold = 0.7;           // act when max(c, 1 - c) >= threshold
    bool exclude_neutral = false;     // skip rows whose Label is NEUTRAL
};

// ---------------------------------------------------------------------------
// SimulationResult - trade log, equity curve and rejected rows of one run
// ---------------------------------------------------------------------------
struct SimulationResult {
    double initial_equity = 0.0;
    double final_equity = 0.0;
    std::vector<TradeRecord> trades;
    std::vector<EquitySample> equity_curve;
    std::vector<SkippedRow> skipped;
    int below_threshold = 0;   // valid rows that did not clear the threshold
};

namespace backtest_util {

// Single chronological stream across symbols. Equal timestamps are ordered
// by symbol; rows of one symbol keep their relative order.
inline std::vector<ScoredRow> merge_by_timestamp(std::vector<ScoredRow> rows) {
    std::stable_sort(rows.begin(), rows.end(),
        [](const ScoredRow& a, const ScoredRow& b) {
            if (a.timestamp() != b.timestamp()) return a.timestamp() < b.timestamp();
            return a.symbol() < b.symbol();
        });
    return rows;
}

inline bool valid_confidence(double c) {
    return std::isfinite(c) && c >= 0.0 && c <= 1.0;
}

inline int predicted_direction(double confidence) {
    return confidence >= 0.5 ? 1 : -1;
}

inline bool clears_threshold(double confidence, double threshold) {
    return std::max(confidence, 1.0 - confidence) >= threshold;
}

}  // namespace backtest_util

// ---------------------------------------------------------------------------
// TradeSimulator - ordered equity fold over scored rows
//
// Each acted-upon row opens and closes one trade whose result is read from
// its Label: the predicted side winning realizes +tp/sl R, anything else
// (opposite side or NEUTRAL) realizes -1 R.
// ---------------------------------------------------------------------------
class TradeSimulator {
public:
    explicit TradeSimulator(const SimulatorConfig& cfg = {}) : cfg_(cfg) {
        if (!(cfg_.initial_equity > 0.0)) {
            throw std::invalid_argument("initial_equity must be positive");
        }
        if (!(cfg_.risk_fraction > 0.0 && cfg_.risk_fraction < 1.0)) {
            throw std::invalid_argument("risk_fraction must be in (0, 1)");
        }
        if (!(cfg_.threshold >= 0.5 && cfg_.threshold <= 1.0)) {
            throw std::invalid_argument("threshold must be in [0.5, 1]");
        }
    }

    const SimulatorConfig& config() const { return cfg_; }

    SimulationResult run(const std::vector<ScoredRow>& rows) const {
        auto stream = backtest_util::merge_by_timestamp(rows);

        SimulationResult result;
        result.initial_equity = cfg_.initial_equity;
        double equity = cfg_.initial_equity;

        for (const auto& sr : stream) {
            const auto& label = sr.row.label;

            if (!backtest_util::valid_confidence(sr.confidence)) {
                skip(result, sr, skip_reason::INVALID_CONFIDENCE);
                continue;
            }
            if (cfg_.exclude_neutral && label.outcome == Outcome::NEUTRAL) {
                skip(result, sr, skip_reason::EXCLUDED_NEUTRAL);
                continue;
            }
            if (!backtest_util::clears_threshold(sr.confidence, cfg_.threshold)) {
                result.below_threshold++;
                continue;
            }
            double stop_distance = label.sl_mult * label.atr;
            if (!(stop_distance > 0.0) || !std::isfinite(stop_distance)) {
                skip(result, sr, skip_reason::INVALID_RISK_BASIS);
                continue;
            }

            TradeRecord t = open_trade(sr, equity, stop_distance);
            equity = t.equity_after;
            result.equity_curve.push_back({t.open_ts, t.symbol, equity});
            result.trades.push_back(std::move(t));
        }

        result.final_equity = equity;
        return result;
    }

private:
    SimulatorConfig cfg_;

    static void skip(SimulationResult& result, const ScoredRow& sr, const char* reason) {
        result.skipped.push_back({sr.symbol(), sr.timestamp(), reason});
    }

    TradeRecord open_trade(const ScoredRow& sr, double equity,
                           double stop_distance) const {
        const auto& label = sr.row.label;

        TradeRecord t;
        t.symbol = sr.symbol();
        t.open_ts = sr.timestamp();
        t.origin_idx = label.origin_idx;
        t.direction = backtest_util::predicted_direction(sr.confidence);
        t.confidence = sr.confidence;
        t.entry_price = label.entry;
        t.tp_mult = label.tp_mult;
        t.sl_mult = label.sl_mult;
        t.atr = label.atr;
        if (t.direction > 0) {
            t.tp_price = label.long_tp;
            t.sl_price = label.long_sl;
        } else {
            t.tp_price = label.short_tp;
            t.sl_price = label.short_sl;
        }
        t.label_outcome = label.outcome;

        t.win = to_int(label.outcome) == t.direction;
        t.r_multiple = t.win ? label.tp_mult / label.sl_mult : -1.0;

        t.equity_before = equity;
        t.risk_amount = cfg_.risk_fraction * equity;
        t.position_size = t.risk_amount / stop_distance;
        t.pnl = t.r_multiple * t.risk_amount;
        t.equity_after = equity + t.pnl;
        return t;
    }
};
