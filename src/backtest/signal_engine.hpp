#pragma once

#include "backtest/trade_simulator.hpp"
#include "bars/price_bar.hpp"
#include "labeling/barrier_params.hpp"
#include "models/confidence_model.hpp"
#include "regime/regime_classifier.hpp"

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Signal - actionable order levels for the most recent bar of a symbol
// ---------------------------------------------------------------------------
struct Signal {
    std::string symbol;
    uint64_t timestamp = 0;
    int direction = 0;          // +1 = LONG, -1 = SHORT
    double confidence = 0.0;
    double entry = 0.0;
    double take_profit = 0.0;
    double stop_loss = 0.0;
    double tp_mult = 0.0;
    double sl_mult = 0.0;
    int horizon = 0;
    RegimeTag regime;
};

// ---------------------------------------------------------------------------
// SignalEngine - live counterpart of labeling + simulation
//
// Uses the same regime classification, barrier selection and confidence
// gating as the backtest. Series must already carry indicator columns.
// ---------------------------------------------------------------------------
class SignalEngine {
public:
    SignalEngine(const RegimeConfig& regime_cfg, const BarrierConfig& barrier_cfg,
                 double threshold)
        : classifier_(regime_cfg), barrier_cfg_(barrier_cfg), threshold_(threshold) {}

    double threshold() const { return threshold_; }

    // Regime of the last bar, nullopt when indeterminate.
    std::optional<RegimeTag> latest_regime(const SymbolSeries& series) const {
        if (series.bars.empty()) return std::nullopt;
        auto tags = classifier_.classify_series(series);
        return tags.back();
    }

    // Feature row of the last bar; its Label is left default since the
    // forward window does not exist yet.
    std::optional<LabeledRow> latest_row(const SymbolSeries& series) const {
        auto tag = latest_regime(series);
        if (!tag) return std::nullopt;
        LabeledRow row;
        row.symbol = series.symbol;
        row.bar = series.bars.back();
        row.regime = *tag;
        return row;
    }

    std::optional<Signal> generate(const SymbolSeries& series, double confidence) const {
        if (!backtest_util::valid_confidence(confidence)) return std::nullopt;
        if (!backtest_util::clears_threshold(confidence, threshold_)) return std::nullopt;
        auto tag = latest_regime(series);
        if (!tag) return std::nullopt;
        return make_signal(series, *tag, confidence);
    }

    std::vector<Signal> generate(const std::vector<SymbolSeries>& universe,
                                 ConfidenceModel& model) const {
        std::vector<Signal> out;
        for (const auto& series : universe) {
            auto row = latest_row(series);
            if (!row) continue;
            double c = model.predict_long_probability(regime_features(*row));
            if (!backtest_util::valid_confidence(c)) continue;
            if (!backtest_util::clears_threshold(c, threshold_)) continue;
            out.push_back(make_signal(series, row->regime, c));
        }
        return out;
    }

    std::vector<Signal> generate(const std::vector<SymbolSeries>& universe,
                                 const ConfidenceTable& table) const {
        std::vector<Signal> out;
        for (const auto& series : universe) {
            if (series.bars.empty()) continue;
            auto c = table.lookup(series.symbol, series.bars.back().timestamp);
            if (!c) continue;
            if (auto s = generate(series, *c)) out.push_back(std::move(*s));
        }
        return out;
    }

private:
    RegimeClassifier classifier_;
    BarrierConfig barrier_cfg_;
    double threshold_;

    Signal make_signal(const SymbolSeries& series, const RegimeTag& tag,
                       double confidence) const {
        const auto& bar = series.bars.back();
        auto params = labeling::select_barrier_params(tag, barrier_cfg_);

        Signal s;
        s.symbol = series.symbol;
        s.timestamp = bar.timestamp;
        s.direction = backtest_util::predicted_direction(confidence);
        s.confidence = confidence;
        s.entry = bar.close;
        s.tp_mult = params.tp_mult;
        s.sl_mult = params.sl_mult;
        s.horizon = params.horizon;
        s.take_profit = bar.close + s.direction * params.tp_mult * bar.atr;
        s.stop_loss = bar.close - s.direction * params.sl_mult * bar.atr;
        s.regime = tag;
        return s;
    }
};
