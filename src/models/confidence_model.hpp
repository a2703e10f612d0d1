#pragma once

#include "labeling/label_engine.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

constexpr int REGIME_FEATURE_DIM = 12;

using FeatureVector = std::array<float, REGIME_FEATURE_DIM>;

// ---------------------------------------------------------------------------
// Regime feature vector - model input derived from a labeled row
// ---------------------------------------------------------------------------
inline std::vector<std::string> regime_feature_names() {
    return {
        "vol_ratio", "adx", "fast_slope", "slow_slope", "bb_width_atr",
        "consolidation_days", "market_state", "breakout", "vol_class",
        "trend_class", "close_position", "dist_sma_fast_atr",
    };
}

inline FeatureVector regime_features(const LabeledRow& row) {
    const auto& r = row.regime;
    const auto& b = row.bar;
    double range = b.high - b.low;
    double close_position = range > 0.0 ? (b.close - b.low) / range : 0.5;
    double dist_sma = b.atr > 0.0 ? (b.close - b.sma_fast) / b.atr : 0.0;

    return {
        static_cast<float>(r.vol_ratio),
        static_cast<float>(r.adx),
        static_cast<float>(r.fast_slope),
        static_cast<float>(r.slow_slope),
        static_cast<float>(r.bb_width_atr),
        static_cast<float>(r.consolidation_days),
        static_cast<float>(static_cast<int>(r.market_state)),
        static_cast<float>(r.breakout),
        static_cast<float>(static_cast<int>(r.vol_class)),
        static_cast<float>(static_cast<int>(r.trend_class)),
        static_cast<float>(close_position),
        static_cast<float>(dist_sma),
    };
}

// ---------------------------------------------------------------------------
// ConfidenceModel - given a feature vector, return the probability of long
// ---------------------------------------------------------------------------
class ConfidenceModel {
public:
    virtual ~ConfidenceModel() = default;

    virtual double predict_long_probability(const FeatureVector& features) = 0;

    // Batch scoring; backends with vectorized inference override this.
    virtual std::vector<double> predict_long_probability(
            const std::vector<FeatureVector>& features) {
        std::vector<double> out;
        out.reserve(features.size());
        for (const auto& f : features) out.push_back(predict_long_probability(f));
        return out;
    }
};

// ---------------------------------------------------------------------------
// ScoredRow - labeled row paired with its confidence-of-long
// ---------------------------------------------------------------------------
struct ScoredRow {
    LabeledRow row;
    double confidence = std::numeric_limits<double>::quiet_NaN();

    const std::string& symbol() const { return row.symbol; }
    uint64_t timestamp() const { return row.timestamp(); }
};

inline std::vector<ScoredRow> score_rows(const std::vector<LabeledRow>& rows,
                                         ConfidenceModel& model) {
    std::vector<FeatureVector> features;
    features.reserve(rows.size());
    for (const auto& row : rows) features.push_back(regime_features(row));

    auto probs = model.predict_long_probability(features);
    if (probs.size() != rows.size()) {
        throw std::runtime_error("Model returned " + std::to_string(probs.size()) +
                                 " scores for " + std::to_string(rows.size()) + " rows");
    }
    std::vector<ScoredRow> scored;
    scored.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        scored.push_back({rows[i], probs[i]});
    }
    return scored;
}

// ---------------------------------------------------------------------------
// ConfidenceTable - externally computed scores keyed by (symbol, timestamp)
// ---------------------------------------------------------------------------
class ConfidenceTable {
public:
    using Key = std::pair<std::string, uint64_t>;

    void set(const std::string& symbol, uint64_t timestamp, double confidence) {
        scores_[{symbol, timestamp}] = confidence;
    }

    std::optional<double> lookup(const std::string& symbol, uint64_t timestamp) const {
        auto it = scores_.find({symbol, timestamp});
        if (it == scores_.end()) return std::nullopt;
        return it->second;
    }

    size_t size() const { return scores_.size(); }

private:
    std::map<Key, double> scores_;
};

// Rows without a table entry carry NaN and are rejected by the simulator.
inline std::vector<ScoredRow> score_rows(const std::vector<LabeledRow>& rows,
                                         const ConfidenceTable& table) {
    std::vector<ScoredRow> scored;
    scored.reserve(rows.size());
    for (const auto& row : rows) {
        ScoredRow s{row};
        if (auto c = table.lookup(row.symbol, row.timestamp())) s.confidence = *c;
        scored.push_back(std::move(s));
    }
    return scored;
}
