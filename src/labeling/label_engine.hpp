#pragma once

#include "bars/price_bar.hpp"
#include "labeling/barrier_params.hpp"
#include "labeling/triple_barrier.hpp"
#include "regime/regime_classifier.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LabeledRow - origin bar enriched with its regime tag and Label
// ---------------------------------------------------------------------------
struct LabeledRow {
    std::string symbol;
    PriceBar bar;
    RegimeTag regime;
    Label label;

    uint64_t timestamp() const { return bar.timestamp; }
};

// ---------------------------------------------------------------------------
// LabelEngine - regime-conditioned triple-barrier labeling per symbol
// ---------------------------------------------------------------------------
class LabelEngine {
public:
    explicit LabelEngine(const BarrierConfig& cfg = {}) : cfg_(cfg) {}

    const BarrierConfig& config() const { return cfg_; }

    std::optional<Label> label_at(const SymbolSeries& series, int idx,
                                  const RegimeTag& tag) const {
        auto params = labeling::select_barrier_params(tag, cfg_);
        return labeling::compute_label(series, idx, params, cfg_);
    }

    // One row per origin bar that has a determinate regime and a full
    // forward window. `tags` must be aligned with `series.bars`.
    std::vector<LabeledRow> label_series(
            const SymbolSeries& series,
            const std::vector<std::optional<RegimeTag>>& tags) const {
        if (tags.size() != series.bars.size()) {
            throw std::invalid_argument("Regime tags not aligned with bars for " +
                                        series.symbol);
        }
        std::vector<LabeledRow> rows;
        for (int i = 0; i < series.size(); ++i) {
            if (!tags[i].has_value()) continue;
            auto label = label_at(series, i, *tags[i]);
            if (!label.has_value()) continue;

            LabeledRow row;
            row.symbol = series.symbol;
            row.bar = series.bars[i];
            row.regime = *tags[i];
            row.label = std::move(*label);
            rows.push_back(std::move(row));
        }
        return rows;
    }

private:
    BarrierConfig cfg_;
};

// ---------------------------------------------------------------------------
// Label statistics - outcome distribution per symbol
// ---------------------------------------------------------------------------
struct LabelStats {
    int total = 0;
    int long_wins = 0;
    int short_wins = 0;
    int neutral = 0;
    int ambiguous = 0;
    int expired = 0;

    float long_pct() const { return pct(long_wins); }
    float short_pct() const { return pct(short_wins); }
    float neutral_pct() const { return pct(neutral); }

private:
    float pct(int count) const {
        return total > 0 ? 100.0f * static_cast<float>(count) / static_cast<float>(total)
                         : 0.0f;
    }
};

namespace labeling {

inline void accumulate(LabelStats& stats, const Label& label) {
    stats.total++;
    switch (label.outcome) {
        case Outcome::LONG_WIN:  stats.long_wins++; break;
        case Outcome::SHORT_WIN: stats.short_wins++; break;
        case Outcome::NEUTRAL:   stats.neutral++; break;
    }
    if (label.ambiguous) stats.ambiguous++;
    if (label.expired) stats.expired++;
}

inline std::map<std::string, LabelStats> label_statistics(
        const std::vector<LabeledRow>& rows) {
    std::map<std::string, LabelStats> stats;
    for (const auto& row : rows) accumulate(stats[row.symbol], row.label);
    return stats;
}

inline LabelStats total_statistics(const std::vector<LabeledRow>& rows) {
    LabelStats stats{};
    for (const auto& row : rows) accumulate(stats, row.label);
    return stats;
}

}  // namespace labeling
