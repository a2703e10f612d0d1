#pragma once

#include "bars/price_bar.hpp"
#include "features/indicators.hpp"
#include "labeling/label_engine.hpp"
#include "regime/regime_classifier.hpp"

#include <future>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PipelineConfig - immutable configuration of the labeling stages
// ---------------------------------------------------------------------------
struct PipelineConfig {
    IndicatorConfig indicators;
    RegimeConfig regime;
    BarrierConfig barrier;
    bool fill_indicators = true;  // compute indicator columns the input lacks
    bool parallel = false;        // one task per symbol
};

// ---------------------------------------------------------------------------
// SymbolLabels - labeling output and bookkeeping for one symbol
// ---------------------------------------------------------------------------
struct SymbolLabels {
    std::string symbol;
    std::vector<LabeledRow> rows;
    int bar_count = 0;
    int indeterminate_count = 0;  // excluded: regime history too short
    int no_label_count = 0;       // excluded: forward window does not fit
};

struct LabelingResult {
    std::map<std::string, SymbolLabels> by_symbol;

    // Rows of every symbol, symbol-major, each symbol in bar order.
    std::vector<LabeledRow> all_rows() const {
        std::vector<LabeledRow> out;
        for (const auto& [symbol, labels] : by_symbol) {
            out.insert(out.end(), labels.rows.begin(), labels.rows.end());
        }
        return out;
    }
};

// ---------------------------------------------------------------------------
// LabelPipeline - validate → regime → label, per symbol
// ---------------------------------------------------------------------------
class LabelPipeline {
public:
    explicit LabelPipeline(const PipelineConfig& cfg = {}) : cfg_(cfg) {}

    const PipelineConfig& config() const { return cfg_; }

    SymbolLabels run_symbol(SymbolSeries series) const {
        validate_series(series);
        if (cfg_.fill_indicators) indicators::fill_missing(series, cfg_.indicators);

        RegimeClassifier classifier(cfg_.regime);
        LabelEngine engine(cfg_.barrier);

        auto tags = classifier.classify_series(series);

        SymbolLabels out;
        out.symbol = series.symbol;
        out.bar_count = series.size();
        for (const auto& t : tags) {
            if (!t.has_value()) out.indeterminate_count++;
        }
        out.rows = engine.label_series(series, tags);
        out.no_label_count = out.bar_count - out.indeterminate_count -
                             static_cast<int>(out.rows.size());
        return out;
    }

    // Every series is validated before any labeling starts. Symbols are
    // independent; results are keyed by symbol so the assembly order does
    // not depend on task completion order.
    LabelingResult run(const std::vector<SymbolSeries>& universe) const {
        validate_universe(universe);

        LabelingResult result;
        if (cfg_.parallel && universe.size() > 1) {
            std::vector<std::future<SymbolLabels>> tasks;
            tasks.reserve(universe.size());
            for (const auto& series : universe) {
                tasks.push_back(std::async(std::launch::async,
                    [this, &series]() { return run_symbol(series); }));
            }
            for (auto& task : tasks) {
                auto labels = task.get();
                std::string symbol = labels.symbol;
                result.by_symbol.emplace(std::move(symbol), std::move(labels));
            }
        } else {
            for (const auto& series : universe) {
                auto labels = run_symbol(series);
                std::string symbol = labels.symbol;
                result.by_symbol.emplace(std::move(symbol), std::move(labels));
            }
        }
        return result;
    }

private:
    PipelineConfig cfg_;
};
