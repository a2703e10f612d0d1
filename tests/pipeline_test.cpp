// pipeline_test.cpp - Validate → indicators → regime → label across a symbol universe

#include <gtest/gtest.h>

#include "io/result_io.hpp"
#include "pipeline.hpp"

#include "test_bar_helpers.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::vector<SymbolSeries> make_universe() {
    return {
        test_helpers::make_wave_series("AAA", 150, 100.0, 0.05, 1.5, 9),
        test_helpers::make_wave_series("BBB", 150, 50.0, -0.03, 0.8, 11),
        test_helpers::make_wave_series("CCC", 120, 200.0, 0.20, 3.0, 7),
    };
}

std::string labels_csv(const LabelingResult& result) {
    std::ostringstream ss;
    backtest_io::write_labels_csv(ss, result.all_rows());
    return ss.str();
}

}  // namespace

class LabelPipelineTest : public ::testing::Test {
protected:
    std::vector<SymbolSeries> universe = make_universe();
};

TEST_F(LabelPipelineTest, LabelsEverySymbol) {
    LabelPipeline pipeline;
    auto result = pipeline.run(universe);
    ASSERT_EQ(result.by_symbol.size(), 3u);
    for (const auto& [symbol, labels] : result.by_symbol) {
        EXPECT_EQ(labels.symbol, symbol);
        EXPECT_FALSE(labels.rows.empty()) << symbol;
        EXPECT_EQ(labels.indeterminate_count + labels.no_label_count +
                      static_cast<int>(labels.rows.size()),
                  labels.bar_count);
        // ATR needs 14 bars and the regime needs 60 bars of ATR.
        EXPECT_GE(labels.indeterminate_count, 72);
        EXPECT_GE(labels.no_label_count, 10);
    }
}

TEST_F(LabelPipelineTest, RowsInBarOrderWithinSymbol) {
    LabelPipeline pipeline;
    auto result = pipeline.run(universe);
    for (const auto& [symbol, labels] : result.by_symbol) {
        for (size_t i = 1; i < labels.rows.size(); ++i) {
            EXPECT_LT(labels.rows[i - 1].timestamp(), labels.rows[i].timestamp());
        }
    }
}

TEST_F(LabelPipelineTest, DeterministicOutput) {
    LabelPipeline pipeline;
    EXPECT_EQ(labels_csv(pipeline.run(universe)), labels_csv(pipeline.run(universe)));
}

TEST_F(LabelPipelineTest, ParallelMatchesSequential) {
    PipelineConfig par_cfg;
    par_cfg.parallel = true;
    LabelPipeline sequential;
    LabelPipeline parallel(par_cfg);
    EXPECT_EQ(labels_csv(sequential.run(universe)), labels_csv(parallel.run(universe)));
}

TEST_F(LabelPipelineTest, SymbolOrderDoesNotMatter) {
    LabelPipeline pipeline;
    auto reversed = universe;
    std::reverse(reversed.begin(), reversed.end());
    EXPECT_EQ(labels_csv(pipeline.run(universe)), labels_csv(pipeline.run(reversed)));
}

TEST_F(LabelPipelineTest, DuplicateTimestampFailsBeforeLabeling) {
    universe[2].bars[50].timestamp = universe[2].bars[49].timestamp;
    LabelPipeline pipeline;
    EXPECT_THROW(pipeline.run(universe), std::invalid_argument);
}

TEST_F(LabelPipelineTest, DecreasingTimestampRejected) {
    std::swap(universe[0].bars[10], universe[0].bars[11]);
    LabelPipeline pipeline;
    EXPECT_THROW(pipeline.run(universe), std::invalid_argument);
}

TEST_F(LabelPipelineTest, DuplicateSymbolRejected) {
    universe[1].symbol = "AAA";
    LabelPipeline pipeline;
    EXPECT_THROW(pipeline.run(universe), std::invalid_argument);
}

TEST_F(LabelPipelineTest, BadOhlcRejected) {
    universe[0].bars[3].high = universe[0].bars[3].low - 1.0;
    EXPECT_THROW(validate_series(universe[0]), std::invalid_argument);
}

TEST_F(LabelPipelineTest, WithoutIndicatorFillEverythingIsIndeterminate) {
    PipelineConfig cfg;
    cfg.fill_indicators = false;
    LabelPipeline pipeline(cfg);
    auto labels = pipeline.run_symbol(universe[0]);
    EXPECT_TRUE(labels.rows.empty());
    EXPECT_EQ(labels.indeterminate_count, labels.bar_count);
}

TEST_F(LabelPipelineTest, LabelsRespectHorizonInvariant) {
    LabelPipeline pipeline;
    auto result = pipeline.run(universe);
    for (const auto& [symbol, labels] : result.by_symbol) {
        for (const auto& row : labels.rows) {
            const auto& l = row.label;
            EXPECT_LE(l.decided_idx, l.origin_idx + l.horizon);
            EXPECT_LT(l.origin_idx + l.horizon, labels.bar_count);
        }
    }
}
