// label_engine_test.cpp - Regime-conditioned labeling of a symbol series and label statistics

#include <gtest/gtest.h>

#include "labeling/label_engine.hpp"

#include "test_bar_helpers.hpp"

#include <optional>
#include <stdexcept>
#include <vector>

namespace {

using test_helpers::make_flat_series;

RegimeTag make_tag(double vol_ratio, double adx) {
    RegimeTag tag;
    tag.vol_ratio = vol_ratio;
    tag.adx = adx;
    tag.vol_class = regime::classify_volatility(vol_ratio);
    tag.trend_class = regime::classify_trend(adx);
    return tag;
}

}  // namespace

// ===========================================================================
// 1. label_at - parameters follow the regime
// ===========================================================================
class LabelEngineTest : public ::testing::Test {
protected:
    LabelEngine engine;
    SymbolSeries series = make_flat_series("SPY", 40);
};

TEST_F(LabelEngineTest, DefaultRegimeUsesDefaultBarriers) {
    series.bars[5].high = 101.8;
    auto label = engine.label_at(series, 0, make_tag(1.0, 15.0));
    ASSERT_TRUE(label.has_value());
    EXPECT_DOUBLE_EQ(label->tp_mult, 1.8);
    EXPECT_EQ(label->horizon, 10);
    EXPECT_EQ(label->outcome, Outcome::LONG_WIN);
    EXPECT_EQ(label->decided_idx, 5);
}

TEST_F(LabelEngineTest, TrendRegimeNeedsWiderMove) {
    series.bars[5].high = 101.8;
    auto label = engine.label_at(series, 0, make_tag(1.0, 35.0));
    ASSERT_TRUE(label.has_value());
    EXPECT_DOUBLE_EQ(label->tp_mult, 2.5);
    EXPECT_EQ(label->outcome, Outcome::NEUTRAL);   // 101.8 < 102.5
}

TEST_F(LabelEngineTest, LowVolRegimeUsesNarrowTargetLongHorizon) {
    series.bars[12].high = 101.6;
    auto label = engine.label_at(series, 0, make_tag(0.6, 10.0));
    ASSERT_TRUE(label.has_value());
    EXPECT_DOUBLE_EQ(label->tp_mult, 1.5);
    EXPECT_EQ(label->horizon, 13);
    EXPECT_EQ(label->outcome, Outcome::LONG_WIN);
    EXPECT_EQ(label->decided_idx, 12);
}

TEST_F(LabelEngineTest, ExtremeVolRegimeShortensHorizon) {
    series.bars[7].high = 101.8;
    auto label = engine.label_at(series, 0, make_tag(1.8, 10.0));
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->horizon, 5);
    EXPECT_EQ(label->outcome, Outcome::NEUTRAL);
    EXPECT_EQ(label->decided_idx, 5);
}

// ===========================================================================
// 2. label_series - filtering and alignment
// ===========================================================================
TEST_F(LabelEngineTest, SkipsIndeterminateAndShortWindows) {
    std::vector<std::optional<RegimeTag>> tags(series.bars.size());
    for (int i = 10; i < series.size(); ++i) tags[i] = make_tag(1.0, 15.0);

    auto rows = engine.label_series(series, tags);
    // Origins 10..29 have a full 10-bar window in 40 bars.
    ASSERT_EQ(rows.size(), 20u);
    EXPECT_EQ(rows.front().label.origin_idx, 10);
    EXPECT_EQ(rows.back().label.origin_idx, 29);
    for (const auto& r : rows) {
        EXPECT_EQ(r.symbol, "SPY");
        EXPECT_EQ(r.timestamp(), series.bars[r.label.origin_idx].timestamp);
        EXPECT_EQ(r.label.origin_ts, r.timestamp());
    }
}

TEST_F(LabelEngineTest, MisalignedTagsRejected) {
    std::vector<std::optional<RegimeTag>> tags(series.bars.size() - 1);
    EXPECT_THROW(engine.label_series(series, tags), std::invalid_argument);
}

TEST_F(LabelEngineTest, CustomHorizonConfig) {
    BarrierConfig cfg;
    cfg.max_horizon = 5;
    LabelEngine short_engine(cfg);
    std::vector<std::optional<RegimeTag>> tags(series.bars.size(), make_tag(1.0, 15.0));
    auto rows = short_engine.label_series(series, tags);
    EXPECT_EQ(rows.size(), 35u);
    EXPECT_EQ(rows.front().label.horizon, 5);
}

// ===========================================================================
// 3. Label statistics
// ===========================================================================
class LabelStatsTest : public ::testing::Test {};

TEST_F(LabelStatsTest, CountsPerSymbolAndTotal) {
    std::vector<LabeledRow> rows = {
        test_helpers::make_row("AAA", 0, Outcome::LONG_WIN),
        test_helpers::make_row("AAA", 1, Outcome::LONG_WIN),
        test_helpers::make_row("AAA", 2, Outcome::SHORT_WIN),
        test_helpers::make_row("AAA", 3, Outcome::NEUTRAL),
        test_helpers::make_row("BBB", 0, Outcome::NEUTRAL),
    };
    rows[4].label.expired = false;
    rows[4].label.ambiguous = true;

    auto per = labeling::label_statistics(rows);
    ASSERT_EQ(per.size(), 2u);
    EXPECT_EQ(per["AAA"].total, 4);
    EXPECT_EQ(per["AAA"].long_wins, 2);
    EXPECT_EQ(per["AAA"].short_wins, 1);
    EXPECT_EQ(per["AAA"].neutral, 1);
    EXPECT_FLOAT_EQ(per["AAA"].long_pct(), 50.0f);
    EXPECT_EQ(per["BBB"].ambiguous, 1);

    auto total = labeling::total_statistics(rows);
    EXPECT_EQ(total.total, 5);
    EXPECT_EQ(total.neutral, 2);
    EXPECT_EQ(total.expired, 1);
    EXPECT_EQ(total.ambiguous, 1);
    EXPECT_FLOAT_EQ(total.neutral_pct(), 40.0f);
}

TEST_F(LabelStatsTest, EmptyHasZeroPercentages) {
    auto total = labeling::total_statistics({});
    EXPECT_EQ(total.total, 0);
    EXPECT_FLOAT_EQ(total.long_pct(), 0.0f);
}
