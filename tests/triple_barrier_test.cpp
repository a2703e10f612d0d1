// triple_barrier_test.cpp - Triple-barrier label computation on synthetic daily bars
//
// Covers the first-touch decision rule (SL wins same-bar ties per side),
// the both-sides-win fallback, expiry, horizon fit, and label invariants.

#include <gtest/gtest.h>

#include "labeling/barrier_params.hpp"
#include "labeling/triple_barrier.hpp"

#include "test_bar_helpers.hpp"

#include <limits>
#include <vector>

namespace {

using test_helpers::make_flat_series;

// Flat 20-bar series (ATR 1, closes 100, wicks ±0.1) with bar 5 spiking to 101.8.
SymbolSeries make_spike_series() {
    auto s = make_flat_series("SPY", 20);
    s.bars[5].high = 101.8;
    s.bars[5].low = 99.5;
    return s;
}

BarrierParams default_params() {
    return labeling::select_barrier_params(1.0, 15.0);
}

}  // namespace

// ===========================================================================
// 1. side_wins - first touch, stop wins ties
// ===========================================================================
class SideWinsTest : public ::testing::Test {};

TEST_F(SideWinsTest, TargetOnlyWins) {
    EXPECT_TRUE(labeling::side_wins(4, -1));
}

TEST_F(SideWinsTest, TargetBeforeStopWins) {
    EXPECT_TRUE(labeling::side_wins(3, 7));
}

TEST_F(SideWinsTest, SameBarCountsAsStop) {
    EXPECT_FALSE(labeling::side_wins(5, 5));
}

TEST_F(SideWinsTest, StopFirstLoses) {
    EXPECT_FALSE(labeling::side_wins(6, 2));
}

TEST_F(SideWinsTest, NoTargetLoses) {
    EXPECT_FALSE(labeling::side_wins(-1, -1));
    EXPECT_FALSE(labeling::side_wins(-1, 3));
}

// ===========================================================================
// 2. End-to-end scenarios on the spike series
// ===========================================================================
class TripleBarrierScenarioTest : public ::testing::Test {
protected:
    SymbolSeries series = make_spike_series();
};

TEST_F(TripleBarrierScenarioTest, DefaultRegimeParams) {
    auto p = default_params();
    EXPECT_DOUBLE_EQ(p.tp_mult, 1.8);
    EXPECT_DOUBLE_EQ(p.sl_mult, 1.0);
    EXPECT_EQ(p.horizon, 10);
}

TEST_F(TripleBarrierScenarioTest, LongTargetTouchedAtBarFive) {
    auto label = labeling::compute_label(series, 0, default_params());
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->outcome, Outcome::LONG_WIN);
    EXPECT_EQ(label->decided_idx, 5);
    EXPECT_EQ(label->exit_type, "long_target");
    EXPECT_DOUBLE_EQ(label->long_tp, 101.8);
    EXPECT_DOUBLE_EQ(label->long_sl, 99.0);
    EXPECT_EQ(label->long_tp_idx, 5);
    EXPECT_EQ(label->long_sl_idx, -1);
    EXPECT_FALSE(label->expired);
    EXPECT_FALSE(label->ambiguous);
}

TEST_F(TripleBarrierScenarioTest, EarlierLongStopMakesNeutral) {
    series.bars[3].low = 98.9;
    auto label = labeling::compute_label(series, 0, default_params());
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->long_sl_idx, 3);
    EXPECT_EQ(label->short_tp_idx, -1);
    EXPECT_EQ(label->outcome, Outcome::NEUTRAL);
    EXPECT_TRUE(label->expired);
    EXPECT_EQ(label->exit_type, "neither");
    EXPECT_EQ(label->decided_idx, 10);
}

TEST_F(TripleBarrierScenarioTest, EarlierShortTargetMakesShortWin) {
    series.bars[3].low = 98.2;
    auto label = labeling::compute_label(series, 0, default_params());
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->short_tp_idx, 3);
    EXPECT_EQ(label->short_sl_idx, 5);
    EXPECT_EQ(label->outcome, Outcome::SHORT_WIN);
    EXPECT_EQ(label->decided_idx, 3);
    EXPECT_EQ(label->exit_type, "short_target");
}

TEST_F(TripleBarrierScenarioTest, TargetAndStopInSameBarIsStop) {
    // Bar 2 spans both long barriers.
    series.bars[2].high = 102.0;
    series.bars[2].low = 98.9;
    auto label = labeling::compute_label(series, 0, default_params());
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->long_tp_idx, 2);
    EXPECT_EQ(label->long_sl_idx, 2);
    EXPECT_NE(label->outcome, Outcome::LONG_WIN);
}

TEST_F(TripleBarrierScenarioTest, SpikeOutsideHorizonIgnored) {
    auto label = labeling::compute_label(series, 0, BarrierParams{1.8, 1.0, 4, false});
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->outcome, Outcome::NEUTRAL);
    EXPECT_EQ(label->decided_idx, 4);
}

TEST_F(TripleBarrierScenarioTest, BarsAfterHorizonNotRead) {
    auto before = labeling::compute_label(series, 0, BarrierParams{1.8, 1.0, 4, false});
    series.bars[6].low = 90.0;
    series.bars[6].high = 110.0;
    auto after = labeling::compute_label(series, 0, BarrierParams{1.8, 1.0, 4, false});
    ASSERT_TRUE(before.has_value());
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(before->outcome, after->outcome);
    EXPECT_EQ(before->decided_idx, after->decided_idx);
}

// ===========================================================================
// 3. Both sides win - tp_mult below sl_mult lets both targets land first
// ===========================================================================
class TripleBarrierAmbiguousTest : public ::testing::Test {};

TEST_F(TripleBarrierAmbiguousTest, BothSidesWinIsNeutral) {
    auto s = make_flat_series("QQQ", 15);
    // tp 0.5, sl 2.0: bar 2 reaches 100.5, bar 3 reaches 99.5, no stop touched.
    s.bars[2].high = 100.6;
    s.bars[3].low = 99.4;
    BarrierParams p{0.5, 2.0, 10, false};
    auto label = labeling::compute_label(s, 0, p);
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->outcome, Outcome::NEUTRAL);
    EXPECT_TRUE(label->ambiguous);
    EXPECT_FALSE(label->expired);
    EXPECT_EQ(label->exit_type, "ambiguous");
    EXPECT_EQ(label->decided_idx, 3);
}

// ===========================================================================
// 4. Horizon fit and missing inputs
// ===========================================================================
class TripleBarrierWindowTest : public ::testing::Test {};

TEST_F(TripleBarrierWindowTest, NoLabelWhenWindowDoesNotFit) {
    auto s = make_flat_series("SPY", 20);
    EXPECT_TRUE(labeling::compute_label(s, 9, default_params()).has_value());
    EXPECT_FALSE(labeling::compute_label(s, 10, default_params()).has_value());
    EXPECT_FALSE(labeling::compute_label(s, 19, default_params()).has_value());
}

TEST_F(TripleBarrierWindowTest, NoLabelWithoutAtr) {
    auto s = make_flat_series("SPY", 20);
    s.bars[0].atr = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(labeling::compute_label(s, 0, default_params()).has_value());
    s.bars[0].atr = 0.0;
    EXPECT_FALSE(labeling::compute_label(s, 0, default_params()).has_value());
}

TEST_F(TripleBarrierWindowTest, OutOfRangeOriginRejected) {
    auto s = make_flat_series("SPY", 20);
    EXPECT_FALSE(labeling::compute_label(s, -1, default_params()).has_value());
    EXPECT_FALSE(labeling::compute_label(s, 20, default_params()).has_value());
}

TEST_F(TripleBarrierWindowTest, ExtendedHorizonCappedToAvailableBars) {
    auto s = make_flat_series("SPY", 25);
    auto p = labeling::select_barrier_params(0.5, 10.0);
    ASSERT_TRUE(p.extended);
    ASSERT_EQ(p.horizon, 13);

    auto full = labeling::compute_label(s, 5, p);
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->horizon, 13);

    auto capped = labeling::compute_label(s, 12, p);   // 12 bars remain
    ASSERT_TRUE(capped.has_value());
    EXPECT_EQ(capped->horizon, 12);

    EXPECT_FALSE(labeling::compute_label(s, 15, p).has_value());  // 9 remain
}

// ===========================================================================
// 5. Invariants over a noisy series
// ===========================================================================
class TripleBarrierInvariantTest : public ::testing::Test {};

TEST_F(TripleBarrierInvariantTest, DecidedWithinHorizonAndSeries) {
    auto s = test_helpers::make_wave_series("IWM", 120, 100.0, 0.02, 2.0, 7);
    for (auto& b : s.bars) b.atr = 1.0;

    const std::vector<BarrierParams> grid = {
        {1.8, 1.0, 10, false}, {2.5, 1.0, 10, false}, {1.5, 1.0, 13, true},
        {1.8, 1.0, 5, false}, {0.5, 2.0, 10, false},
    };
    int produced = 0;
    for (const auto& p : grid) {
        for (int i = 0; i < s.size(); ++i) {
            auto label = labeling::compute_label(s, i, p);
            if (!label) continue;
            ++produced;
            int o = to_int(label->outcome);
            EXPECT_TRUE(o == -1 || o == 0 || o == 1);
            EXPECT_GT(label->decided_idx, i);
            EXPECT_LE(label->decided_idx, i + label->horizon);
            EXPECT_LE(i + label->horizon, s.size() - 1);
            if (label->outcome == Outcome::NEUTRAL) {
                EXPECT_TRUE(label->expired || label->ambiguous);
            }
        }
    }
    EXPECT_GT(produced, 0);
}

TEST_F(TripleBarrierInvariantTest, OutcomeStrings) {
    EXPECT_EQ(to_string(Outcome::LONG_WIN), "long_win");
    EXPECT_EQ(to_string(Outcome::SHORT_WIN), "short_win");
    EXPECT_EQ(to_string(Outcome::NEUTRAL), "neutral");
    EXPECT_EQ(to_int(Outcome::SHORT_WIN), -1);
}
