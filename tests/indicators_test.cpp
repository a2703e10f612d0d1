// indicators_test.cpp - Rolling ATR/ADX/SMA/Bollinger inputs of the regime classifier

#include <gtest/gtest.h>

#include "features/indicators.hpp"

#include "test_bar_helpers.hpp"

#include <cmath>
#include <vector>

// ===========================================================================
// 1. Rolling primitives
// ===========================================================================
class RollingTest : public ::testing::Test {};

TEST_F(RollingTest, MeanNaNUntilWindowFilled) {
    auto m = indicators::rolling_mean({1.0, 2.0, 3.0, 4.0}, 2);
    ASSERT_EQ(m.size(), 4u);
    EXPECT_TRUE(std::isnan(m[0]));
    EXPECT_DOUBLE_EQ(m[1], 1.5);
    EXPECT_DOUBLE_EQ(m[2], 2.5);
    EXPECT_DOUBLE_EQ(m[3], 3.5);
}

TEST_F(RollingTest, MeanSkipsWindowsContainingNaN) {
    auto m = indicators::rolling_mean({1.0, indicators::NaN, 3.0, 4.0, 5.0}, 2);
    EXPECT_TRUE(std::isnan(m[1]));
    EXPECT_TRUE(std::isnan(m[2]));
    EXPECT_DOUBLE_EQ(m[3], 3.5);
    EXPECT_DOUBLE_EQ(m[4], 4.5);
}

TEST_F(RollingTest, SampleStd) {
    auto s = indicators::rolling_std({1.0, 2.0, 3.0, 4.0}, 2);
    EXPECT_TRUE(std::isnan(s[0]));
    EXPECT_NEAR(s[1], std::sqrt(0.5), 1e-12);
    auto s3 = indicators::rolling_std({2.0, 4.0, 6.0}, 3);
    EXPECT_NEAR(s3[2], 2.0, 1e-12);
}

// ===========================================================================
// 2. True range and ATR
// ===========================================================================
class AtrTest : public ::testing::Test {};

TEST_F(AtrTest, TrueRangeIncludesGap) {
    std::vector<PriceBar> bars(2);
    bars[0].high = 101.0; bars[0].low = 99.0; bars[0].close = 100.0;
    bars[1].high = 103.0; bars[1].low = 102.0; bars[1].close = 102.5;
    auto tr = indicators::true_range(bars);
    EXPECT_DOUBLE_EQ(tr[0], 2.0);
    EXPECT_DOUBLE_EQ(tr[1], 3.0);
}

TEST_F(AtrTest, ConstantRangeGivesConstantAtr) {
    auto s = test_helpers::make_raw_path("SPY", 100.0, std::vector<double>(30, 0.0), 1.0);
    auto a = indicators::atr(s.bars, 14);
    EXPECT_TRUE(std::isnan(a[12]));
    EXPECT_DOUBLE_EQ(a[13], 1.0);
    EXPECT_DOUBLE_EQ(a[29], 1.0);
}

// ===========================================================================
// 3. ADX
// ===========================================================================
class AdxTest : public ::testing::Test {};

TEST_F(AdxTest, SteadyUptrendIsStrong) {
    auto s = test_helpers::make_raw_path("SPY", 100.0, std::vector<double>(50, 1.0), 1.0);
    auto a = indicators::atr(s.bars, 14);
    auto x = indicators::adx(s.bars, a, 14);
    EXPECT_TRUE(std::isnan(x[20]));
    ASSERT_FALSE(std::isnan(x[40]));
    EXPECT_GT(x[40], 90.0);
}

TEST_F(AdxTest, FlatSeriesHasNoTrend) {
    auto s = test_helpers::make_raw_path("SPY", 100.0, std::vector<double>(50, 0.0), 1.0);
    auto a = indicators::atr(s.bars, 14);
    auto x = indicators::adx(s.bars, a, 14);
    EXPECT_NEAR(x[45], 0.0, 1e-9);
}

// ===========================================================================
// 4. fill_missing
// ===========================================================================
class FillMissingTest : public ::testing::Test {};

TEST_F(FillMissingTest, ComputesAbsentColumns) {
    auto s = test_helpers::make_wave_series("SPY", 80);
    indicators::fill_missing(s);

    EXPECT_TRUE(std::isnan(s.bars[12].atr));
    EXPECT_FALSE(std::isnan(s.bars[13].atr));
    EXPECT_TRUE(std::isnan(s.bars[18].sma_fast));
    EXPECT_FALSE(std::isnan(s.bars[19].sma_fast));
    EXPECT_TRUE(std::isnan(s.bars[48].sma_slow));
    EXPECT_FALSE(std::isnan(s.bars[49].sma_slow));
    EXPECT_FALSE(std::isnan(s.bars[19].bb_width));
    EXPECT_FALSE(std::isnan(s.bars[79].adx));

    double sum = 0.0;
    for (int i = 60; i < 80; ++i) sum += s.bars[i].close;
    EXPECT_NEAR(s.bars[79].sma_fast, sum / 20.0, 1e-9);
    EXPECT_GT(s.bars[79].bb_width, 0.0);
}

TEST_F(FillMissingTest, KeepsSuppliedColumns) {
    auto s = test_helpers::make_flat_series("SPY", 60);
    s.bars[55].sma_slow = indicators::NaN;
    indicators::fill_missing(s);

    EXPECT_DOUBLE_EQ(s.bars[55].atr, 1.0);
    EXPECT_DOUBLE_EQ(s.bars[55].adx, 15.0);
    EXPECT_DOUBLE_EQ(s.bars[55].bb_width, 2.0);
    EXPECT_DOUBLE_EQ(s.bars[55].sma_slow, 100.0);
}

TEST_F(FillMissingTest, EmptySeriesIsNoop) {
    SymbolSeries s;
    s.symbol = "SPY";
    indicators::fill_missing(s);
    EXPECT_TRUE(s.bars.empty());
}
