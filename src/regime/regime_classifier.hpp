#pragma once

#include "bars/price_bar.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RegimeConfig - thresholds and look-backs of the regime classifier
// ---------------------------------------------------------------------------
struct RegimeConfig {
    int atr_mean_window = 60;

    double low_vol_ratio = 0.8;      // below → LOW
    double high_vol_ratio = 1.2;     // above → HIGH
    double extreme_vol_ratio = 1.5;  // above → EXTREME

    double weak_trend_adx = 20.0;
    double strong_trend_adx = 30.0;
    double very_strong_trend_adx = 40.0;

    int fast_slope_lag = 5;
    int slow_slope_lag = 10;

    int envelope_window = 20;
    double trending_adx = 25.0;
    double squeeze_bb_atr = 4.0;
    int min_consolidation_days = 5;

    // Bars of trailing history (current bar included) a tag needs.
    int required_history() const {
        int need = atr_mean_window;
        need = std::max(need, envelope_window + 1);
        need = std::max(need, fast_slope_lag + 1);
        need = std::max(need, slow_slope_lag + 1);
        return need;
    }
};

namespace regime {

enum class VolClass { LOW, MID, HIGH, EXTREME };
enum class TrendClass { NONE, WEAK, STRONG, VERY_STRONG };
enum class MarketState { RANGING, TRENDING, BREAKOUT, CONSOLIDATING };

inline VolClass classify_volatility(double vol_ratio, const RegimeConfig& cfg = {}) {
    if (vol_ratio < cfg.low_vol_ratio) return VolClass::LOW;
    if (vol_ratio <= cfg.high_vol_ratio) return VolClass::MID;
    if (vol_ratio <= cfg.extreme_vol_ratio) return VolClass::HIGH;
    return VolClass::EXTREME;
}

inline TrendClass classify_trend(double adx, const RegimeConfig& cfg = {}) {
    if (adx < cfg.weak_trend_adx) return TrendClass::NONE;
    if (adx < cfg.strong_trend_adx) return TrendClass::WEAK;
    if (adx < cfg.very_strong_trend_adx) return TrendClass::STRONG;
    return TrendClass::VERY_STRONG;
}

inline int sign_of(double x) {
    if (x > 0.0) return 1;
    if (x < 0.0) return -1;
    return 0;
}

inline std::string to_string(VolClass v) {
    switch (v) {
        case VolClass::LOW:     return "low";
        case VolClass::MID:     return "mid";
        case VolClass::HIGH:    return "high";
        case VolClass::EXTREME: return "extreme";
    }
    return "unknown";
}

inline std::string to_string(TrendClass t) {
    switch (t) {
        case TrendClass::NONE:        return "none";
        case TrendClass::WEAK:        return "weak";
        case TrendClass::STRONG:      return "strong";
        case TrendClass::VERY_STRONG: return "very_strong";
    }
    return "unknown";
}

inline std::string to_string(MarketState s) {
    switch (s) {
        case MarketState::RANGING:       return "ranging";
        case MarketState::TRENDING:      return "trending";
        case MarketState::BREAKOUT:      return "breakout";
        case MarketState::CONSOLIDATING: return "consolidating";
    }
    return "unknown";
}

}  // namespace regime

// ---------------------------------------------------------------------------
// RegimeTag - volatility/trend regime of one bar
// ---------------------------------------------------------------------------
struct RegimeTag {
    double vol_ratio = 1.0;
    regime::VolClass vol_class = regime::VolClass::MID;

    double adx = 0.0;
    regime::TrendClass trend_class = regime::TrendClass::NONE;

    // SMA slopes over their look-back, in ATR units
    double fast_slope = 0.0;
    double slow_slope = 0.0;
    int fast_slope_sign = 0;
    int slow_slope_sign = 0;

    double bb_width_atr = 0.0;
    int breakout = 0;  // +1 above envelope, -1 below, 0 inside
    regime::MarketState market_state = regime::MarketState::RANGING;
    int consolidation_days = 0;
};

// ---------------------------------------------------------------------------
// RegimeClassifier - derives RegimeTags from a bar's trailing history
// ---------------------------------------------------------------------------
class RegimeClassifier {
public:
    explicit RegimeClassifier(const RegimeConfig& cfg = {}) : cfg_(cfg) {}

    const RegimeConfig& config() const { return cfg_; }

    // Breakout direction of bar `idx` against the close envelope of the
    // `envelope_window` bars before it. 0 when the envelope is not yet defined.
    int breakout_at(const SymbolSeries& series, int idx) const {
        int w = cfg_.envelope_window;
        if (idx < w || w <= 0) return 0;
        double hi = series.bars[idx - w].close;
        double lo = hi;
        for (int j = idx - w + 1; j < idx; ++j) {
            hi = std::max(hi, series.bars[j].close);
            lo = std::min(lo, series.bars[j].close);
        }
        double c = series.bars[idx].close;
        if (c > hi) return 1;
        if (c < lo) return -1;
        return 0;
    }

    // Running consolidation counter after bar `idx`, given the counter after
    // the previous bar.
    int next_consolidation_days(const SymbolSeries& series, int idx, int prev_days) const {
        if (idx < cfg_.envelope_window) return 0;
        return breakout_at(series, idx) != 0 ? 0 : prev_days + 1;
    }

    // Tag for bar `idx` given the consolidation counter already advanced to
    // this bar. Returns nullopt (indeterminate) when the trailing history is
    // too short or any indicator in it is missing.
    std::optional<RegimeTag> classify(const SymbolSeries& series, int idx,
                                      int consolidation_days) const {
        if (idx < 0 || idx >= series.size()) return std::nullopt;
        if (idx + 1 < cfg_.required_history()) return std::nullopt;

        const auto& bar = series.bars[idx];
        if (!std::isfinite(bar.atr) || bar.atr <= 0.0 || !std::isfinite(bar.adx) ||
            !std::isfinite(bar.sma_fast) || !std::isfinite(bar.sma_slow) ||
            !std::isfinite(bar.bb_width)) {
            return std::nullopt;
        }

        double atr_sum = 0.0;
        for (int j = idx - cfg_.atr_mean_window + 1; j <= idx; ++j) {
            double a = series.bars[j].atr;
            if (!std::isfinite(a)) return std::nullopt;
            atr_sum += a;
        }
        double atr_mean = atr_sum / static_cast<double>(cfg_.atr_mean_window);
        if (atr_mean <= 0.0) return std::nullopt;

        double fast_prev = series.bars[idx - cfg_.fast_slope_lag].sma_fast;
        double slow_prev = series.bars[idx - cfg_.slow_slope_lag].sma_slow;
        if (!std::isfinite(fast_prev) || !std::isfinite(slow_prev)) return std::nullopt;

        RegimeTag tag{};
        tag.vol_ratio = bar.atr / atr_mean;
        tag.vol_class = regime::classify_volatility(tag.vol_ratio, cfg_);
        tag.adx = bar.adx;
        tag.trend_class = regime::classify_trend(bar.adx, cfg_);
        tag.fast_slope = (bar.sma_fast - fast_prev) / bar.atr;
        tag.slow_slope = (bar.sma_slow - slow_prev) / bar.atr;
        tag.fast_slope_sign = regime::sign_of(tag.fast_slope);
        tag.slow_slope_sign = regime::sign_of(tag.slow_slope);
        tag.bb_width_atr = bar.bb_width / bar.atr;
        tag.breakout = breakout_at(series, idx);
        tag.consolidation_days = consolidation_days;
        tag.market_state = market_state(tag);
        return tag;
    }

    // Tags for every bar of a series, threading the consolidation counter
    // forward in time. Element i only depends on bars [0, i].
    std::vector<std::optional<RegimeTag>> classify_series(const SymbolSeries& series) const {
        std::vector<std::optional<RegimeTag>> tags;
        tags.reserve(series.bars.size());
        int days = 0;
        for (int i = 0; i < series.size(); ++i) {
            days = next_consolidation_days(series, i, days);
            tags.push_back(classify(series, i, days));
        }
        return tags;
    }

private:
    RegimeConfig cfg_;

    regime::MarketState market_state(const RegimeTag& tag) const {
        if (tag.breakout != 0) return regime::MarketState::BREAKOUT;
        if (tag.adx > cfg_.trending_adx) return regime::MarketState::TRENDING;
        if (tag.consolidation_days >= cfg_.min_consolidation_days &&
            (tag.bb_width_atr <= cfg_.squeeze_bb_atr ||
             tag.vol_class == regime::VolClass::LOW)) {
            return regime::MarketState::CONSOLIDATING;
        }
        return regime::MarketState::RANGING;
    }
};
