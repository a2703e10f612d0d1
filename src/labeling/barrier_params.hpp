#pragma once

#include "regime/regime_classifier.hpp"

#include <algorithm>
#include <cmath>

// ---------------------------------------------------------------------------
// BarrierConfig - ATR-multiple barriers and horizon bounds
// ---------------------------------------------------------------------------
struct BarrierConfig {
    int min_horizon = 3;
    int max_horizon = 10;

    double base_tp_mult = 1.8;
    double trend_tp_mult = 2.5;
    double low_vol_tp_mult = 1.5;
    double sl_mult = 1.0;

    double extreme_horizon_factor = 0.5;
    double low_vol_horizon_factor = 1.3;
};

// ---------------------------------------------------------------------------
// BarrierParams - multiples and horizon chosen for one origin bar
// ---------------------------------------------------------------------------
struct BarrierParams {
    double tp_mult = 1.8;
    double sl_mult = 1.0;
    int horizon = 10;
    bool extended = false;  // low-vol extension; may be capped by the data

    bool operator==(const BarrierParams&) const = default;
};

namespace labeling {

// Regime-conditioned parameter selection. The class boundaries belong to
// RegimeConfig; this table only maps classes to multiples and horizons.
inline BarrierParams select_barrier_params(regime::VolClass vol, regime::TrendClass trend,
                                           const BarrierConfig& cfg = {}) {
    BarrierParams p{};
    p.sl_mult = cfg.sl_mult;

    if (trend >= regime::TrendClass::STRONG) {
        p.tp_mult = cfg.trend_tp_mult;
    } else if (vol == regime::VolClass::LOW) {
        p.tp_mult = cfg.low_vol_tp_mult;
    } else {
        p.tp_mult = cfg.base_tp_mult;
    }

    if (vol == regime::VolClass::EXTREME) {
        int h = static_cast<int>(std::lround(cfg.max_horizon * cfg.extreme_horizon_factor));
        p.horizon = std::max(cfg.min_horizon, h);
    } else if (vol == regime::VolClass::LOW) {
        int h = static_cast<int>(std::lround(cfg.max_horizon * cfg.low_vol_horizon_factor));
        p.horizon = std::max(cfg.max_horizon, h);
        p.extended = true;
    } else {
        p.horizon = cfg.max_horizon;
    }
    return p;
}

inline BarrierParams select_barrier_params(const RegimeTag& tag,
                                           const BarrierConfig& cfg = {}) {
    return select_barrier_params(tag.vol_class, tag.trend_class, cfg);
}

// Classifies raw (vol_ratio, adx) with `regime_cfg` first.
inline BarrierParams select_barrier_params(double vol_ratio, double adx,
                                           const BarrierConfig& cfg = {},
                                           const RegimeConfig& regime_cfg = {}) {
    return select_barrier_params(regime::classify_volatility(vol_ratio, regime_cfg),
                                 regime::classify_trend(adx, regime_cfg), cfg);
}

// Horizon actually usable from origin `idx` in a series of `n` bars, or -1
// when the forward window does not fit. An extended horizon shrinks to the
// bars available, but never below the default horizon.
inline int resolve_horizon(const BarrierParams& p, int idx, int n,
                           const BarrierConfig& cfg = {}) {
    int available = n - 1 - idx;
    if (p.horizon <= available) return p.horizon;
    if (p.extended && available >= cfg.max_horizon) return available;
    return -1;
}

}  // namespace labeling
