#pragma once

#include "bars/price_bar.hpp"
#include "labeling/barrier_params.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Outcome : int { SHORT_WIN = -1, NEUTRAL = 0, LONG_WIN = 1 };

inline int to_int(Outcome o) { return static_cast<int>(o); }

inline std::string to_string(Outcome o) {
    switch (o) {
        case Outcome::LONG_WIN:  return "long_win";
        case Outcome::SHORT_WIN: return "short_win";
        case Outcome::NEUTRAL:   return "neutral";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Label - triple-barrier outcome of one origin bar
// ---------------------------------------------------------------------------
struct Label {
    int origin_idx = 0;
    uint64_t origin_ts = 0;

    double entry = 0.0;
    double atr = 0.0;
    double tp_mult = 0.0;
    double sl_mult = 0.0;
    int horizon = 0;

    double long_tp = 0.0;
    double long_sl = 0.0;
    double short_tp = 0.0;
    double short_sl = 0.0;

    // First forward bar touching each barrier, -1 if never within the horizon
    int long_tp_idx = -1;
    int long_sl_idx = -1;
    int short_tp_idx = -1;
    int short_sl_idx = -1;

    Outcome outcome = Outcome::NEUTRAL;
    int decided_idx = 0;
    bool expired = false;    // no side won; decided_idx is the horizon end
    bool ambiguous = false;  // both sides won on the same terms
    std::string exit_type;   // "long_target", "short_target", "ambiguous", "neither"

    int horizon_end_idx() const { return origin_idx + horizon; }
};

namespace labeling {

// A side wins when its target is touched strictly before its stop. A target
// and stop touched within the same bar count as a stop.
inline bool side_wins(int tp_idx, int sl_idx) {
    if (tp_idx < 0) return false;
    return sl_idx < 0 || tp_idx < sl_idx;
}

// Triple-barrier label for origin `idx` with already-selected parameters.
// Returns nullopt when the horizon window does not fit in the series.
// Reads bars [idx, idx + horizon] only.
inline std::optional<Label> compute_label(const SymbolSeries& series, int idx,
                                          const BarrierParams& params,
                                          const BarrierConfig& cfg = {}) {
    int n = series.size();
    if (idx < 0 || idx >= n) return std::nullopt;

    const auto& origin = series.bars[idx];
    if (!std::isfinite(origin.atr) || origin.atr <= 0.0) return std::nullopt;

    int horizon = resolve_horizon(params, idx, n, cfg);
    if (horizon <= 0) return std::nullopt;

    Label lb{};
    lb.origin_idx = idx;
    lb.origin_ts = origin.timestamp;
    lb.entry = origin.close;
    lb.atr = origin.atr;
    lb.tp_mult = params.tp_mult;
    lb.sl_mult = params.sl_mult;
    lb.horizon = horizon;

    double tp_dist = params.tp_mult * origin.atr;
    double sl_dist = params.sl_mult * origin.atr;
    lb.long_tp = lb.entry + tp_dist;
    lb.long_sl = lb.entry - sl_dist;
    lb.short_tp = lb.entry - tp_dist;
    lb.short_sl = lb.entry + sl_dist;

    for (int j = idx + 1; j <= idx + horizon; ++j) {
        const auto& b = series.bars[j];
        if (lb.long_tp_idx < 0 && b.high >= lb.long_tp) lb.long_tp_idx = j;
        if (lb.long_sl_idx < 0 && b.low <= lb.long_sl) lb.long_sl_idx = j;
        if (lb.short_tp_idx < 0 && b.low <= lb.short_tp) lb.short_tp_idx = j;
        if (lb.short_sl_idx < 0 && b.high >= lb.short_sl) lb.short_sl_idx = j;
    }

    bool long_wins = side_wins(lb.long_tp_idx, lb.long_sl_idx);
    bool short_wins = side_wins(lb.short_tp_idx, lb.short_sl_idx);

    if (long_wins && short_wins) {
        lb.outcome = Outcome::NEUTRAL;
        lb.ambiguous = true;
        lb.decided_idx = std::max(lb.long_tp_idx, lb.short_tp_idx);
        lb.exit_type = "ambiguous";
    } else if (long_wins) {
        lb.outcome = Outcome::LONG_WIN;
        lb.decided_idx = lb.long_tp_idx;
        lb.exit_type = "long_target";
    } else if (short_wins) {
        lb.outcome = Outcome::SHORT_WIN;
        lb.decided_idx = lb.short_tp_idx;
        lb.exit_type = "short_target";
    } else {
        lb.outcome = Outcome::NEUTRAL;
        lb.expired = true;
        lb.decided_idx = lb.horizon_end_idx();
        lb.exit_type = "neither";
    }
    return lb;
}

}  // namespace labeling
