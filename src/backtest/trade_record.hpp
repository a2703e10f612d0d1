#pragma once

#include "labeling/triple_barrier.hpp"

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// TradeRecord - one simulated trade, closed on creation from its Label
// ---------------------------------------------------------------------------
struct TradeRecord {
    std::string symbol;
    uint64_t open_ts = 0;
    int origin_idx = 0;
    int direction = 0;          // +1 = LONG, -1 = SHORT
    double confidence = 0.0;    // model probability of long

    double entry_price = 0.0;
    double tp_price = 0.0;
    double sl_price = 0.0;
    double tp_mult = 0.0;
    double sl_mult = 0.0;
    double atr = 0.0;

    Outcome label_outcome = Outcome::NEUTRAL;
    bool win = false;
    double r_multiple = 0.0;
    double risk_amount = 0.0;    // equity_before * risk fraction
    double position_size = 0.0;  // units of the asset
    double pnl = 0.0;
    double equity_before = 0.0;
    double equity_after = 0.0;
};

// ---------------------------------------------------------------------------
// EquitySample - account equity after a trade
// ---------------------------------------------------------------------------
struct EquitySample {
    uint64_t timestamp = 0;
    std::string symbol;
    double equity = 0.0;
};

// ---------------------------------------------------------------------------
// SkippedRow - row rejected by the simulator, with the reason
// ---------------------------------------------------------------------------
namespace skip_reason {
    inline constexpr const char* INVALID_CONFIDENCE = "invalid_confidence";
    inline constexpr const char* EXCLUDED_NEUTRAL   = "excluded_neutral";
    inline constexpr const char* INVALID_RISK_BASIS = "invalid_risk_basis";
}  // namespace skip_reason

struct SkippedRow {
    std::string symbol;
    uint64_t timestamp = 0;
    std::string reason;
};
