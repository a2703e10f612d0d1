#pragma once

#include "backtest/metrics.hpp"
#include "backtest/signal_engine.hpp"
#include "backtest/threshold_optimizer.hpp"
#include "backtest/trade_record.hpp"
#include "labeling/label_engine.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

// JSON has no NaN/Inf: NaN -> null, +/-inf -> "Infinity"/"-Infinity".
inline std::string json_number(double v) {
    if (std::isnan(v)) return "null";
    if (std::isinf(v)) return v > 0 ? "\"Infinity\"" : "\"-Infinity\"";
    std::ostringstream ss;
    ss << std::setprecision(12) << v;
    return ss.str();
}

inline std::string json_number(const std::optional<double>& v) {
    return v.has_value() ? json_number(*v) : "null";
}

inline std::string csv_number(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "Inf" : "-Inf";
    std::ostringstream ss;
    ss << std::setprecision(12) << v;
    return ss.str();
}

inline std::string csv_number(const std::optional<double>& v) {
    return v.has_value() ? csv_number(*v) : "";
}

inline std::string direction_str(int direction) {
    return direction > 0 ? "LONG" : "SHORT";
}

// ---------------------------------------------------------------------------
// CSV writers
// ---------------------------------------------------------------------------

inline void write_labels_csv(std::ostream& out, const std::vector<LabeledRow>& rows) {
    out << "symbol,date,timestamp,open,high,low,close,atr,adx,"
           "vol_ratio,vol_class,trend_class,fast_slope,slow_slope,bb_width_atr,"
           "breakout,market_state,consolidation_days,"
           "tp_mult,sl_mult,horizon,long_tp,long_sl,short_tp,short_sl,"
           "label,exit_type,decided_idx,decided_offset\n";
    for (const auto& r : rows) {
        const auto& b = r.bar;
        const auto& g = r.regime;
        const auto& l = r.label;
        out << r.symbol
            << "," << time_utils::format_date(b.timestamp)
            << "," << b.timestamp
            << "," << csv_number(b.open)
            << "," << csv_number(b.high)
            << "," << csv_number(b.low)
            << "," << csv_number(b.close)
            << "," << csv_number(b.atr)
            << "," << csv_number(b.adx)
            << "," << csv_number(g.vol_ratio)
            << "," << regime::to_string(g.vol_class)
            << "," << regime::to_string(g.trend_class)
            << "," << csv_number(g.fast_slope)
            << "," << csv_number(g.slow_slope)
            << "," << csv_number(g.bb_width_atr)
            << "," << g.breakout
            << "," << regime::to_string(g.market_state)
            << "," << g.consolidation_days
            << "," << csv_number(l.tp_mult)
            << "," << csv_number(l.sl_mult)
            << "," << l.horizon
            << "," << csv_number(l.long_tp)
            << "," << csv_number(l.long_sl)
            << "," << csv_number(l.short_tp)
            << "," << csv_number(l.short_sl)
            << "," << to_int(l.outcome)
            << "," << l.exit_type
            << "," << l.decided_idx
            << "," << (l.decided_idx - l.origin_idx)
            << "\n";
    }
}

inline void write_trades_csv(std::ostream& out, const std::vector<TradeRecord>& trades) {
    out << "symbol,date,timestamp,direction,confidence,entry_price,tp_price,sl_price,"
           "tp_mult,sl_mult,atr,label,win,r_multiple,risk_amount,position_size,pnl,"
           "equity_before,equity_after\n";
    for (const auto& t : trades) {
        out << t.symbol
            << "," << time_utils::format_date(t.open_ts)
            << "," << t.open_ts
            << "," << direction_str(t.direction)
            << "," << csv_number(t.confidence)
            << "," << csv_number(t.entry_price)
            << "," << csv_number(t.tp_price)
            << "," << csv_number(t.sl_price)
            << "," << csv_number(t.tp_mult)
            << "," << csv_number(t.sl_mult)
            << "," << csv_number(t.atr)
            << "," << to_int(t.label_outcome)
            << "," << (t.win ? 1 : 0)
            << "," << csv_number(t.r_multiple)
            << "," << csv_number(t.risk_amount)
            << "," << csv_number(t.position_size)
            << "," << csv_number(t.pnl)
            << "," << csv_number(t.equity_before)
            << "," << csv_number(t.equity_after)
            << "\n";
    }
}

inline void write_equity_csv(std::ostream& out, const std::vector<EquitySample>& curve) {
    out << "date,timestamp,symbol,equity\n";
    for (const auto& e : curve) {
        out << time_utils::format_date(e.timestamp) << "," << e.timestamp << ","
            << e.symbol << "," << csv_number(e.equity) << "\n";
    }
}

inline void write_skipped_csv(std::ostream& out, const std::vector<SkippedRow>& skipped) {
    out << "symbol,timestamp,reason\n";
    for (const auto& s : skipped) {
        out << s.symbol << "," << s.timestamp << "," << s.reason << "\n";
    }
}

inline void write_sweep_csv(std::ostream& out, const SweepResult& sweep) {
    out << "threshold,trade_count,no_trades,wins,losses,win_rate,profit_factor,"
           "net_pnl,avg_r,max_drawdown,sharpe,final_equity,total_return,best\n";
    for (size_t i = 0; i < sweep.reports.size(); ++i) {
        const auto& r = sweep.reports[i];
        const auto& s = r.overall;
        bool best = sweep.best_index.has_value() && *sweep.best_index == i;
        out << csv_number(r.threshold)
            << "," << s.trade_count
            << "," << (r.no_trades() ? 1 : 0)
            << "," << s.wins
            << "," << s.losses
            << "," << csv_number(s.win_rate)
            << "," << csv_number(s.profit_factor)
            << "," << csv_number(s.net_pnl)
            << "," << csv_number(s.avg_r)
            << "," << csv_number(s.max_drawdown)
            << "," << csv_number(s.sharpe)
            << "," << csv_number(r.final_equity)
            << "," << csv_number(r.total_return)
            << "," << (best ? 1 : 0)
            << "\n";
    }
}

inline void write_signals_csv(std::ostream& out, const std::vector<Signal>& signals) {
    out << "symbol,date,direction,confidence,entry,take_profit,stop_loss,"
           "tp_mult,sl_mult,horizon,vol_class,trend_class,market_state\n";
    for (const auto& s : signals) {
        out << s.symbol
            << "," << time_utils::format_date(s.timestamp)
            << "," << direction_str(s.direction)
            << "," << csv_number(s.confidence)
            << "," << csv_number(s.entry)
            << "," << csv_number(s.take_profit)
            << "," << csv_number(s.stop_loss)
            << "," << csv_number(s.tp_mult)
            << "," << csv_number(s.sl_mult)
            << "," << s.horizon
            << "," << regime::to_string(s.regime.vol_class)
            << "," << regime::to_string(s.regime.trend_class)
            << "," << regime::to_string(s.regime.market_state)
            << "\n";
    }
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

inline std::string to_json(const TradeStats& s) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"trade_count\":" << s.trade_count;
    ss << ",\"no_trades\":" << (s.no_trades() ? "true" : "false");
    ss << ",\"wins\":" << s.wins;
    ss << ",\"losses\":" << s.losses;
    ss << ",\"win_rate\":" << json_number(s.win_rate);
    ss << ",\"gross_profit\":" << json_number(s.gross_profit);
    ss << ",\"gross_loss\":" << json_number(s.gross_loss);
    ss << ",\"net_pnl\":" << json_number(s.net_pnl);
    ss << ",\"profit_factor\":" << json_number(s.profit_factor);
    ss << ",\"avg_win\":" << json_number(s.avg_win);
    ss << ",\"avg_loss\":" << json_number(s.avg_loss);
    ss << ",\"avg_r\":" << json_number(s.avg_r);
    ss << ",\"max_drawdown\":" << json_number(s.max_drawdown);
    ss << ",\"sharpe\":" << json_number(s.sharpe);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const BacktestReport& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"threshold\":" << json_number(r.threshold);
    ss << ",\"initial_equity\":" << json_number(r.initial_equity);
    ss << ",\"final_equity\":" << json_number(r.final_equity);
    ss << ",\"total_return\":" << json_number(r.total_return);
    ss << ",\"skipped_count\":" << r.skipped_count;
    ss << ",\"below_threshold\":" << r.below_threshold;
    ss << ",\"overall\":" << to_json(r.overall);

    ss << ",\"per_symbol\":{";
    bool first = true;
    for (const auto& [symbol, stats] : r.per_symbol) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << json_escape(symbol) << "\":" << to_json(stats);
    }
    ss << "}";

    ss << "}";
    return ss.str();
}

inline std::string to_json(const SweepResult& sweep) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"objective\":\"" << backtest_util::objective_str(sweep.objective) << "\"";
    if (const auto* best = sweep.best()) {
        ss << ",\"best_threshold\":" << json_number(best->threshold);
    } else {
        ss << ",\"best_threshold\":null";
    }
    ss << ",\"reports\":[";
    for (size_t i = 0; i < sweep.reports.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(sweep.reports[i]);
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

// ---------------------------------------------------------------------------
// File helpers
// ---------------------------------------------------------------------------

inline std::ofstream open_output(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    return file;
}

inline void write_text(const std::string& path, const std::string& text) {
    auto file = open_output(path);
    file << text << "\n";
}

}  // namespace backtest_io
