#pragma once

#include "backtest/trade_record.hpp"
#include "backtest/trade_simulator.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TradeStats - metrics over one set of trades
//
// profit_factor: nullopt with no trades or no gross profit and loss at all,
//                +inf when there is profit but no loss.
// sharpe:        mean(R) / stdev(R), nullopt under 2 trades or zero variance.
// max_drawdown:  (trough - peak) / peak over the equity path, always <= 0.
// ---------------------------------------------------------------------------
struct TradeStats {
    int trade_count = 0;
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;    // magnitude
    double net_pnl = 0.0;
    std::optional<double> profit_factor;
    double avg_win = 0.0;       // mean P&L of winning trades
    double avg_loss = 0.0;      // mean P&L of losing trades (<= 0)
    double avg_r = 0.0;
    std::optional<double> sharpe;
    double max_drawdown = 0.0;

    bool no_trades() const { return trade_count == 0; }
    bool infinite_profit_factor() const {
        return profit_factor.has_value() && std::isinf(*profit_factor);
    }
};

// ---------------------------------------------------------------------------
// BacktestReport - overall metrics, per-symbol breakdown and run bookkeeping
// ---------------------------------------------------------------------------
struct BacktestReport {
    double threshold = 0.0;
    TradeStats overall;
    std::map<std::string, TradeStats> per_symbol;

    double initial_equity = 0.0;
    double final_equity = 0.0;
    double total_return = 0.0;  // final / initial - 1
    int skipped_count = 0;
    int below_threshold = 0;

    bool no_trades() const { return overall.no_trades(); }
};

namespace backtest_util {

// Forward pass with a running peak. `start` seeds the peak.
inline double max_drawdown(double start, const std::vector<double>& equity) {
    double peak = start;
    double worst = 0.0;
    for (double e : equity) {
        if (e > peak) peak = e;
        if (peak > 0.0) {
            double dd = (e - peak) / peak;
            if (dd < worst) worst = dd;
        }
    }
    return worst;
}

inline std::optional<double> profit_factor(double gross_profit, double gross_loss) {
    if (gross_loss > 0.0) return gross_profit / gross_loss;
    if (gross_profit > 0.0) return std::numeric_limits<double>::infinity();
    return std::nullopt;
}

inline std::optional<double> sharpe_ratio(const std::vector<double>& r) {
    if (r.size() < 2) return std::nullopt;
    double n = static_cast<double>(r.size());
    double mean = 0.0;
    for (double x : r) mean += x;
    mean /= n;
    double sum_sq = 0.0;
    for (double x : r) sum_sq += (x - mean) * (x - mean);
    double stddev = std::sqrt(sum_sq / (n - 1.0));
    if (!(stddev > 0.0)) return std::nullopt;
    return mean / stddev;
}

// Scalar metrics of `trades`. The drawdown path is initial equity followed
// by `equity_path`.
inline TradeStats compute_stats(const std::vector<const TradeRecord*>& trades,
                                double initial_equity,
                                const std::vector<double>& equity_path) {
    TradeStats s;
    s.trade_count = static_cast<int>(trades.size());
    if (trades.empty()) return s;

    std::vector<double> r;
    r.reserve(trades.size());
    double win_pnl = 0.0;
    double loss_pnl = 0.0;
    for (const auto* t : trades) {
        r.push_back(t->r_multiple);
        s.net_pnl += t->pnl;
        if (t->pnl > 0.0) s.gross_profit += t->pnl;
        else              s.gross_loss += -t->pnl;
        if (t->win) {
            s.wins++;
            win_pnl += t->pnl;
        } else {
            s.losses++;
            loss_pnl += t->pnl;
        }
    }

    s.win_rate = static_cast<double>(s.wins) / static_cast<double>(s.trade_count);
    s.profit_factor = profit_factor(s.gross_profit, s.gross_loss);
    if (s.wins > 0) s.avg_win = win_pnl / s.wins;
    if (s.losses > 0) s.avg_loss = loss_pnl / s.losses;

    double r_sum = 0.0;
    for (double x : r) r_sum += x;
    s.avg_r = r_sum / static_cast<double>(r.size());
    s.sharpe = sharpe_ratio(r);
    s.max_drawdown = max_drawdown(initial_equity, equity_path);
    return s;
}

}  // namespace backtest_util

// ---------------------------------------------------------------------------
// compute_report - metrics from a trade log and its equity curve
//
// Per-symbol drawdown follows that symbol's P&L compounded onto the initial
// equity, in trade order.
// ---------------------------------------------------------------------------
inline BacktestReport compute_report(const std::vector<TradeRecord>& trades,
                                     const std::vector<EquitySample>& equity_curve,
                                     double initial_equity) {
    BacktestReport rep;
    rep.initial_equity = initial_equity;
    rep.final_equity = equity_curve.empty() ? initial_equity : equity_curve.back().equity;
    if (initial_equity > 0.0) rep.total_return = rep.final_equity / initial_equity - 1.0;

    std::vector<const TradeRecord*> all;
    all.reserve(trades.size());
    std::map<std::string, std::vector<const TradeRecord*>> by_symbol;
    for (const auto& t : trades) {
        all.push_back(&t);
        by_symbol[t.symbol].push_back(&t);
    }

    std::vector<double> path;
    path.reserve(equity_curve.size());
    for (const auto& e : equity_curve) path.push_back(e.equity);
    rep.overall = backtest_util::compute_stats(all, initial_equity, path);

    for (const auto& [symbol, subset] : by_symbol) {
        std::vector<double> sym_path;
        sym_path.reserve(subset.size());
        double equity = initial_equity;
        for (const auto* t : subset) {
            equity += t->pnl;
            sym_path.push_back(equity);
        }
        rep.per_symbol[symbol] = backtest_util::compute_stats(subset, initial_equity, sym_path);
    }
    return rep;
}

inline BacktestReport compute_report(const SimulationResult& sim, double threshold) {
    auto rep = compute_report(sim.trades, sim.equity_curve, sim.initial_equity);
    rep.threshold = threshold;
    rep.skipped_count = static_cast<int>(sim.skipped.size());
    rep.below_threshold = sim.below_threshold;
    return rep;
}
