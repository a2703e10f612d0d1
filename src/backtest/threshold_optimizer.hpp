#pragma once

#include "backtest/metrics.hpp"
#include "backtest/trade_simulator.hpp"

#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SweepConfig - candidate thresholds and selection objective
// ---------------------------------------------------------------------------
struct SweepConfig {
    enum class Objective { PROFIT_FACTOR, NET_PNL, SHARPE, WIN_RATE };

    std::vector<double> thresholds = {0.5, 0.55, 0.6, 0.65, 0.7, 0.75, 0.8};
    Objective objective = Objective::PROFIT_FACTOR;
    bool parallel = false;   // one task per candidate
};

namespace backtest_util {

inline std::string objective_str(SweepConfig::Objective o) {
    switch (o) {
        case SweepConfig::Objective::PROFIT_FACTOR: return "profit_factor";
        case SweepConfig::Objective::NET_PNL:       return "net_pnl";
        case SweepConfig::Objective::SHARPE:        return "sharpe";
        case SweepConfig::Objective::WIN_RATE:      return "win_rate";
    }
    return "unknown";
}

inline SweepConfig::Objective parse_objective(const std::string& s) {
    if (s == "profit_factor") return SweepConfig::Objective::PROFIT_FACTOR;
    if (s == "net_pnl")       return SweepConfig::Objective::NET_PNL;
    if (s == "sharpe")        return SweepConfig::Objective::SHARPE;
    if (s == "win_rate")      return SweepConfig::Objective::WIN_RATE;
    throw std::invalid_argument("Unknown objective: " + s);
}

// Objective value of a report; nullopt when the report cannot be ranked.
inline std::optional<double> objective_value(const BacktestReport& rep,
                                             SweepConfig::Objective o) {
    if (rep.no_trades()) return std::nullopt;
    switch (o) {
        case SweepConfig::Objective::PROFIT_FACTOR: return rep.overall.profit_factor;
        case SweepConfig::Objective::NET_PNL:       return rep.overall.net_pnl;
        case SweepConfig::Objective::SHARPE:        return rep.overall.sharpe;
        case SweepConfig::Objective::WIN_RATE:      return rep.overall.win_rate;
    }
    return std::nullopt;
}

}  // namespace backtest_util

// ---------------------------------------------------------------------------
// SweepResult - one report per candidate, in candidate order
// ---------------------------------------------------------------------------
struct SweepResult {
    SweepConfig::Objective objective = SweepConfig::Objective::PROFIT_FACTOR;
    std::vector<BacktestReport> reports;
    std::optional<size_t> best_index;   // nullopt when no candidate is rankable

    const BacktestReport* best() const {
        return best_index ? &reports[*best_index] : nullptr;
    }
};

// ---------------------------------------------------------------------------
// ThresholdOptimizer - simulator + metrics once per candidate threshold
//
// Each candidate gets its own TradeSimulator starting from the initial
// equity. Best = highest objective, then more trades, then earlier candidate.
// ---------------------------------------------------------------------------
class ThresholdOptimizer {
public:
    ThresholdOptimizer(const SimulatorConfig& base, const SweepConfig& sweep = {})
        : base_(base), sweep_(sweep) {
        if (sweep_.thresholds.empty()) {
            throw std::invalid_argument("Threshold sweep needs at least one candidate");
        }
        for (double t : sweep_.thresholds) {
            if (!(t >= 0.5 && t <= 1.0)) {
                throw std::invalid_argument("Sweep candidate " + std::to_string(t) +
                                            " outside [0.5, 1]");
            }
        }
    }

    BacktestReport evaluate(const std::vector<ScoredRow>& rows, double threshold) const {
        SimulatorConfig cfg = base_;
        cfg.threshold = threshold;
        TradeSimulator sim(cfg);
        return compute_report(sim.run(rows), threshold);
    }

    SweepResult run(const std::vector<ScoredRow>& rows) const {
        SweepResult result;
        result.objective = sweep_.objective;
        result.reports.reserve(sweep_.thresholds.size());

        if (sweep_.parallel && sweep_.thresholds.size() > 1) {
            std::vector<std::future<BacktestReport>> tasks;
            tasks.reserve(sweep_.thresholds.size());
            for (double tau : sweep_.thresholds) {
                tasks.push_back(std::async(std::launch::async,
                    [this, &rows, tau]() { return evaluate(rows, tau); }));
            }
            for (auto& task : tasks) result.reports.push_back(task.get());
        } else {
            for (double tau : sweep_.thresholds) {
                result.reports.push_back(evaluate(rows, tau));
            }
        }

        result.best_index = select_best(result.reports, sweep_.objective);
        return result;
    }

    static std::optional<size_t> select_best(const std::vector<BacktestReport>& reports,
                                             SweepConfig::Objective objective) {
        std::optional<size_t> best;
        std::optional<double> best_value;
        for (size_t i = 0; i < reports.size(); ++i) {
            auto v = backtest_util::objective_value(reports[i], objective);
            if (!v.has_value()) continue;
            if (!best.has_value() || *v > *best_value ||
                (*v == *best_value &&
                 reports[i].overall.trade_count > reports[*best].overall.trade_count)) {
                best = i;
                best_value = v;
            }
        }
        return best;
    }

private:
    SimulatorConfig base_;
    SweepConfig sweep_;
};
