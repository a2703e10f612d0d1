// label_backtest.cpp - regime-conditioned triple-barrier labeling and backtest
//
// Subcommands:
//   label     bars CSV -> labeled rows (CSV or Parquet) + label statistics
//   backtest  labeled rows + confidence -> trade log, equity curve, report JSON
//   sweep     backtest once per candidate threshold, pick the best
//   signals   latest bar per symbol -> actionable signals
//
// Confidence comes from a CSV (symbol,timestamp,confidence) or an XGBoost
// model file trained on regime_features().

#include "backtest/metrics.hpp"
#include "backtest/signal_engine.hpp"
#include "backtest/threshold_optimizer.hpp"
#include "backtest/trade_simulator.hpp"
#include "io/bar_csv.hpp"
#include "io/confidence_csv.hpp"
#include "io/parquet_export.hpp"
#include "io/result_io.hpp"
#include "models/gbt_confidence_model.hpp"
#include "pipeline.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::string command;
    std::string bars_path;
    std::string confidence_path;
    std::string model_path;
    std::string output_path;
    std::string trades_path;
    std::string equity_path;
    std::string skipped_path;
    std::string thresholds;
    std::string objective = "profit_factor";

    PipelineConfig pipeline;
    SimulatorConfig sim;
    bool parallel_sweep = false;
};

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <label|backtest|sweep|signals> --bars <csv> [options]\n"
              << "\n"
              << "  --bars <path>          Bar CSV: symbol,timestamp,open,high,low,close[,atr,adx,...]\n"
              << "  --output <path>        label: .csv or .parquet; backtest/sweep: .json;\n"
              << "                         signals: .csv (default: stdout summary only)\n"
              << "  --confidence <path>    Confidence CSV: symbol,timestamp,confidence\n"
              << "  --model <path>         XGBoost model (alternative to --confidence)\n"
              << "  --threshold <t>        Confidence threshold (default 0.7)\n"
              << "  --thresholds <list>    sweep: comma-separated candidates (default 0.5..0.8)\n"
              << "  --objective <name>     sweep: profit_factor|net_pnl|sharpe|win_rate\n"
              << "  --equity <amount>      Initial equity (default 10000)\n"
              << "  --risk <fraction>      Risk per trade (default 0.01)\n"
              << "  --exclude-neutral      Skip rows whose label is neutral\n"
              << "  --trades <path>        backtest: trade log (.csv or .parquet)\n"
              << "  --equity-curve <path>  backtest: equity curve CSV\n"
              << "  --skipped <path>       backtest: skipped rows CSV\n"
              << "  --max-horizon <n>      Default label horizon in bars (default 10)\n"
              << "  --no-indicators        Use indicator columns as given; do not compute missing ones\n"
              << "  --parallel             Per-symbol labeling and per-threshold sweep in parallel\n";
}

std::vector<double> parse_list(const std::string& text) {
    std::vector<double> out;
    std::istringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(std::stod(item));
    }
    return out;
}

bool has_extension(const std::string& path, const char* ext) {
    return std::filesystem::path(path).extension().string() == ext;
}

// ===========================================================================
// Shared stages
// ===========================================================================
LabelingResult run_labeling(const CliOptions& opt) {
    auto universe = read_bar_csv(opt.bars_path);
    std::cout << "Loaded " << universe.size() << " symbols from " << opt.bars_path << "\n";

    LabelPipeline pipeline(opt.pipeline);
    auto result = pipeline.run(universe);

    for (const auto& [symbol, labels] : result.by_symbol) {
        std::printf("  %-10s %5d bars  %5zu labeled  %4d indeterminate  %3d no-window\n",
                    symbol.c_str(), labels.bar_count, labels.rows.size(),
                    labels.indeterminate_count, labels.no_label_count);
    }
    return result;
}

std::vector<ScoredRow> score(const CliOptions& opt, const std::vector<LabeledRow>& rows) {
    if (!opt.model_path.empty()) {
        GbtConfidenceModel model(opt.model_path);
        return score_rows(rows, model);
    }
    auto table = read_confidence_csv(opt.confidence_path);
    std::cout << "Loaded " << table.size() << " confidence scores\n";
    return score_rows(rows, table);
}

void print_stats_line(const char* name, const TradeStats& s) {
    if (s.no_trades()) {
        std::printf("  %-10s no trades\n", name);
        return;
    }
    std::string pf = s.profit_factor ? (s.infinite_profit_factor()
                                            ? std::string("inf")
                                            : backtest_io::csv_number(*s.profit_factor))
                                     : std::string("n/a");
    std::printf("  %-10s trades=%4d  win_rate=%.3f  pf=%s  avg_r=%+.3f  max_dd=%.4f\n",
                name, s.trade_count, s.win_rate, pf.c_str(), s.avg_r, s.max_drawdown);
}

void print_report(const BacktestReport& rep) {
    std::printf("\nThreshold %.2f: equity %.2f -> %.2f (%+.2f%%), %d skipped, %d below threshold\n",
                rep.threshold, rep.initial_equity, rep.final_equity,
                100.0 * rep.total_return, rep.skipped_count, rep.below_threshold);
    print_stats_line("ALL", rep.overall);
    for (const auto& [symbol, stats] : rep.per_symbol) {
        print_stats_line(symbol.c_str(), stats);
    }
}

// ===========================================================================
// Subcommands
// ===========================================================================
int cmd_label(const CliOptions& opt) {
    auto result = run_labeling(opt);
    auto rows = result.all_rows();

    auto total = labeling::total_statistics(rows);
    std::printf("\nLabels: %d total, long %.1f%%, short %.1f%%, neutral %.1f%% "
                "(%d ambiguous, %d expired)\n",
                total.total, total.long_pct(), total.short_pct(), total.neutral_pct(),
                total.ambiguous, total.expired);

    if (opt.output_path.empty()) return 0;
    if (has_extension(opt.output_path, ".parquet")) {
        write_labels_parquet(opt.output_path, rows);
    } else {
        auto file = backtest_io::open_output(opt.output_path);
        backtest_io::write_labels_csv(file, rows);
    }
    std::cout << "Wrote " << rows.size() << " labeled rows to " << opt.output_path << "\n";
    return 0;
}

int cmd_backtest(const CliOptions& opt) {
    auto result = run_labeling(opt);
    auto scored = score(opt, result.all_rows());

    TradeSimulator simulator(opt.sim);
    auto sim = simulator.run(scored);
    auto report = compute_report(sim, opt.sim.threshold);
    print_report(report);

    if (!opt.trades_path.empty()) {
        if (has_extension(opt.trades_path, ".parquet")) {
            write_trades_parquet(opt.trades_path, sim.trades);
        } else {
            auto file = backtest_io::open_output(opt.trades_path);
            backtest_io::write_trades_csv(file, sim.trades);
        }
    }
    if (!opt.equity_path.empty()) {
        auto file = backtest_io::open_output(opt.equity_path);
        backtest_io::write_equity_csv(file, sim.equity_curve);
    }
    if (!opt.skipped_path.empty()) {
        auto file = backtest_io::open_output(opt.skipped_path);
        backtest_io::write_skipped_csv(file, sim.skipped);
    }
    if (!opt.output_path.empty()) {
        backtest_io::write_text(opt.output_path, backtest_io::to_json(report));
    }
    return 0;
}

int cmd_sweep(const CliOptions& opt) {
    auto result = run_labeling(opt);
    auto scored = score(opt, result.all_rows());

    SweepConfig sweep_cfg;
    if (!opt.thresholds.empty()) sweep_cfg.thresholds = parse_list(opt.thresholds);
    sweep_cfg.objective = backtest_util::parse_objective(opt.objective);
    sweep_cfg.parallel = opt.parallel_sweep;

    ThresholdOptimizer optimizer(opt.sim, sweep_cfg);
    auto sweep = optimizer.run(scored);

    std::printf("\n%-9s %7s %9s %8s %8s %9s\n",
                "threshold", "trades", "win_rate", "pf", "avg_r", "max_dd");
    for (const auto& rep : sweep.reports) {
        const auto& s = rep.overall;
        if (rep.no_trades()) {
            std::printf("%-9.2f %7s\n", rep.threshold, "none");
            continue;
        }
        std::string pf = s.profit_factor ? backtest_io::csv_number(*s.profit_factor) : "n/a";
        std::printf("%-9.2f %7d %9.3f %8s %+8.3f %9.4f\n", rep.threshold, s.trade_count,
                    s.win_rate, pf.c_str(), s.avg_r, s.max_drawdown);
    }
    if (const auto* best = sweep.best()) {
        std::printf("\nBest threshold by %s: %.2f\n",
                    backtest_util::objective_str(sweep.objective).c_str(), best->threshold);
    } else {
        std::printf("\nNo threshold produced a rankable result\n");
    }

    if (!opt.output_path.empty()) {
        if (has_extension(opt.output_path, ".csv")) {
            auto file = backtest_io::open_output(opt.output_path);
            backtest_io::write_sweep_csv(file, sweep);
        } else {
            backtest_io::write_text(opt.output_path, backtest_io::to_json(sweep));
        }
    }
    return 0;
}

int cmd_signals(const CliOptions& opt) {
    auto universe = read_bar_csv(opt.bars_path);
    for (auto& series : universe) {
        validate_series(series);
        if (opt.pipeline.fill_indicators) {
            indicators::fill_missing(series, opt.pipeline.indicators);
        }
    }

    SignalEngine engine(opt.pipeline.regime, opt.pipeline.barrier, opt.sim.threshold);
    std::vector<Signal> signals;
    if (!opt.model_path.empty()) {
        GbtConfidenceModel model(opt.model_path);
        signals = engine.generate(universe, model);
    } else {
        signals = engine.generate(universe, read_confidence_csv(opt.confidence_path));
    }

    std::printf("%zu signals at threshold %.2f\n", signals.size(), engine.threshold());
    for (const auto& s : signals) {
        std::printf("  %-10s %s %-5s conf=%.3f entry=%.4f tp=%.4f sl=%.4f h=%d\n",
                    s.symbol.c_str(), time_utils::format_date(s.timestamp).c_str(),
                    backtest_io::direction_str(s.direction).c_str(), s.confidence,
                    s.entry, s.take_profit, s.stop_loss, s.horizon);
    }

    if (!opt.output_path.empty()) {
        auto file = backtest_io::open_output(opt.output_path);
        backtest_io::write_signals_csv(file, signals);
    }
    return 0;
}

}  // namespace

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    CliOptions opt;
    opt.command = argv[1];

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--bars" && i + 1 < argc) {
                opt.bars_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                opt.output_path = argv[++i];
            } else if (arg == "--confidence" && i + 1 < argc) {
                opt.confidence_path = argv[++i];
            } else if (arg == "--model" && i + 1 < argc) {
                opt.model_path = argv[++i];
            } else if (arg == "--threshold" && i + 1 < argc) {
                opt.sim.threshold = std::stod(argv[++i]);
            } else if (arg == "--thresholds" && i + 1 < argc) {
                opt.thresholds = argv[++i];
            } else if (arg == "--objective" && i + 1 < argc) {
                opt.objective = argv[++i];
            } else if (arg == "--equity" && i + 1 < argc) {
                opt.sim.initial_equity = std::stod(argv[++i]);
            } else if (arg == "--risk" && i + 1 < argc) {
                opt.sim.risk_fraction = std::stod(argv[++i]);
            } else if (arg == "--exclude-neutral") {
                opt.sim.exclude_neutral = true;
            } else if (arg == "--trades" && i + 1 < argc) {
                opt.trades_path = argv[++i];
            } else if (arg == "--equity-curve" && i + 1 < argc) {
                opt.equity_path = argv[++i];
            } else if (arg == "--skipped" && i + 1 < argc) {
                opt.skipped_path = argv[++i];
            } else if (arg == "--max-horizon" && i + 1 < argc) {
                opt.pipeline.barrier.max_horizon = std::stoi(argv[++i]);
            } else if (arg == "--no-indicators") {
                opt.pipeline.fill_indicators = false;
            } else if (arg == "--parallel") {
                opt.pipeline.parallel = true;
                opt.parallel_sweep = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument value: " << e.what() << "\n";
        return 1;
    }

    if (opt.bars_path.empty()) {
        std::cerr << "Missing required argument: --bars\n";
        print_usage(argv[0]);
        return 1;
    }
    bool needs_confidence = opt.command == "backtest" || opt.command == "sweep" ||
                            opt.command == "signals";
    if (needs_confidence && opt.confidence_path.empty() && opt.model_path.empty()) {
        std::cerr << "Missing required argument: --confidence or --model\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        if (opt.command == "label") return cmd_label(opt);
        if (opt.command == "backtest") return cmd_backtest(opt);
        if (opt.command == "sweep") return cmd_sweep(opt);
        if (opt.command == "signals") return cmd_signals(opt);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << opt.command << "\n";
    print_usage(argv[0]);
    return 1;
}
