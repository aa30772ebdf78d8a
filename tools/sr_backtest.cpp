// sr_backtest.cpp — S/R bounce backtest tool
//
// Usage:
//   sr_backtest --data <file.csv|file.parquet> [--preset name] [--config file]
//               [--set key=value]... [--resample-hours N] [--account USD]
//               [--fee-pct X] [--trades-out path] [--json-out path]
//               [--compare-no-trail]

#include "backtest/backtest_result_io.hpp"
#include "backtest/backtest_runner.hpp"
#include "backtest/performance.hpp"
#include "backtest/period_breakdown.hpp"
#include "bars/bar.hpp"
#include "bars/bar_csv_reader.hpp"
#include "bars/timeframe_resampler.hpp"
#include "io/parquet_io.hpp"
#include "strategy/config_loader.hpp"
#include "strategy/strategy_presets.hpp"
#include "time_utils.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --data <file> [options]\n"
              << "\n"
              << "  --data             OHLCV input (.csv or .parquet)\n"
              << "  --preset           defaults, validated, hourly, dot, btc or eth (default: validated)\n"
              << "  --config           key = value file applied on top of the preset\n"
              << "  --set              key=value override, repeatable\n"
              << "  --resample-hours   aggregate input bars to N-hour bars\n"
              << "  --account          reference account size in USD (default: 10000)\n"
              << "  --fee-pct          fee per side in percent\n"
              << "  --trades-out       trade log (.csv or .parquet)\n"
              << "  --json-out         JSON report path\n"
              << "  --compare-no-trail also run with the trailing stop disabled\n";
}

std::vector<Bar> load_bars(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext == ".parquet") return parquet_io::read_bars(path);
    return bar_csv::load(path);
}

void print_summary(const char* label, const BacktestResult& result, double account) {
    std::printf("\n=== %s ===\n", label);
    std::printf("Signals: %zu, Trades: %zu, Skipped (in position): %d\n",
                result.signals.size(), result.trades.size(), result.skipped_in_position);
    if (result.trades.empty()) {
        std::printf("No trades.\n");
        return;
    }

    auto report = performance::build_report(result.trades);
    const auto& s = report.overall;
    std::printf("Trades: %d (W: %d, L: %d)\n", s.trade_count, s.winning_trades, s.losing_trades);
    std::printf("Win rate: %.1f%%\n", s.win_rate * 100.0);
    std::printf("Total P&L: %.2f%% ($%.0f on $%.0f)\n", s.total_pnl_pct,
                account * s.total_pnl_pct / 100.0, account);
    std::printf("Expectancy: %.3f%% per trade\n", s.expectancy_pct);
    std::printf("Profit factor: %.2f\n", s.profit_factor);
    std::printf("Max drawdown: %.2f%% ($%.0f)\n", s.max_drawdown_pct,
                account * s.max_drawdown_pct / 100.0);
    std::printf("Sharpe (per trade): %.3f\n", s.sharpe);
    std::printf("Avg bars held: %.1f\n", s.avg_bars_held);
    if (s.truncated_count > 0) {
        std::printf("Truncated at end of data: %d\n", s.truncated_count);
    }

    std::printf("\nBy exit reason:\n");
    for (const auto& [reason, r] : report.by_exit_reason) {
        std::printf("  %-14s %4d trades, %8.2f%%, %3.0f%% WR\n", exit_reason_str(reason).c_str(),
                    r.trade_count, r.total_pnl_pct, r.win_rate * 100.0);
    }
    std::printf("\nBy direction:\n");
    for (const auto& [dir, r] : report.by_direction) {
        std::printf("  %-14s %4d trades, %8.2f%%, %3.0f%% WR\n", direction_str(dir).c_str(),
                    r.trade_count, r.total_pnl_pct, r.win_rate * 100.0);
    }
    std::printf("\nBy weekday (entry, UTC):\n");
    for (const auto& [wd, r] : report.by_weekday) {
        std::printf("  %-14s %4d trades, %8.2f%%, %3.0f%% WR\n",
                    time_utils::weekday_name(wd).c_str(),
                    r.trade_count, r.total_pnl_pct, r.win_rate * 100.0);
    }
    std::printf("\nBy session (entry, UTC):\n");
    for (const auto& [session, r] : report.by_session) {
        std::printf("  %-14s %4d trades, %8.2f%%, %3.0f%% WR\n",
                    time_utils::session_name(session).c_str(),
                    r.trade_count, r.total_pnl_pct, r.win_rate * 100.0);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string data_path;
    std::string preset = "validated";
    std::string config_path;
    std::vector<std::string> overrides;
    std::string trades_out;
    std::string json_out;
    std::string fee_str;
    int resample_hours = 0;
    double account = 10000.0;
    bool compare_no_trail = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--data" && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--set" && i + 1 < argc) {
            overrides.push_back(argv[++i]);
        } else if (arg == "--resample-hours" && i + 1 < argc) {
            resample_hours = std::stoi(argv[++i]);
        } else if (arg == "--account" && i + 1 < argc) {
            account = std::stod(argv[++i]);
        } else if (arg == "--fee-pct" && i + 1 < argc) {
            fee_str = argv[++i];
        } else if (arg == "--trades-out" && i + 1 < argc) {
            trades_out = argv[++i];
        } else if (arg == "--json-out" && i + 1 < argc) {
            json_out = argv[++i];
        } else if (arg == "--compare-no-trail") {
            compare_no_trail = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (data_path.empty()) {
        std::cerr << "Missing required argument: --data\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        BacktestConfig cfg;
        cfg.strategy = strategy_presets::by_name(preset);
        if (!config_path.empty()) cfg = config_loader::load(config_path, cfg);
        for (const auto& o : overrides) config_loader::apply_override(cfg, o);
        if (!fee_str.empty()) config_loader::apply(cfg, "fee_pct", fee_str);
        cfg.strategy.validate();
        cfg.costs.validate();

        std::cout << "=== S/R Bounce Backtest ===\n\n";
        std::cout << "Loading " << data_path << "...\n";
        auto bars = load_bars(data_path);
        if (resample_hours > 0) {
            bars = bar_util::resample(bars, resample_hours * time_utils::MS_PER_HOUR);
            std::cout << "Resampled to " << resample_hours << "h bars\n";
        }

        std::cout << "Bars: " << bars.size() << "\n";
        std::cout << "Range: " << time_utils::to_iso8601(bars.front().timestamp_ms) << " to "
                  << time_utils::to_iso8601(bars.back().timestamp_ms) << "\n";
        std::printf("Price: %.2f -> %.2f\n", bars.front().close, bars.back().close);

        int64_t interval = bar_util::infer_interval_ms(bars);
        auto gaps = bar_util::detect_gaps(bars, interval);
        if (!gaps.empty()) {
            int missing = 0;
            for (const auto& g : gaps) missing += g.missing_bars;
            std::cout << "WARNING: " << gaps.size() << " gaps in the data (" << missing
                      << " missing bars)\n";
        }

        std::cout << "Preset: " << preset
                  << ", trend mode: " << trend_mode_str(cfg.strategy.trend_mode)
                  << ", trailing stop: " << (cfg.strategy.use_trailing_stop ? "on" : "off")
                  << ", round-trip cost: " << cfg.costs.round_trip_cost_pct() << "%\n";

        BacktestResult result = BacktestRunner(cfg).run(bars);
        print_summary("With configured exits", result, account);

        if (compare_no_trail && cfg.strategy.use_trailing_stop) {
            BacktestConfig nt = cfg;
            nt.strategy.use_trailing_stop = false;
            nt.strategy.use_runner_mode = false;
            BacktestResult baseline = BacktestRunner(nt).run(bars);
            print_summary("No trailing stop", baseline, account);

            if (!result.trades.empty() && !baseline.trades.empty()) {
                auto with = performance::aggregate(result.trades);
                auto without = performance::aggregate(baseline.trades);
                std::printf("\nTrail impact:\n");
                std::printf("  Win rate: %.1f%% -> %.1f%%\n",
                            without.win_rate * 100.0, with.win_rate * 100.0);
                std::printf("  P&L: %.2f%% -> %.2f%%\n", without.total_pnl_pct, with.total_pnl_pct);
                std::printf("  PF: %.2f -> %.2f\n", without.profit_factor, with.profit_factor);
            }
        }

        if (!trades_out.empty()) {
            std::string ext = std::filesystem::path(trades_out).extension().string();
            if (ext == ".parquet") {
                parquet_io::write_trades(trades_out, result.trades);
            } else {
                backtest_io::write_trades_csv(trades_out, result.trades);
            }
            std::cout << "\nTrades written to " << trades_out << "\n";
        }

        if (!json_out.empty()) {
            std::string json = backtest_io::to_json(result);
            if (!result.trades.empty()) {
                json = "{\"result\":" + json + ",\"report\":" +
                       backtest_io::to_json(performance::build_report(result.trades)) + "}";
            } else {
                json = "{\"result\":" + json + "}";
            }
            backtest_io::write_text(json_out, json);
            std::cout << "JSON written to " << json_out << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
