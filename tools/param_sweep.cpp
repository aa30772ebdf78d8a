// param_sweep.cpp — parameter sweep over the default variant grid
//
// Usage:
//   param_sweep --data <file.csv|file.parquet> [--preset name] [--threads N]
//               [--resample-hours N] [--json-out path]

#include "backtest/backtest_result_io.hpp"
#include "backtest/parameter_sweep.hpp"
#include "bars/bar.hpp"
#include "bars/bar_csv_reader.hpp"
#include "bars/timeframe_resampler.hpp"
#include "io/parquet_io.hpp"
#include "strategy/strategy_presets.hpp"
#include "time_utils.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --data <file> [options]\n"
              << "\n"
              << "  --data             OHLCV input (.csv or .parquet)\n"
              << "  --preset           base configuration (default: hourly)\n"
              << "  --threads          worker threads (default: hardware concurrency)\n"
              << "  --resample-hours   aggregate input bars to N-hour bars\n"
              << "  --json-out         JSON results path\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string data_path;
    std::string preset = "hourly";
    std::string json_out;
    int threads = static_cast<int>(std::thread::hardware_concurrency());
    int resample_hours = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--data" && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            threads = std::stoi(argv[++i]);
        } else if (arg == "--resample-hours" && i + 1 < argc) {
            resample_hours = std::stoi(argv[++i]);
        } else if (arg == "--json-out" && i + 1 < argc) {
            json_out = argv[++i];
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
    if (threads < 1) threads = 1;

    try {
        BacktestConfig base;
        base.strategy = strategy_presets::by_name(preset);

        std::cout << "=== Parameter Sweep ===\n\n";
        std::string ext = std::filesystem::path(data_path).extension().string();
        auto bars = (ext == ".parquet") ? parquet_io::read_bars(data_path)
                                        : bar_csv::load(data_path);
        if (resample_hours > 0) {
            bars = bar_util::resample(bars, resample_hours * time_utils::MS_PER_HOUR);
        }
        std::cout << "Bars: " << bars.size() << ", threads: " << threads << "\n";

        ParameterSweep grid_sweep(sweep::default_grid(base));
        std::cout << "Running " << grid_sweep.cases().size() << " configurations...\n\n";
        auto results = grid_sweep.run(bars, threads);
        sweep::sort_by_pnl(results);

        std::printf("%-28s %7s %7s %9s %7s %8s\n",
                    "Config", "Trades", "WR", "P&L %", "PF", "MaxDD %");
        for (const auto& r : results) {
            if (!r.has_summary) {
                std::printf("%-28s %7d %7s %9s %7s %8s\n", r.label.c_str(), 0, "-", "-", "-", "-");
                continue;
            }
            const auto& s = r.summary;
            std::printf("%-28s %7d %6.1f%% %9.2f %7.2f %8.2f\n", r.label.c_str(),
                        s.trade_count, s.win_rate * 100.0, s.total_pnl_pct,
                        s.profit_factor, s.max_drawdown_pct);
        }

        std::vector<SweepResult> with_trades;
        for (const auto& r : results) {
            if (r.has_summary) with_trades.push_back(r);
        }
        auto frontier = sweep::pareto_frontier(with_trades);
        std::cout << "\nPareto frontier (expectancy, trade count, drawdown):\n";
        for (const auto& r : frontier) {
            std::printf("  %s\n", r.label.c_str());
        }

        if (!json_out.empty()) {
            backtest_io::write_text(json_out, backtest_io::to_json(results));
            std::cout << "\nJSON written to " << json_out << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
