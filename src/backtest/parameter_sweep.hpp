#pragma once

#include "backtest/backtest_runner.hpp"
#include "backtest/performance.hpp"
#include "bars/bar.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// SweepCase / SweepResult — one labelled configuration and its outcome
// ---------------------------------------------------------------------------
struct SweepCase {
    std::string label;
    BacktestConfig config;
};

struct SweepResult {
    std::string label;
    BacktestConfig config;
    int trade_count = 0;
    bool has_summary = false;          // false when the case produced no trades
    PerformanceSummary summary;

    // Pareto objectives.
    double expectancy = 0.0;
    double max_drawdown = 0.0;
};

// ---------------------------------------------------------------------------
// ParameterSweep — independent backtests over the same bars
//
// Each worker owns its runner and writes only its own result slot, so the
// output order matches the case order for any thread count.
// ---------------------------------------------------------------------------
class ParameterSweep {
public:
    ParameterSweep() = default;
    explicit ParameterSweep(std::vector<SweepCase> cases) : cases_(std::move(cases)) {}

    void add(const std::string& label, const BacktestConfig& config) {
        cases_.push_back(SweepCase{label, config});
    }

    const std::vector<SweepCase>& cases() const { return cases_; }

    // Rethrows the first exception raised by any case.
    std::vector<SweepResult> run(const std::vector<Bar>& bars, int n_threads = 1) const {
        bar_util::validate_bars(bars);

        std::vector<SweepResult> results(cases_.size());
        if (cases_.empty()) return results;

        int workers = std::max(1, std::min<int>(n_threads, static_cast<int>(cases_.size())));
        std::atomic<size_t> next_idx{0};
        std::exception_ptr first_error;
        std::mutex error_mutex;

        auto work = [&]() {
            for (;;) {
                size_t i = next_idx.fetch_add(1);
                if (i >= cases_.size()) return;
                try {
                    results[i] = run_case(cases_[i], bars);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    next_idx.store(cases_.size());
                }
            }
        };

        if (workers == 1) {
            work();
        } else {
            std::vector<std::thread> pool;
            pool.reserve(workers);
            for (int w = 0; w < workers; ++w) pool.emplace_back(work);
            for (auto& t : pool) t.join();
        }

        if (first_error) std::rethrow_exception(first_error);
        return results;
    }

    static SweepResult run_case(const SweepCase& c, const std::vector<Bar>& bars) {
        SweepResult r{};
        r.label = c.label;
        r.config = c.config;
        BacktestResult bt = BacktestRunner(c.config).run(bars);
        r.trade_count = static_cast<int>(bt.trades.size());
        if (!bt.trades.empty()) {
            r.summary = performance::aggregate(bt.trades);
            r.has_summary = true;
            r.expectancy = r.summary.expectancy_pct;
            r.max_drawdown = r.summary.max_drawdown_pct;
        }
        return r;
    }

private:
    std::vector<SweepCase> cases_;
};

namespace sweep {

// Trailing-stop, reward:risk, S/R lookback and round-number variants of base.
inline std::vector<SweepCase> default_grid(const BacktestConfig& base) {
    std::vector<SweepCase> grid;
    auto add = [&](const std::string& label, auto mutate) {
        BacktestConfig c = base;
        mutate(c.strategy);
        grid.push_back(SweepCase{label, c});
    };
    auto trail = [&](const std::string& label, double act, double dist) {
        add(label, [=](StrategyConfig& s) {
            s.use_trailing_stop = true;
            s.trail_activation_atr = act;
            s.trail_distance_atr = dist;
        });
    };
    auto rr = [&](const std::string& label, double stop, double target) {
        add(label, [=](StrategyConfig& s) {
            s.use_trailing_stop = false;
            s.stop_atr_mult = stop;
            s.target_atr_mult = target;
        });
    };

    add("No Trail (baseline)", [](StrategyConfig& s) { s.use_trailing_stop = false; });
    trail("Trail 0.5/0.2", 0.5, 0.2);
    trail("Trail 1.0/0.3", 1.0, 0.3);
    trail("Trail 1.0/0.5", 1.0, 0.5);
    trail("Trail 1.5/0.5", 1.5, 0.5);
    trail("Trail 1.5/0.75", 1.5, 0.75);
    trail("Trail 2.0/0.5 (at target)", 2.0, 0.5);
    rr("1:2 R:R", 1.0, 2.0);
    rr("1:3 R:R", 1.0, 3.0);
    rr("1.5:3 R:R", 1.5, 3.0);
    rr("2:4 R:R", 2.0, 4.0);
    add("12h S/R", [](StrategyConfig& s) {
        s.use_trailing_stop = false;
        s.sr_lookback = 12;
    });
    add("48h S/R", [](StrategyConfig& s) {
        s.use_trailing_stop = false;
        s.sr_lookback = 48;
    });
    add("No round #s", [](StrategyConfig& s) {
        s.use_trailing_stop = false;
        s.use_round_number_sr = false;
    });
    return grid;
}

// Highest total P&L first; cases without trades last. Stable for ties.
inline void sort_by_pnl(std::vector<SweepResult>& results) {
    std::stable_sort(results.begin(), results.end(),
                     [](const SweepResult& a, const SweepResult& b) {
                         if (a.has_summary != b.has_summary) return a.has_summary;
                         return a.summary.total_pnl_pct > b.summary.total_pnl_pct;
                     });
}

// a is at least as good on expectancy, trade count and drawdown, and
// strictly better on one of them.
template <typename T>
bool dominates(const T& a, const T& b) {
    return (a.expectancy >= b.expectancy &&
            a.trade_count >= b.trade_count &&
            a.max_drawdown <= b.max_drawdown) &&
           (a.expectancy > b.expectancy ||
            a.trade_count > b.trade_count ||
            a.max_drawdown < b.max_drawdown);
}

template <typename T>
std::vector<T> pareto_frontier(const std::vector<T>& results) {
    std::vector<T> frontier;
    for (size_t i = 0; i < results.size(); ++i) {
        bool is_dominated = false;
        for (size_t j = 0; j < results.size(); ++j) {
            if (i != j && dominates(results[j], results[i])) {
                is_dominated = true;
                break;
            }
        }
        if (!is_dominated) frontier.push_back(results[i]);
    }
    return frontier;
}

}  // namespace sweep
