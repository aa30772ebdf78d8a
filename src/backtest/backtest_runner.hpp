#pragma once

#include "backtest/execution_costs.hpp"
#include "backtest/trade_record.hpp"
#include "backtest/trade_simulator.hpp"
#include "bars/bar.hpp"
#include "indicators/indicator_engine.hpp"
#include "strategy/signal.hpp"
#include "strategy/signal_generator.hpp"
#include "strategy/strategy_config.hpp"

#include <vector>

// ---------------------------------------------------------------------------
// BacktestConfig — strategy parameters plus execution costs
// ---------------------------------------------------------------------------
struct BacktestConfig {
    StrategyConfig strategy;
    ExecutionCosts costs;
};

// ---------------------------------------------------------------------------
// BacktestResult — every trade of one run with its scan statistics
// ---------------------------------------------------------------------------
struct BacktestResult {
    std::vector<TradeRecord> trades;
    std::vector<Signal> signals;           // all emitted signals, traded or not
    ScanStats scan;
    int skipped_in_position = 0;           // signals while a trade was open
    int bar_count = 0;
};

// ---------------------------------------------------------------------------
// BacktestRunner — bars -> indicators -> signals -> trades
// ---------------------------------------------------------------------------
class BacktestRunner {
public:
    explicit BacktestRunner(const BacktestConfig& config)
        : config_(config) {
        config_.strategy.validate();
        config_.costs.validate();
    }

    BacktestRunner(const StrategyConfig& strategy, const ExecutionCosts& costs)
        : BacktestRunner(BacktestConfig{strategy, costs}) {}

    // Throws DataValidationError on a malformed series.
    BacktestResult run(const std::vector<Bar>& bars) const {
        bar_util::validate_bars(bars);

        BacktestResult result{};
        result.bar_count = static_cast<int>(bars.size());

        IndicatorFrame frame = indicators::compute(bars, config_.strategy);
        SignalScanner scanner(bars, frame, config_.strategy);
        TradeSimulator sim(config_.strategy, config_.costs);

        int busy_until = -1;  // exit bar of the open trade
        while (auto sig = scanner.next()) {
            result.signals.push_back(*sig);
            if (config_.strategy.single_position && sig->bar_index < busy_until) {
                result.skipped_in_position++;
                continue;
            }
            TradeRecord trade = sim.simulate(bars, frame, *sig);
            busy_until = trade.exit_bar_idx;
            result.trades.push_back(trade);
        }

        result.scan = scanner.stats();
        return result;
    }

    const BacktestConfig& config() const { return config_; }

private:
    BacktestConfig config_;
};

inline BacktestResult run_backtest(const std::vector<Bar>& bars,
                                   const BacktestConfig& config) {
    return BacktestRunner(config).run(bars);
}
