// backtest_runner_test.cpp — tests for the bars -> indicators -> signals ->
// trades pipeline: single-position gating, costs, determinism and the
// no-lookahead property of a full run

#include <gtest/gtest.h>

#include "backtest/backtest_runner.hpp"
#include "backtest/execution_costs.hpp"
#include "bars/bar.hpp"
#include "strategy/strategy_config.hpp"

#include "test_bar_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

using test_helpers::make_bar;

// Closes follow a 12-bar sine around 100; every trough and crest revisits
// the recent range, so touches recur throughout the series.
std::vector<Bar> make_oscillating_bars(int count, double amplitude = 5.0) {
    const double PI = 3.14159265358979323846;
    std::vector<Bar> bars;
    double prev_close = 100.0;
    for (int i = 0; i < count; ++i) {
        double close = 100.0 + amplitude * std::sin(2.0 * PI * i / 12.0);
        double open = prev_close;
        bars.push_back(make_bar(open, std::max(open, close) + 0.3,
                                std::min(open, close) - 0.3, close, i));
        prev_close = close;
    }
    return bars;
}

StrategyConfig range_config() {
    StrategyConfig cfg;
    cfg.use_trend_filter = false;
    cfg.use_round_number_sr = false;
    cfg.min_gap_bars = 0;
    return cfg;
}

}  // namespace

class BacktestRunnerTest : public ::testing::Test {
protected:
    std::vector<Bar> bars = make_oscillating_bars(120);
    StrategyConfig cfg = range_config();
};

TEST_F(BacktestRunnerTest, ProducesTradesOnRangingMarket) {
    BacktestRunner runner(cfg, ExecutionCosts{});
    auto result = runner.run(bars);
    EXPECT_EQ(result.bar_count, 120);
    EXPECT_GT(result.trades.size(), 0u);
    EXPECT_EQ(result.scan.bars_scanned, 120);
    EXPECT_EQ(result.scan.emitted, static_cast<int>(result.signals.size()));
}

TEST_F(BacktestRunnerTest, SignalsSplitIntoTradesAndSkips) {
    auto result = BacktestRunner(cfg, ExecutionCosts{}).run(bars);
    EXPECT_EQ(result.signals.size(),
              result.trades.size() + static_cast<size_t>(result.skipped_in_position));
    EXPECT_GT(result.skipped_in_position, 0);
}

TEST_F(BacktestRunnerTest, SinglePositionTradesNeverOverlap) {
    auto result = BacktestRunner(cfg, ExecutionCosts{}).run(bars);
    for (size_t k = 1; k < result.trades.size(); ++k) {
        EXPECT_GE(result.trades[k].entry_bar_idx, result.trades[k - 1].exit_bar_idx)
            << "trade " << k;
    }
}

TEST_F(BacktestRunnerTest, OverlappingPositionsTradeEverySignal) {
    auto single = BacktestRunner(cfg, ExecutionCosts{}).run(bars);
    cfg.single_position = false;
    auto multi = BacktestRunner(cfg, ExecutionCosts{}).run(bars);
    EXPECT_EQ(multi.skipped_in_position, 0);
    EXPECT_EQ(multi.trades.size(), multi.signals.size());
    EXPECT_GT(multi.trades.size(), single.trades.size());
}

TEST_F(BacktestRunnerTest, TradesExitAfterEntryUnlessTruncated) {
    auto result = BacktestRunner(cfg, ExecutionCosts{}).run(bars);
    for (const auto& t : result.trades) {
        if (t.truncated) {
            EXPECT_EQ(t.exit_bar_idx, result.bar_count - 1);
        } else {
            EXPECT_GT(t.exit_bar_idx, t.entry_bar_idx);
        }
    }
}

TEST_F(BacktestRunnerTest, CostsShiftEveryTradeByRoundTrip) {
    ExecutionCosts costs;
    costs.fee_pct_per_side = 0.04;
    costs.slippage_pct_per_side = 0.01;
    auto gross = BacktestRunner(cfg, ExecutionCosts{}).run(bars);
    auto net = BacktestRunner(cfg, costs).run(bars);
    ASSERT_EQ(gross.trades.size(), net.trades.size());
    for (size_t k = 0; k < net.trades.size(); ++k) {
        EXPECT_EQ(net.trades[k].exit_bar_idx, gross.trades[k].exit_bar_idx);
        EXPECT_NEAR(net.trades[k].pnl_pct, gross.trades[k].pnl_pct - 0.1, 1e-9);
    }
}

TEST_F(BacktestRunnerTest, RunIsDeterministic) {
    BacktestRunner runner(cfg, ExecutionCosts{});
    auto a = runner.run(bars);
    auto b = runner.run(bars);
    ASSERT_EQ(a.trades.size(), b.trades.size());
    for (size_t k = 0; k < a.trades.size(); ++k) {
        EXPECT_EQ(a.trades[k].entry_bar_idx, b.trades[k].entry_bar_idx);
        EXPECT_EQ(a.trades[k].exit_reason, b.trades[k].exit_reason);
        EXPECT_DOUBLE_EQ(a.trades[k].pnl_pct, b.trades[k].pnl_pct);
    }
}

TEST_F(BacktestRunnerTest, FutureBarsDoNotChangeClosedTrades) {
    auto full = BacktestRunner(cfg, ExecutionCosts{}).run(bars);
    std::vector<Bar> prefix(bars.begin(), bars.begin() + 70);
    auto partial = BacktestRunner(cfg, ExecutionCosts{}).run(prefix);

    ASSERT_LE(partial.trades.size(), full.trades.size());
    for (size_t k = 0; k < partial.trades.size(); ++k) {
        const auto& p = partial.trades[k];
        if (p.truncated) break;
        const auto& f = full.trades[k];
        EXPECT_EQ(p.entry_bar_idx, f.entry_bar_idx);
        EXPECT_EQ(p.exit_bar_idx, f.exit_bar_idx);
        EXPECT_EQ(p.exit_reason, f.exit_reason);
        EXPECT_DOUBLE_EQ(p.pnl_pct, f.pnl_pct);
    }
}

TEST_F(BacktestRunnerTest, SeriesShorterThanWarmupHasNoSignals) {
    std::vector<Bar> few(bars.begin(), bars.begin() + 8);
    auto result = BacktestRunner(cfg, ExecutionCosts{}).run(few);
    EXPECT_TRUE(result.signals.empty());
    EXPECT_TRUE(result.trades.empty());
    EXPECT_EQ(result.scan.undefined_skipped, 8);
}

TEST_F(BacktestRunnerTest, EmptySeriesThrows) {
    std::vector<Bar> none;
    EXPECT_THROW(BacktestRunner(cfg, ExecutionCosts{}).run(none), DataValidationError);
}

TEST_F(BacktestRunnerTest, MalformedBarsThrow) {
    bars[30].high = bars[30].low - 1.0;
    EXPECT_THROW(BacktestRunner(cfg, ExecutionCosts{}).run(bars), DataValidationError);
}

TEST_F(BacktestRunnerTest, InvalidConfigThrowsOnConstruction) {
    cfg.max_hold_bars = 0;
    EXPECT_THROW({ BacktestRunner runner(cfg, ExecutionCosts{}); }, std::invalid_argument);

    ExecutionCosts bad;
    bad.fee_pct_per_side = -0.1;
    EXPECT_THROW({ BacktestRunner runner(range_config(), bad); }, std::invalid_argument);
}

TEST_F(BacktestRunnerTest, RunBacktestMatchesRunner) {
    BacktestConfig config{cfg, ExecutionCosts{}};
    auto a = run_backtest(bars, config);
    auto b = BacktestRunner(config).run(bars);
    EXPECT_EQ(a.trades.size(), b.trades.size());
}

// ===========================================================================
// Scanner + simulator on a hand-built frame
// ===========================================================================
class SupportTouchScenarioTest : public ::testing::Test {};

TEST_F(SupportTouchScenarioTest, LongFromSupportClosesAtTarget) {
    // 100 quiet bars above a support of 99.5; bar 40 dips onto it and closes
    // at 100, then price climbs to 103 without revisiting 98.5.
    std::vector<Bar> bars;
    for (int i = 0; i < 100; ++i) bars.push_back(make_bar(100.6, 100.8, 100.4, 100.6, i));
    bars[40] = make_bar(100.3, 100.4, 99.5, 100.0, 40);
    bars[41] = make_bar(100.0, 101.0, 99.9, 100.9, 41);
    bars[42] = make_bar(100.9, 103.0, 100.8, 102.9, 42);
    for (int i = 43; i < 100; ++i) bars[i] = make_bar(102.9, 103.0, 102.8, 102.9, i);

    IndicatorFrame frame = test_helpers::make_frame(bars.size(), 1.0);
    for (auto& p : frame.points) {
        p.support = 99.5;
        p.resistance = 110.0;
    }

    StrategyConfig cfg;
    cfg.use_round_number_sr = false;
    cfg.sr_tolerance_pct = 0.0;
    cfg.stop_atr_mult = 1.5;
    cfg.target_atr_mult = 2.0;

    auto signals = scan_signals(bars, frame, cfg);
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].bar_index, 40);
    EXPECT_EQ(signals[0].direction, Direction::LONG);
    EXPECT_DOUBLE_EQ(signals[0].entry_price, 100.0);

    auto trade = simulate_trade(bars, frame, signals[0], cfg);
    EXPECT_DOUBLE_EQ(trade.stop_price, 98.5);
    EXPECT_EQ(trade.exit_reason, ExitReason::TARGET);
    EXPECT_DOUBLE_EQ(trade.exit_price, 102.0);
    EXPECT_EQ(trade.exit_bar_idx, 42);
    EXPECT_LE(trade.bars_held, cfg.max_hold_bars);
}
