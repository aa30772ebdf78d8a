#pragma once

#include "backtest/execution_costs.hpp"
#include "backtest/trade_record.hpp"
#include "bars/bar.hpp"
#include "indicators/indicator_frame.hpp"
#include "strategy/signal.hpp"
#include "strategy/strategy_config.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// TradeState — OPEN until exactly one terminal state is reached
// ---------------------------------------------------------------------------
enum class TradeState { OPEN, STOPPED, TARGET_HIT, TRAIL_STOPPED, RSI_EXITED, TIME_EXITED };

inline ExitReason exit_reason_for(TradeState s) {
    switch (s) {
        case TradeState::STOPPED:       return ExitReason::STOP;
        case TradeState::TARGET_HIT:    return ExitReason::TARGET;
        case TradeState::TRAIL_STOPPED: return ExitReason::TRAILING_STOP;
        case TradeState::RSI_EXITED:    return ExitReason::RSI_EXIT;
        case TradeState::TIME_EXITED:
        case TradeState::OPEN:          break;
    }
    return ExitReason::TIME_EXIT;
}

// Per-bar record of the stop in force while the trade was open.
struct SimulationTrace {
    std::vector<int> bar_idx;
    std::vector<double> effective_stop;
    std::vector<bool> trail_active;
};

// ---------------------------------------------------------------------------
// TradeSimulator — walks forward from a signal until the first exit fires
//
// Exit checks per bar, first match wins:
//   1. trailing stop (active trail only)   fill at the trail, or the open on a gap
//   2. fixed stop                          fill at the stop, or the open on a gap
//   3. target (not in runner mode)         fill at the target; with runner
//                                          mode and an active trail the
//                                          trade becomes a runner instead
//   4. RSI extreme (not in runner mode)    fill at the close
//   5. max_hold_bars reached               fill at the close
// All distances use the ATR frozen at entry. The trail is updated from a
// bar's favourable extreme only after that bar's exit checks, so it applies
// from the following bar on and never moves against the position.
// ---------------------------------------------------------------------------
class TradeSimulator {
public:
    TradeSimulator(const StrategyConfig& cfg, const ExecutionCosts& costs)
        : cfg_(cfg), costs_(costs) {
        cfg_.validate();
        costs_.validate();
    }

    TradeRecord simulate(const std::vector<Bar>& bars, const IndicatorFrame& frame,
                         const Signal& sig, SimulationTrace* trace = nullptr) const {
        int n = static_cast<int>(bars.size());
        if (frame.size() != bars.size()) {
            throw std::invalid_argument("IndicatorFrame size does not match bar count");
        }
        if (sig.bar_index < 0 || sig.bar_index >= n) {
            throw std::invalid_argument("Signal bar_index outside the bar series");
        }
        if (!std::isfinite(sig.atr_at_entry) || sig.atr_at_entry <= 0.0) {
            throw std::invalid_argument("Signal atr_at_entry must be positive");
        }

        const double sign = direction_sign(sig.direction);
        const double atr = sig.atr_at_entry;
        const double entry = sig.entry_price;
        const double trail_dist = cfg_.trail_distance_atr * atr;

        TradeRecord trade{};
        trade.entry_bar_idx = sig.bar_index;
        trade.entry_ts = sig.timestamp_ms;
        trade.direction = sig.direction;
        trade.entry_price = entry;
        trade.atr_at_entry = atr;
        trade.stop_price = entry - sign * cfg_.stop_atr_mult * atr;
        trade.target_price = entry + sign * cfg_.target_atr_mult * atr;

        TradeState state = TradeState::OPEN;
        bool trail_active = false;
        bool runner = false;
        double trail_stop = std::numeric_limits<double>::quiet_NaN();
        double best = entry;

        for (int j = sig.bar_index + 1; j < n && state == TradeState::OPEN; ++j) {
            const Bar& b = bars[j];
            double adverse = (sign > 0.0) ? b.low : b.high;
            double favorable = (sign > 0.0) ? b.high : b.low;

            if (trace) {
                trace->bar_idx.push_back(j);
                trace->effective_stop.push_back(trail_active ? trail_stop : trade.stop_price);
                trace->trail_active.push_back(trail_active);
            }

            double fill = 0.0;
            if (cfg_.use_trailing_stop && trail_active && crossed(adverse, trail_stop, sign)) {
                state = TradeState::TRAIL_STOPPED;
                fill = gap_fill(b.open, trail_stop, sign);
            } else if (crossed(adverse, trade.stop_price, sign)) {
                state = TradeState::STOPPED;
                fill = gap_fill(b.open, trade.stop_price, sign);
            } else {
                bool target_reached = !runner && sign * (favorable - trade.target_price) >= 0.0;
                if (target_reached && cfg_.use_runner_mode && trail_active) {
                    // Target reached under an active trail: let the trail run.
                    runner = true;
                    trade.runner_mode = true;
                    target_reached = false;
                }
                if (target_reached) {
                    state = TradeState::TARGET_HIT;
                    fill = trade.target_price;
                } else if (!runner && rsi_extreme(frame[j], sign)) {
                    state = TradeState::RSI_EXITED;
                    fill = b.close;
                } else if (j - sig.bar_index >= cfg_.max_hold_bars) {
                    state = TradeState::TIME_EXITED;
                    fill = b.close;
                }
            }

            if (state != TradeState::OPEN) {
                close_trade(trade, bars, j, fill, state);
                break;
            }

            if (cfg_.use_trailing_stop) {
                double profit = sign * (favorable - entry);
                if (!trail_active) {
                    if (profit >= cfg_.trail_activation_atr * atr) {
                        trail_active = true;
                        trade.trail_activated = true;
                        best = favorable;
                        double cand = best - sign * trail_dist;
                        // Never start the trail behind the fixed stop.
                        trail_stop = (sign > 0.0) ? std::max(cand, trade.stop_price)
                                                  : std::min(cand, trade.stop_price);
                    }
                } else if (sign * (favorable - best) > 0.0) {
                    best = favorable;
                    double cand = best - sign * trail_dist;
                    if (sign * (cand - trail_stop) > 0.0) trail_stop = cand;
                }
            }
        }

        if (state == TradeState::OPEN) {
            // Data ran out before any exit fired.
            close_trade(trade, bars, n - 1, bars[n - 1].close, TradeState::TIME_EXITED);
            trade.truncated = true;
        }
        return trade;
    }

    const StrategyConfig& config() const { return cfg_; }
    const ExecutionCosts& costs() const { return costs_; }

private:
    StrategyConfig cfg_;
    ExecutionCosts costs_;

    static bool crossed(double adverse, double level, double sign) {
        return sign * (adverse - level) <= 0.0;
    }

    // A bar that opens beyond the stop fills at its open.
    static double gap_fill(double open, double level, double sign) {
        return (sign > 0.0) ? std::min(open, level) : std::max(open, level);
    }

    bool rsi_extreme(const IndicatorPoint& p, double sign) const {
        if (!cfg_.use_rsi_exit || !p.has_rsi()) return false;
        if (sign > 0.0) return p.rsi > cfg_.rsi_exit_high;
        return p.rsi < cfg_.rsi_exit_low;
    }

    void close_trade(TradeRecord& trade, const std::vector<Bar>& bars, int exit_idx,
                     double exit_price, TradeState state) const {
        double sign = direction_sign(trade.direction);
        trade.exit_bar_idx = exit_idx;
        trade.exit_ts = bars[exit_idx].timestamp_ms;
        trade.exit_price = exit_price;
        trade.exit_reason = exit_reason_for(state);
        trade.bars_held = exit_idx - trade.entry_bar_idx;
        trade.gross_pnl_pct = sign * (exit_price - trade.entry_price) / trade.entry_price * 100.0;
        trade.pnl_pct = trade.gross_pnl_pct - costs_.round_trip_cost_pct();
    }
};

inline TradeRecord simulate_trade(const std::vector<Bar>& bars, const IndicatorFrame& frame,
                                  const Signal& sig, const StrategyConfig& cfg,
                                  const ExecutionCosts& costs = ExecutionCosts{},
                                  SimulationTrace* trace = nullptr) {
    return TradeSimulator(cfg, costs).simulate(bars, frame, sig, trace);
}
