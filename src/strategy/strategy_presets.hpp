#pragma once

#include "strategy/strategy_config.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Named parameter sets used for the published runs
// ---------------------------------------------------------------------------
namespace strategy_presets {

inline StrategyConfig defaults() {
    return StrategyConfig{};
}

// 5m bars, trail runner, tightened RSI band.
inline StrategyConfig validated() {
    StrategyConfig cfg;
    cfg.sr_lookback = 10;
    cfg.sr_tolerance_pct = 0.15;
    cfg.trend_lookback = 30;
    cfg.trend_mode = TrendMode::CONTRARIAN;
    cfg.stop_atr_mult = 1.5;
    cfg.target_atr_mult = 2.0;
    cfg.use_trailing_stop = true;
    cfg.trail_activation_atr = 1.0;
    cfg.trail_distance_atr = 0.3;
    cfg.use_runner_mode = true;
    cfg.max_hold_bars = 10;
    cfg.rsi_exit_high = 65.0;
    cfg.rsi_exit_low = 35.0;
    cfg.use_round_number_sr = true;
    return cfg;
}

// 1h bars: one day of S/R, three days of trend.
inline StrategyConfig hourly_base() {
    StrategyConfig cfg = validated();
    cfg.sr_lookback = 24;
    cfg.sr_tolerance_pct = 0.1;
    cfg.trend_lookback = 72;
    cfg.atr_period = 24;
    cfg.max_hold_bars = 24;
    cfg.min_gap_bars = 6;
    return cfg;
}

// DOT 1h, 2:4 reward:risk, no trailing, Fridays skipped.
inline StrategyConfig dot_2x4() {
    StrategyConfig cfg = hourly_base();
    cfg.sr_tolerance_pct = 0.0;
    cfg.sr_tolerance_atr = 0.5;
    cfg.stop_atr_mult = 2.0;
    cfg.target_atr_mult = 4.0;
    cfg.use_trailing_stop = false;
    cfg.use_runner_mode = false;
    cfg.use_round_number_sr = false;
    cfg.skip_friday = true;
    return cfg;
}

// Fixed round-number grids: BTC every 1000 (major 5000), ETH every 100
// (major 500).
inline StrategyConfig btc() {
    StrategyConfig cfg = validated();
    cfg.round_level_base = 1000.0;
    cfg.round_level_major = 5000.0;
    return cfg;
}

inline StrategyConfig eth() {
    StrategyConfig cfg = validated();
    cfg.round_level_base = 100.0;
    cfg.round_level_major = 500.0;
    return cfg;
}

inline std::vector<std::string> names() {
    return {"defaults", "validated", "hourly", "dot", "btc", "eth"};
}

inline StrategyConfig by_name(const std::string& name) {
    if (name == "defaults") return defaults();
    if (name == "validated") return validated();
    if (name == "hourly") return hourly_base();
    if (name == "dot") return dot_2x4();
    if (name == "btc") return btc();
    if (name == "eth") return eth();
    throw std::invalid_argument("Unknown preset: " + name);
}

}  // namespace strategy_presets
