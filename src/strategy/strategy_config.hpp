#pragma once

#include "time_utils.hpp"

#include <cmath>
#include <set>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// TrendMode — how strictly the trend filter gates S/R touches
// ---------------------------------------------------------------------------
//   ALIGNED      long needs UP, short needs DOWN
//   NOT_OPPOSED  long needs UP or FLAT, short needs DOWN or FLAT
//   CONTRARIAN   like ALIGNED, plus FLAT entries when the last ct_bars moved
//                against the trade (down into support, up into resistance)
enum class TrendMode { ALIGNED, NOT_OPPOSED, CONTRARIAN };

inline std::string trend_mode_str(TrendMode m) {
    switch (m) {
        case TrendMode::ALIGNED:     return "aligned";
        case TrendMode::NOT_OPPOSED: return "not_opposed";
        case TrendMode::CONTRARIAN:  return "contrarian";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// StrategyConfig — every parameter of the S/R bounce strategy
// ---------------------------------------------------------------------------
struct StrategyConfig {
    // S/R detection
    int sr_lookback = 10;
    double sr_tolerance_pct = 0.1;     // % of close
    double sr_tolerance_atr = 0.0;     // multiples of ATR, added to the % tolerance

    // Trend filter
    int trend_lookback = 30;
    bool use_trend_filter = true;
    double trend_deadband_pct = 0.0;   // min % change of half-window mean close
    TrendMode trend_mode = TrendMode::NOT_OPPOSED;
    int ct_bars = 2;

    // ATR stops
    int atr_period = 14;
    double stop_atr_mult = 1.5;
    double target_atr_mult = 2.0;

    // Trailing stop / runner mode
    bool use_trailing_stop = true;
    double trail_activation_atr = 1.0;
    double trail_distance_atr = 0.3;
    bool use_runner_mode = false;

    // Holding rules
    int max_hold_bars = 10;
    int min_gap_bars = 5;
    bool single_position = true;

    // RSI exit
    int rsi_period = 14;
    bool use_rsi_exit = true;
    double rsi_exit_high = 70.0;       // exit longs above
    double rsi_exit_low = 30.0;        // exit shorts below

    // Calendar filters (UTC)
    bool skip_friday = false;
    bool use_session_filter = false;
    std::set<time_utils::Session> allowed_sessions = {
        time_utils::Session::EUROPE, time_utils::Session::US, time_utils::Session::OVERLAP};

    // Round-number S/R
    bool use_round_number_sr = true;
    double round_number_weight = 0.5;
    double round_level_base = 0.0;     // 0 = derive from price
    double round_level_major = 0.0;    // 0 = 5 x base

    // Bars needed before every indicator is defined.
    int warmup_bars() const {
        int w = sr_lookback;
        if (trend_lookback - 1 > w) w = trend_lookback - 1;
        if (atr_period > w) w = atr_period;
        if (rsi_period > w) w = rsi_period;
        return w;
    }

    // Throws std::invalid_argument naming the first bad field.
    void validate() const {
        auto require = [](bool ok, const std::string& msg) {
            if (!ok) throw std::invalid_argument("StrategyConfig: " + msg);
        };
        auto finite = [](double v) { return std::isfinite(v); };

        require(sr_lookback >= 1, "sr_lookback must be >= 1");
        require(trend_lookback >= 2, "trend_lookback must be >= 2");
        require(atr_period >= 1, "atr_period must be >= 1");
        require(rsi_period >= 1, "rsi_period must be >= 1");
        require(ct_bars >= 1, "ct_bars must be >= 1");
        require(max_hold_bars >= 1, "max_hold_bars must be >= 1");
        require(min_gap_bars >= 0, "min_gap_bars must be >= 0");

        require(finite(sr_tolerance_pct) && sr_tolerance_pct >= 0.0,
                "sr_tolerance_pct must be >= 0");
        require(finite(sr_tolerance_atr) && sr_tolerance_atr >= 0.0,
                "sr_tolerance_atr must be >= 0");
        require(finite(trend_deadband_pct) && trend_deadband_pct >= 0.0,
                "trend_deadband_pct must be >= 0");

        require(finite(stop_atr_mult) && stop_atr_mult > 0.0, "stop_atr_mult must be > 0");
        require(finite(target_atr_mult) && target_atr_mult > 0.0, "target_atr_mult must be > 0");
        require(finite(trail_activation_atr) && trail_activation_atr >= 0.0,
                "trail_activation_atr must be >= 0");
        require(finite(trail_distance_atr) && trail_distance_atr > 0.0,
                "trail_distance_atr must be > 0");

        require(finite(rsi_exit_high) && rsi_exit_high >= 0.0 && rsi_exit_high <= 100.0,
                "rsi_exit_high must be in [0, 100]");
        require(finite(rsi_exit_low) && rsi_exit_low >= 0.0 && rsi_exit_low <= 100.0,
                "rsi_exit_low must be in [0, 100]");
        require(rsi_exit_low < rsi_exit_high, "rsi_exit_low must be below rsi_exit_high");

        require(!use_session_filter || !allowed_sessions.empty(),
                "allowed_sessions must not be empty when use_session_filter is set");

        require(finite(round_number_weight) && round_number_weight >= 0.0 &&
                round_number_weight <= 1.0, "round_number_weight must be in [0, 1]");
        require(finite(round_level_base) && round_level_base >= 0.0,
                "round_level_base must be >= 0");
        require(finite(round_level_major) && round_level_major >= 0.0,
                "round_level_major must be >= 0");
    }
};
