#pragma once

#include "strategy/signal.hpp"

#include <cstdint>
#include <string>

enum class ExitReason { STOP, TARGET, TRAILING_STOP, RSI_EXIT, TIME_EXIT };

inline std::string exit_reason_str(ExitReason r) {
    switch (r) {
        case ExitReason::STOP:          return "stop";
        case ExitReason::TARGET:        return "target";
        case ExitReason::TRAILING_STOP: return "trailing_stop";
        case ExitReason::RSI_EXIT:      return "rsi_exit";
        case ExitReason::TIME_EXIT:     return "time_exit";
    }
    return "unknown";
}

struct TradeRecord {
    int entry_bar_idx = 0;
    int exit_bar_idx = 0;
    int64_t entry_ts = 0;
    int64_t exit_ts = 0;
    Direction direction = Direction::LONG;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double stop_price = 0.0;        // initial fixed stop
    double target_price = 0.0;
    double atr_at_entry = 0.0;
    ExitReason exit_reason = ExitReason::TIME_EXIT;
    bool truncated = false;         // forced out by the end of the data
    bool trail_activated = false;
    bool runner_mode = false;
    int bars_held = 0;
    double gross_pnl_pct = 0.0;
    double pnl_pct = 0.0;           // net of execution costs
};
