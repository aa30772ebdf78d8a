#pragma once

#include "indicators/indicator_frame.hpp"

#include <cstdint>
#include <string>

enum class Direction : int { LONG = 1, SHORT = -1 };

inline double direction_sign(Direction d) {
    return static_cast<double>(static_cast<int>(d));
}

inline std::string direction_str(Direction d) {
    return (d == Direction::LONG) ? "long" : "short";
}

// ---------------------------------------------------------------------------
// Signal — an entry candidate at the close of bar `bar_index`
// ---------------------------------------------------------------------------
struct Signal {
    int bar_index = 0;
    int64_t timestamp_ms = 0;
    Direction direction = Direction::LONG;
    double entry_price = 0.0;
    double reference_level = 0.0;   // effective support (long) or resistance (short)
    double atr_at_entry = 0.0;
    double rsi_at_entry = 0.0;      // NaN while RSI is warming up
    Trend trend = Trend::UNDEFINED;
};
