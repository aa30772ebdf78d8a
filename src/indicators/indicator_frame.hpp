#pragma once

#include <cmath>
#include <limits>
#include <string>
#include <vector>

enum class Trend { UNDEFINED, UP, DOWN, FLAT };

inline std::string trend_str(Trend t) {
    switch (t) {
        case Trend::UP:        return "up";
        case Trend::DOWN:      return "down";
        case Trend::FLAT:      return "flat";
        case Trend::UNDEFINED: return "undefined";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// IndicatorPoint — derived values for one bar. NaN / UNDEFINED until the
// lookback window of the indicator is full.
// ---------------------------------------------------------------------------
struct IndicatorPoint {
    double atr = std::numeric_limits<double>::quiet_NaN();
    double rsi = std::numeric_limits<double>::quiet_NaN();
    double support = std::numeric_limits<double>::quiet_NaN();
    double resistance = std::numeric_limits<double>::quiet_NaN();
    Trend trend = Trend::UNDEFINED;

    bool has_atr() const { return !std::isnan(atr); }
    bool has_rsi() const { return !std::isnan(rsi); }
    bool has_levels() const { return !std::isnan(support) && !std::isnan(resistance); }
    bool has_trend() const { return trend != Trend::UNDEFINED; }
};

// ---------------------------------------------------------------------------
// IndicatorFrame — one IndicatorPoint per input bar
// ---------------------------------------------------------------------------
struct IndicatorFrame {
    std::vector<IndicatorPoint> points;

    size_t size() const { return points.size(); }
    const IndicatorPoint& operator[](size_t i) const { return points[i]; }
};
