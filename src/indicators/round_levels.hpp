#pragma once

#include <cmath>
#include <limits>
#include <vector>

// ---------------------------------------------------------------------------
// Round-number ("psychological") price levels around a price
// ---------------------------------------------------------------------------
namespace indicators {

struct RoundLevels {
    double minor_below = 0.0;
    double minor_above = 0.0;
    double major_below = 0.0;
    double major_above = 0.0;

    std::vector<double> all() const {
        return {minor_below, minor_above, major_below, major_above};
    }

    // Closest level strictly below price, NaN if none.
    double nearest_below(double price) const {
        double best = std::numeric_limits<double>::quiet_NaN();
        for (double lvl : all()) {
            if (lvl < price && (std::isnan(best) || lvl > best)) best = lvl;
        }
        return best;
    }

    // Closest level strictly above price, NaN if none.
    double nearest_above(double price) const {
        double best = std::numeric_limits<double>::quiet_NaN();
        for (double lvl : all()) {
            if (lvl > price && (std::isnan(best) || lvl < best)) best = lvl;
        }
        return best;
    }
};

// One significant digit of 1% of price: 65000 -> 700, 5.12 -> 0.05.
inline double auto_round_step(double price) {
    double raw = price * 0.01;
    if (!(raw > 0.0)) return 0.0;
    int digits = -static_cast<int>(std::floor(std::log10(raw)));
    double scale = std::pow(10.0, digits);
    return std::round(raw * scale) / scale;
}

// base/major of 0 select the automatic step (major = 5 x base).
inline RoundLevels round_levels(double price, double base = 0.0, double major = 0.0) {
    if (base <= 0.0) base = auto_round_step(price);
    if (major <= 0.0) major = base * 5.0;

    RoundLevels lv{};
    if (base <= 0.0) return lv;

    lv.minor_below = std::floor(price / base) * base;
    lv.minor_above = lv.minor_below + base;
    lv.major_below = std::floor(price / major) * major;
    lv.major_above = lv.major_below + major;
    return lv;
}

// Weighted blend of a bar-derived level with a round level; the bar level
// is kept unchanged when no round level exists on that side.
inline double blend_level(double bar_level, double round_level, double weight) {
    if (std::isnan(round_level)) return bar_level;
    return bar_level * (1.0 - weight) + round_level * weight;
}

}  // namespace indicators
