#pragma once

#include "bars/bar.hpp"
#include "indicators/indicator_frame.hpp"
#include "strategy/strategy_config.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// Indicator engine
//
// Every value at index i is computed from bars[0..i] only. Truncating the
// series after i never changes the values up to i.
//
// ATR is the simple moving average of true range (not Wilder smoothing) and
// RSI is Cutler's variant (simple averages of gains and losses). Both choices
// keep each value a pure function of a fixed window.
// ---------------------------------------------------------------------------
namespace indicators {

// True range of bar i; needs the previous close so it is NaN at i == 0.
inline double true_range(const std::vector<Bar>& bars, int i) {
    if (i <= 0) return std::numeric_limits<double>::quiet_NaN();
    const auto& b = bars[i];
    double prev_close = bars[i - 1].close;
    return std::max({b.high - b.low,
                     std::abs(b.high - prev_close),
                     std::abs(b.low - prev_close)});
}

// Mean TR over bars (i - period, i]; defined from i == period.
inline double atr_at(const std::vector<Bar>& bars, int i, int period) {
    if (period < 1) throw std::invalid_argument("ATR period must be >= 1");
    if (i < period) return std::numeric_limits<double>::quiet_NaN();
    double sum = 0.0;
    for (int k = i - period + 1; k <= i; ++k) {
        sum += true_range(bars, k);
    }
    return sum / static_cast<double>(period);
}

// RSI over the last `period` close-to-close changes; defined from i == period.
inline double rsi_at(const std::vector<Bar>& bars, int i, int period) {
    if (period < 1) throw std::invalid_argument("RSI period must be >= 1");
    if (i < period) return std::numeric_limits<double>::quiet_NaN();

    double gains = 0.0;
    double losses = 0.0;
    for (int k = i - period + 1; k <= i; ++k) {
        double delta = bars[k].close - bars[k - 1].close;
        if (delta > 0.0) gains += delta;
        else losses -= delta;
    }
    double avg_gain = gains / static_cast<double>(period);
    double avg_loss = losses / static_cast<double>(period);

    if (avg_loss == 0.0) {
        return (avg_gain == 0.0) ? 50.0 : 100.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

// Min low / max high of the `lookback` bars before i (bar i excluded).
inline void levels_at(const std::vector<Bar>& bars, int i, int lookback,
                      double& support, double& resistance) {
    if (lookback < 1) throw std::invalid_argument("S/R lookback must be >= 1");
    if (i < lookback) {
        support = std::numeric_limits<double>::quiet_NaN();
        resistance = std::numeric_limits<double>::quiet_NaN();
        return;
    }
    support = bars[i - lookback].low;
    resistance = bars[i - lookback].high;
    for (int k = i - lookback + 1; k < i; ++k) {
        support = std::min(support, bars[k].low);
        resistance = std::max(resistance, bars[k].high);
    }
}

// Compare the two halves of the `lookback` bars ending at i (inclusive).
// UP needs a higher high, a higher low and a mean close that rose by more
// than deadband_pct percent; DOWN is the mirror image; anything else is FLAT.
inline Trend trend_at(const std::vector<Bar>& bars, int i, int lookback,
                      double deadband_pct) {
    if (lookback < 2) throw std::invalid_argument("Trend lookback must be >= 2");
    if (i + 1 < lookback) return Trend::UNDEFINED;

    int start = i - lookback + 1;
    int half = lookback / 2;
    int mid = start + half;  // first bar of the second half

    double first_high = bars[start].high, first_low = bars[start].low;
    double second_high = bars[mid].high, second_low = bars[mid].low;
    double first_sum = 0.0, second_sum = 0.0;

    for (int k = start; k < mid; ++k) {
        first_high = std::max(first_high, bars[k].high);
        first_low = std::min(first_low, bars[k].low);
        first_sum += bars[k].close;
    }
    for (int k = mid; k <= i; ++k) {
        second_high = std::max(second_high, bars[k].high);
        second_low = std::min(second_low, bars[k].low);
        second_sum += bars[k].close;
    }

    double first_avg = first_sum / static_cast<double>(half);
    double second_avg = second_sum / static_cast<double>(lookback - half);
    double change_pct = (second_avg - first_avg) / first_avg * 100.0;

    if (second_high > first_high && second_low > first_low && change_pct > deadband_pct) {
        return Trend::UP;
    }
    if (second_high < first_high && second_low < first_low && change_pct < -deadband_pct) {
        return Trend::DOWN;
    }
    return Trend::FLAT;
}

inline IndicatorPoint point_at(const std::vector<Bar>& bars, int i,
                               const StrategyConfig& cfg) {
    IndicatorPoint p{};
    p.atr = atr_at(bars, i, cfg.atr_period);
    p.rsi = rsi_at(bars, i, cfg.rsi_period);
    levels_at(bars, i, cfg.sr_lookback, p.support, p.resistance);
    p.trend = trend_at(bars, i, cfg.trend_lookback, cfg.trend_deadband_pct);
    return p;
}

// Throws DataValidationError on malformed bars, std::invalid_argument on
// a bad config.
inline IndicatorFrame compute(const std::vector<Bar>& bars, const StrategyConfig& cfg) {
    cfg.validate();
    bar_util::validate_bars(bars);
    IndicatorFrame frame;
    frame.points.reserve(bars.size());
    int n = static_cast<int>(bars.size());
    for (int i = 0; i < n; ++i) {
        frame.points.push_back(point_at(bars, i, cfg));
    }
    return frame;
}

}  // namespace indicators
