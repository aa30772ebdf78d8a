#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Bar — one OHLCV candle, timestamp is the bar open in UTC epoch milliseconds
// ---------------------------------------------------------------------------
struct Bar {
    int64_t timestamp_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

// ---------------------------------------------------------------------------
// DataValidationError — malformed or unusable bar input
// ---------------------------------------------------------------------------
class DataValidationError : public std::runtime_error {
public:
    explicit DataValidationError(const std::string& what)
        : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// BarGap — a hole between two consecutive bars that is larger than the
// expected interval. Gaps are reported, never filled.
// ---------------------------------------------------------------------------
struct BarGap {
    int before_idx = 0;          // index of the last bar before the hole
    int64_t from_ts_ms = 0;
    int64_t to_ts_ms = 0;
    int missing_bars = 0;
};

namespace bar_util {

// Throws DataValidationError on the first problem found.
inline void validate_bars(const std::vector<Bar>& bars) {
    if (bars.empty()) {
        throw DataValidationError("Bar series is empty");
    }
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& b = bars[i];
        std::string where = "bar " + std::to_string(i) +
                            " (ts=" + std::to_string(b.timestamp_ms) + ")";

        if (!std::isfinite(b.open) || !std::isfinite(b.high) ||
            !std::isfinite(b.low) || !std::isfinite(b.close)) {
            throw DataValidationError(where + ": non-finite OHLC value");
        }
        if (!std::isfinite(b.volume) || b.volume < 0.0) {
            throw DataValidationError(where + ": invalid volume");
        }
        if (b.low <= 0.0) {
            throw DataValidationError(where + ": non-positive price");
        }
        if (b.high < b.low) {
            throw DataValidationError(where + ": high below low");
        }
        if (b.high < std::max(b.open, b.close) || b.low > std::min(b.open, b.close)) {
            throw DataValidationError(where + ": open/close outside high-low range");
        }
        if (i > 0 && b.timestamp_ms <= bars[i - 1].timestamp_ms) {
            throw DataValidationError(where + ": timestamp not after previous bar");
        }
    }
}

// Most common spacing between consecutive bars (smallest wins a tie).
// Returns 0 when fewer than two bars.
inline int64_t infer_interval_ms(const std::vector<Bar>& bars) {
    if (bars.size() < 2) return 0;
    std::map<int64_t, int> counts;
    for (size_t i = 1; i < bars.size(); ++i) {
        counts[bars[i].timestamp_ms - bars[i - 1].timestamp_ms]++;
    }
    int64_t best = 0;
    int best_count = 0;
    for (const auto& [interval, count] : counts) {
        if (count > best_count) {
            best = interval;
            best_count = count;
        }
    }
    return best;
}

inline std::vector<BarGap> detect_gaps(const std::vector<Bar>& bars, int64_t interval_ms) {
    std::vector<BarGap> gaps;
    if (interval_ms <= 0) return gaps;
    for (size_t i = 1; i < bars.size(); ++i) {
        int64_t diff = bars[i].timestamp_ms - bars[i - 1].timestamp_ms;
        if (diff > interval_ms) {
            BarGap gap{};
            gap.before_idx = static_cast<int>(i - 1);
            gap.from_ts_ms = bars[i - 1].timestamp_ms;
            gap.to_ts_ms = bars[i].timestamp_ms;
            gap.missing_bars = static_cast<int>(diff / interval_ms) - 1;
            gaps.push_back(gap);
        }
    }
    return gaps;
}

}  // namespace bar_util
