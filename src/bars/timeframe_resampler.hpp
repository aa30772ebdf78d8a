#pragma once

#include "bars/bar.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// TimeframeResampler — aggregates fine bars into fixed UTC-aligned buckets
//
// Bucket k covers [k * interval, (k + 1) * interval). A bucket is emitted
// when the first bar of a later bucket arrives, so empty buckets (data gaps)
// produce no bar. Call flush() to get the last, possibly partial, bucket.
// ---------------------------------------------------------------------------
class TimeframeResampler {
public:
    explicit TimeframeResampler(int64_t interval_ms)
        : interval_ms_(interval_ms) {
        if (interval_ms_ <= 0) {
            throw std::invalid_argument("TimeframeResampler: interval must be positive");
        }
    }

    std::optional<Bar> on_bar(const Bar& bar) {
        if (active_ && bar.timestamp_ms <= last_ts_) {
            throw DataValidationError("TimeframeResampler: bars must be in timestamp order");
        }
        int64_t bucket = time_utils::floor_div(bar.timestamp_ms, interval_ms_) * interval_ms_;

        std::optional<Bar> done;
        if (active_ && bucket != current_.timestamp_ms) {
            done = current_;
            active_ = false;
        }

        if (!active_) {
            current_ = bar;
            current_.timestamp_ms = bucket;
            active_ = true;
        } else {
            current_.high = std::max(current_.high, bar.high);
            current_.low = std::min(current_.low, bar.low);
            current_.close = bar.close;
            current_.volume += bar.volume;
        }
        last_ts_ = bar.timestamp_ms;
        return done;
    }

    std::optional<Bar> flush() {
        if (!active_) return std::nullopt;
        active_ = false;
        return current_;
    }

    int64_t interval_ms() const { return interval_ms_; }

private:
    int64_t interval_ms_;
    bool active_ = false;
    int64_t last_ts_ = 0;
    Bar current_{};
};

namespace bar_util {

inline std::vector<Bar> resample(const std::vector<Bar>& bars, int64_t interval_ms) {
    TimeframeResampler r(interval_ms);
    std::vector<Bar> out;
    for (const auto& b : bars) {
        if (auto done = r.on_bar(b)) out.push_back(*done);
    }
    if (auto last = r.flush()) out.push_back(*last);
    return out;
}

}  // namespace bar_util
