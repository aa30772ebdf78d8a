// timeframe_resampler_test.cpp — tests for TimeframeResampler bucket
// alignment, OHLCV aggregation and gap handling

#include <gtest/gtest.h>

#include "bars/bar.hpp"
#include "bars/timeframe_resampler.hpp"

#include "test_bar_helpers.hpp"

#include <stdexcept>
#include <vector>

namespace {

using test_helpers::make_bar;
using test_helpers::MS_PER_HOUR;
using test_helpers::MONDAY_2024_MS;

constexpr int64_t FOUR_HOURS = 4 * MS_PER_HOUR;

}  // namespace

class TimeframeResamplerTest : public ::testing::Test {};

TEST_F(TimeframeResamplerTest, NonPositiveIntervalThrows) {
    EXPECT_THROW(TimeframeResampler(0), std::invalid_argument);
    EXPECT_THROW(TimeframeResampler(-MS_PER_HOUR), std::invalid_argument);
}

TEST_F(TimeframeResamplerTest, AggregatesOhlcv) {
    std::vector<Bar> hourly = {
        make_bar(100.0, 101.0, 99.5, 100.5, 0, 2.0),
        make_bar(100.5, 103.0, 100.0, 102.0, 1, 3.0),
        make_bar(102.0, 102.5, 98.0, 99.0, 2, 1.0),
        make_bar(99.0, 100.0, 98.5, 99.5, 3, 4.0),
    };
    auto out = bar_util::resample(hourly, FOUR_HOURS);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].timestamp_ms, MONDAY_2024_MS);
    EXPECT_DOUBLE_EQ(out[0].open, 100.0);
    EXPECT_DOUBLE_EQ(out[0].high, 103.0);
    EXPECT_DOUBLE_EQ(out[0].low, 98.0);
    EXPECT_DOUBLE_EQ(out[0].close, 99.5);
    EXPECT_DOUBLE_EQ(out[0].volume, 10.0);
}

TEST_F(TimeframeResamplerTest, BucketsAlignToUtcMultiples) {
    // Starts at 02:00, so the first 4h bucket [00:00, 04:00) is partial.
    std::vector<Bar> hourly;
    for (int i = 2; i < 10; ++i) hourly.push_back(make_bar(100.0, 101.0, 99.0, 100.0, i));
    auto out = bar_util::resample(hourly, FOUR_HOURS);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].timestamp_ms, MONDAY_2024_MS);
    EXPECT_EQ(out[1].timestamp_ms, MONDAY_2024_MS + FOUR_HOURS);
    EXPECT_EQ(out[2].timestamp_ms, MONDAY_2024_MS + 2 * FOUR_HOURS);
}

TEST_F(TimeframeResamplerTest, EmptyBucketsProduceNoBar) {
    std::vector<Bar> hourly = {
        make_bar(100.0, 101.0, 99.0, 100.0, 0),
        make_bar(100.0, 101.0, 99.0, 100.0, 1),
        make_bar(100.0, 101.0, 99.0, 100.0, 13),  // skips buckets 04:00 and 08:00
    };
    auto out = bar_util::resample(hourly, FOUR_HOURS);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].timestamp_ms - out[0].timestamp_ms, 3 * FOUR_HOURS);
}

TEST_F(TimeframeResamplerTest, StreamingEmitsOnBucketChange) {
    TimeframeResampler r(FOUR_HOURS);
    EXPECT_FALSE(r.on_bar(make_bar(100.0, 101.0, 99.0, 100.0, 0)).has_value());
    EXPECT_FALSE(r.on_bar(make_bar(100.0, 101.0, 99.0, 100.0, 3)).has_value());
    auto done = r.on_bar(make_bar(100.0, 101.0, 99.0, 100.0, 4));
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->timestamp_ms, MONDAY_2024_MS);

    auto last = r.flush();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->timestamp_ms, MONDAY_2024_MS + FOUR_HOURS);
    EXPECT_FALSE(r.flush().has_value());
}

TEST_F(TimeframeResamplerTest, OutOfOrderBarThrows) {
    TimeframeResampler r(FOUR_HOURS);
    r.on_bar(make_bar(100.0, 101.0, 99.0, 100.0, 2));
    EXPECT_THROW(r.on_bar(make_bar(100.0, 101.0, 99.0, 100.0, 1)), DataValidationError);
}

TEST_F(TimeframeResamplerTest, ResampledSeriesValidates) {
    auto hourly = test_helpers::make_bar_series(100.0, 120.0, 50, 0.2);
    auto out = bar_util::resample(hourly, FOUR_HOURS);
    EXPECT_EQ(out.size(), 13u);
    EXPECT_NO_THROW(bar_util::validate_bars(out));
}

TEST_F(TimeframeResamplerTest, EmptyInputGivesEmptyOutput) {
    std::vector<Bar> none;
    EXPECT_TRUE(bar_util::resample(none, FOUR_HOURS).empty());
}
