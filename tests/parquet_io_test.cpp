// parquet_io_test.cpp — tests for Parquet bar input and trade-log output

#include <gtest/gtest.h>

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include "backtest/trade_record.hpp"
#include "bars/bar.hpp"
#include "io/parquet_io.hpp"

#include "test_bar_helpers.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

using test_helpers::MONDAY_2024_MS;
using test_helpers::MS_PER_HOUR;

std::string temp_parquet_path(const std::string& suffix) {
    return (std::filesystem::temp_directory_path() /
            ("srbounce_parquet_test" + suffix + ".parquet")).string();
}

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& path) {
    auto outfile = arrow::io::FileOutputStream::Open(path).ValueOrDie();
    auto status = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                             table->num_rows());
    ASSERT_TRUE(status.ok()) << status.ToString();
}

std::shared_ptr<arrow::Array> doubles(const std::vector<double>& values) {
    arrow::DoubleBuilder b;
    for (double v : values) (void)b.Append(v);
    std::shared_ptr<arrow::Array> arr;
    (void)b.Finish(&arr);
    return arr;
}

// Three hourly bars with the timestamp stored as timestamp[us] or as int64 ms.
std::shared_ptr<arrow::Table> make_bar_table(bool as_timestamp, bool with_volume = true,
                                             bool in_order = true) {
    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> ts_arr;

    std::vector<int64_t> ts = {MONDAY_2024_MS, MONDAY_2024_MS + MS_PER_HOUR,
                               MONDAY_2024_MS + 2 * MS_PER_HOUR};
    if (!in_order) std::swap(ts[0], ts[1]);
    if (as_timestamp) {
        auto type = arrow::timestamp(arrow::TimeUnit::MICRO);
        arrow::TimestampBuilder b(type, arrow::default_memory_pool());
        for (int64_t v : ts) (void)b.Append(v * 1000);
        (void)b.Finish(&ts_arr);
        fields.push_back(arrow::field("timestamp", type));
    } else {
        arrow::Int64Builder b;
        for (int64_t v : ts) (void)b.Append(v);
        (void)b.Finish(&ts_arr);
        fields.push_back(arrow::field("timestamp", arrow::int64()));
    }
    arrays.push_back(ts_arr);

    fields.push_back(arrow::field("open", arrow::float64()));
    arrays.push_back(doubles({100.0, 100.5, 101.0}));
    fields.push_back(arrow::field("high", arrow::float64()));
    arrays.push_back(doubles({101.0, 101.5, 102.0}));
    fields.push_back(arrow::field("low", arrow::float64()));
    arrays.push_back(doubles({99.5, 100.0, 100.5}));
    fields.push_back(arrow::field("close", arrow::float64()));
    arrays.push_back(doubles({100.5, 101.0, 101.5}));
    if (with_volume) {
        fields.push_back(arrow::field("volume", arrow::float64()));
        arrays.push_back(doubles({4.0, 5.0, 6.0}));
    }
    return arrow::Table::Make(arrow::schema(fields), arrays);
}

TradeRecord sample_trade(int hour, double pnl, ExitReason reason) {
    TradeRecord t{};
    t.entry_bar_idx = hour;
    t.exit_bar_idx = hour + 3;
    t.entry_ts = MONDAY_2024_MS + static_cast<int64_t>(hour) * MS_PER_HOUR;
    t.exit_ts = t.entry_ts + 3 * MS_PER_HOUR;
    t.direction = (pnl >= 0.0) ? Direction::LONG : Direction::SHORT;
    t.entry_price = 100.0;
    t.exit_price = 100.0 + pnl;
    t.atr_at_entry = 1.0;
    t.exit_reason = reason;
    t.bars_held = 3;
    t.pnl_pct = pnl;
    return t;
}

}  // namespace

// ===========================================================================
// 1. Reading bars
// ===========================================================================
class ParquetReadBarsTest : public ::testing::Test {
protected:
    std::string path = temp_parquet_path("_bars");

    void TearDown() override { std::remove(path.c_str()); }
};

TEST_F(ParquetReadBarsTest, ReadsTimestampColumn) {
    write_table(make_bar_table(true), path);
    auto bars = parquet_io::read_bars(path);
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].timestamp_ms, MONDAY_2024_MS);
    EXPECT_DOUBLE_EQ(bars[0].open, 100.0);
    EXPECT_DOUBLE_EQ(bars[0].volume, 4.0);
    EXPECT_EQ(bars[2].timestamp_ms, MONDAY_2024_MS + 2 * MS_PER_HOUR);
}

TEST_F(ParquetReadBarsTest, ReadsInt64MillisecondTimestamps) {
    write_table(make_bar_table(false), path);
    auto bars = parquet_io::read_bars(path);
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[1].timestamp_ms, MONDAY_2024_MS + MS_PER_HOUR);
    EXPECT_DOUBLE_EQ(bars[1].close, 101.0);
}

TEST_F(ParquetReadBarsTest, OutOfOrderRowsThrow) {
    write_table(make_bar_table(false, true, false), path);
    EXPECT_THROW(parquet_io::read_bars(path), DataValidationError);
}

TEST_F(ParquetReadBarsTest, NullTimestampThrows) {
    arrow::Int64Builder tb;
    (void)tb.Append(MONDAY_2024_MS);
    (void)tb.AppendNull();
    std::shared_ptr<arrow::Array> ts_arr;
    (void)tb.Finish(&ts_arr);
    auto schema = arrow::schema({arrow::field("timestamp", arrow::int64()),
                                 arrow::field("open", arrow::float64()),
                                 arrow::field("high", arrow::float64()),
                                 arrow::field("low", arrow::float64()),
                                 arrow::field("close", arrow::float64())});
    auto table = arrow::Table::Make(schema, {ts_arr, doubles({100.0, 100.5}),
                                             doubles({101.0, 101.5}), doubles({99.5, 100.0}),
                                             doubles({100.5, 101.0})});
    write_table(table, path);
    EXPECT_THROW(parquet_io::read_bars(path), DataValidationError);
}

TEST_F(ParquetReadBarsTest, VolumeIsOptional) {
    write_table(make_bar_table(false, false), path);
    auto bars = parquet_io::read_bars(path);
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_DOUBLE_EQ(bars[0].volume, 0.0);
}

TEST_F(ParquetReadBarsTest, MissingColumnThrows) {
    auto table = make_bar_table(false);
    auto without_close = table->RemoveColumn(table->schema()->GetFieldIndex("close")).ValueOrDie();
    write_table(without_close, path);
    EXPECT_THROW(parquet_io::read_bars(path), DataValidationError);
}

TEST_F(ParquetReadBarsTest, MissingFileThrows) {
    EXPECT_THROW(parquet_io::read_bars("/nonexistent/dir/bars.parquet"), std::runtime_error);
}

// ===========================================================================
// 2. Writing trades
// ===========================================================================
class ParquetWriteTradesTest : public ::testing::Test {
protected:
    std::string path = temp_parquet_path("_trades");

    void TearDown() override { std::remove(path.c_str()); }
};

TEST_F(ParquetWriteTradesTest, WritesOneRowPerTrade) {
    std::vector<TradeRecord> trades = {
        sample_trade(0, 2.0, ExitReason::TARGET),
        sample_trade(5, -1.5, ExitReason::STOP),
        sample_trade(9, 0.4, ExitReason::TRAILING_STOP),
    };
    parquet_io::write_trades(path, trades);

    auto table = parquet_io::read_table(path);
    EXPECT_EQ(table->num_rows(), 3);
    EXPECT_EQ(table->num_columns(), 12);

    auto reasons = std::static_pointer_cast<arrow::StringArray>(
        table->GetColumnByName("exit_reason")->chunk(0));
    EXPECT_EQ(reasons->GetString(1), "stop");

    auto pnl = std::static_pointer_cast<arrow::DoubleArray>(
        table->GetColumnByName("pnl_pct")->chunk(0));
    EXPECT_DOUBLE_EQ(pnl->Value(0), 2.0);
    EXPECT_DOUBLE_EQ(pnl->Value(1), -1.5);

    auto entry = std::static_pointer_cast<arrow::Int64Array>(
        table->GetColumnByName("entry_ts")->chunk(0));
    EXPECT_EQ(entry->Value(2), MONDAY_2024_MS + 9 * MS_PER_HOUR);
}

TEST_F(ParquetWriteTradesTest, EmptyTradeListWritesSchemaOnly) {
    parquet_io::write_trades(path, {});
    auto table = parquet_io::read_table(path);
    EXPECT_EQ(table->num_rows(), 0);
    EXPECT_EQ(table->num_columns(), 12);
}

TEST_F(ParquetWriteTradesTest, UnwritablePathThrows) {
    std::vector<TradeRecord> trades = {sample_trade(0, 1.0, ExitReason::TARGET)};
    EXPECT_THROW(parquet_io::write_trades("/nonexistent/dir/trades.parquet", trades),
                 std::runtime_error);
}
