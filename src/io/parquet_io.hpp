#pragma once

#include "backtest/trade_record.hpp"
#include "bars/bar.hpp"
#include "strategy/signal.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// parquet_io — OHLCV input and trade-log output in Parquet
// ---------------------------------------------------------------------------
namespace parquet_io {

inline std::shared_ptr<arrow::Table> read_table(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + path + " (" +
                                 open_result.status().ToString() + ")");
    }

    auto file_reader_result = parquet::arrow::OpenFile(
        open_result.ValueOrDie(), arrow::default_memory_pool());
    if (!file_reader_result.ok()) {
        throw std::runtime_error("Not a Parquet file: " + path + " (" +
                                 file_reader_result.status().ToString() + ")");
    }
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    auto status = reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Failed to read Parquet: " + status.ToString());
    }
    return table;
}

// Integer epoch values are milliseconds; timestamp columns are converted
// from their stored unit.
inline std::vector<int64_t> timestamp_column(const std::shared_ptr<arrow::ChunkedArray>& col) {
    std::vector<int64_t> out;
    for (int chunk = 0; chunk < col->num_chunks(); ++chunk) {
        auto chunk_arr = col->chunk(chunk);
        if (chunk_arr->null_count() > 0) {
            throw DataValidationError("Column 'timestamp' contains nulls");
        }
        if (auto ts = std::dynamic_pointer_cast<arrow::TimestampArray>(chunk_arr)) {
            auto unit = std::static_pointer_cast<arrow::TimestampType>(ts->type())->unit();
            for (int64_t i = 0; i < ts->length(); ++i) {
                int64_t v = ts->Value(i);
                switch (unit) {
                    case arrow::TimeUnit::SECOND: v *= 1000; break;
                    case arrow::TimeUnit::MILLI:  break;
                    case arrow::TimeUnit::MICRO:  v /= 1000; break;
                    case arrow::TimeUnit::NANO:   v /= 1000000; break;
                }
                out.push_back(v);
            }
        } else if (auto arr = std::dynamic_pointer_cast<arrow::Int64Array>(chunk_arr)) {
            for (int64_t i = 0; i < arr->length(); ++i) out.push_back(arr->Value(i));
        } else {
            throw DataValidationError("Unsupported timestamp column type: " +
                                      chunk_arr->type()->ToString());
        }
    }
    return out;
}

inline std::vector<double> numeric_column(const std::shared_ptr<arrow::ChunkedArray>& col,
                                          const std::string& name) {
    std::vector<double> out;
    for (int chunk = 0; chunk < col->num_chunks(); ++chunk) {
        auto chunk_arr = col->chunk(chunk);
        if (chunk_arr->null_count() > 0) {
            throw DataValidationError("Column '" + name + "' contains nulls");
        }
        if (auto d = std::dynamic_pointer_cast<arrow::DoubleArray>(chunk_arr)) {
            for (int64_t i = 0; i < d->length(); ++i) out.push_back(d->Value(i));
        } else if (auto f = std::dynamic_pointer_cast<arrow::FloatArray>(chunk_arr)) {
            for (int64_t i = 0; i < f->length(); ++i) out.push_back(f->Value(i));
        } else if (auto n = std::dynamic_pointer_cast<arrow::Int64Array>(chunk_arr)) {
            for (int64_t i = 0; i < n->length(); ++i) out.push_back(static_cast<double>(n->Value(i)));
        } else {
            throw DataValidationError("Unsupported type for column '" + name + "': " +
                                      chunk_arr->type()->ToString());
        }
    }
    return out;
}

// Columns: timestamp, open, high, low, close and optionally volume.
inline std::vector<Bar> read_bars(const std::string& path) {
    auto table = read_table(path);

    auto column = [&](const std::string& name) {
        auto col = table->GetColumnByName(name);
        if (!col) throw DataValidationError("Parquet file missing column: " + name);
        return col;
    };

    auto ts = timestamp_column(column("timestamp"));
    auto open = numeric_column(column("open"), "open");
    auto high = numeric_column(column("high"), "high");
    auto low = numeric_column(column("low"), "low");
    auto close = numeric_column(column("close"), "close");
    std::vector<double> volume;
    if (auto vcol = table->GetColumnByName("volume")) {
        volume = numeric_column(vcol, "volume");
    } else {
        volume.assign(ts.size(), 0.0);
    }

    std::vector<Bar> bars(ts.size());
    for (size_t i = 0; i < ts.size(); ++i) {
        bars[i].timestamp_ms = ts[i];
        bars[i].open = open[i];
        bars[i].high = high[i];
        bars[i].low = low[i];
        bars[i].close = close[i];
        bars[i].volume = volume[i];
    }
    bar_util::validate_bars(bars);
    return bars;
}

inline void write_trades(const std::string& path, const std::vector<TradeRecord>& trades) {
    arrow::FieldVector fields;
    fields.push_back(arrow::field("entry_ts", arrow::int64()));
    fields.push_back(arrow::field("exit_ts", arrow::int64()));
    fields.push_back(arrow::field("direction", arrow::utf8()));
    fields.push_back(arrow::field("entry_price", arrow::float64()));
    fields.push_back(arrow::field("exit_price", arrow::float64()));
    fields.push_back(arrow::field("stop_price", arrow::float64()));
    fields.push_back(arrow::field("target_price", arrow::float64()));
    fields.push_back(arrow::field("atr", arrow::float64()));
    fields.push_back(arrow::field("exit_reason", arrow::utf8()));
    fields.push_back(arrow::field("bars_held", arrow::int64()));
    fields.push_back(arrow::field("pnl_pct", arrow::float64()));
    fields.push_back(arrow::field("truncated", arrow::boolean()));
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;

    auto int_col = [&](auto get) {
        arrow::Int64Builder b;
        for (const auto& t : trades) (void)b.Append(get(t));
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    };
    auto dbl_col = [&](auto get) {
        arrow::DoubleBuilder b;
        for (const auto& t : trades) (void)b.Append(get(t));
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    };
    auto str_col = [&](auto get) {
        arrow::StringBuilder b;
        for (const auto& t : trades) (void)b.Append(get(t));
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    };

    int_col([](const TradeRecord& t) { return t.entry_ts; });
    int_col([](const TradeRecord& t) { return t.exit_ts; });
    str_col([](const TradeRecord& t) { return direction_str(t.direction); });
    dbl_col([](const TradeRecord& t) { return t.entry_price; });
    dbl_col([](const TradeRecord& t) { return t.exit_price; });
    dbl_col([](const TradeRecord& t) { return t.stop_price; });
    dbl_col([](const TradeRecord& t) { return t.target_price; });
    dbl_col([](const TradeRecord& t) { return t.atr_at_entry; });
    str_col([](const TradeRecord& t) { return exit_reason_str(t.exit_reason); });
    int_col([](const TradeRecord& t) { return static_cast<int64_t>(t.bars_held); });
    dbl_col([](const TradeRecord& t) { return t.pnl_pct; });
    {
        arrow::BooleanBuilder b;
        for (const auto& t : trades) (void)b.Append(t.truncated);
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    }

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, static_cast<int64_t>(trades.size()));
    auto status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile, chunk, props);
    if (!status.ok()) {
        throw std::runtime_error("Failed to write Parquet: " + status.ToString());
    }
}

}  // namespace parquet_io
