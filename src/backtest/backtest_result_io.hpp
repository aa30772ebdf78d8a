#pragma once

#include "backtest/backtest_runner.hpp"
#include "backtest/parameter_sweep.hpp"
#include "backtest/performance.hpp"
#include "backtest/period_breakdown.hpp"
#include "backtest/trade_record.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

// JSON has no infinities or NaN: +-inf become "inf"/"-inf", NaN becomes null.
inline std::string json_number(double v) {
    if (std::isnan(v)) return "null";
    if (std::isinf(v)) return v > 0 ? "\"inf\"" : "\"-inf\"";
    std::ostringstream ss;
    ss.precision(10);
    ss << v;
    return ss.str();
}

inline std::string format_float(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "Inf" : "-Inf";
    std::ostringstream ss;
    ss.precision(10);
    ss << v;
    return ss.str();
}

inline std::string to_json(const PerformanceSummary& s) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"trade_count\":" << s.trade_count;
    ss << ",\"winning_trades\":" << s.winning_trades;
    ss << ",\"losing_trades\":" << s.losing_trades;
    ss << ",\"flat_trades\":" << s.flat_trades;
    ss << ",\"win_rate\":" << json_number(s.win_rate);
    ss << ",\"gross_profit_pct\":" << json_number(s.gross_profit_pct);
    ss << ",\"gross_loss_pct\":" << json_number(s.gross_loss_pct);
    ss << ",\"profit_factor\":" << json_number(s.profit_factor);
    ss << ",\"total_pnl_pct\":" << json_number(s.total_pnl_pct);
    ss << ",\"expectancy_pct\":" << json_number(s.expectancy_pct);
    ss << ",\"max_drawdown_pct\":" << json_number(s.max_drawdown_pct);
    ss << ",\"sharpe\":" << json_number(s.sharpe);
    ss << ",\"avg_bars_held\":" << json_number(s.avg_bars_held);
    ss << ",\"best_trade_pct\":" << json_number(s.best_trade_pct);
    ss << ",\"worst_trade_pct\":" << json_number(s.worst_trade_pct);
    ss << ",\"truncated_count\":" << s.truncated_count;
    ss << ",\"exit_reasons\":{";
    bool first = true;
    for (const auto& [reason, count] : s.exit_reason_counts) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << exit_reason_str(reason) << "\":" << count;
    }
    ss << "}";
    ss << "}";
    return ss.str();
}

inline std::string to_json(const TradeRecord& t) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"entry_time\":\"" << time_utils::to_iso8601(t.entry_ts) << "\"";
    ss << ",\"exit_time\":\"" << time_utils::to_iso8601(t.exit_ts) << "\"";
    ss << ",\"direction\":\"" << direction_str(t.direction) << "\"";
    ss << ",\"entry_price\":" << json_number(t.entry_price);
    ss << ",\"exit_price\":" << json_number(t.exit_price);
    ss << ",\"stop_price\":" << json_number(t.stop_price);
    ss << ",\"target_price\":" << json_number(t.target_price);
    ss << ",\"atr\":" << json_number(t.atr_at_entry);
    ss << ",\"exit_reason\":\"" << exit_reason_str(t.exit_reason) << "\"";
    ss << ",\"bars_held\":" << t.bars_held;
    ss << ",\"pnl_pct\":" << json_number(t.pnl_pct);
    ss << ",\"truncated\":" << (t.truncated ? "true" : "false");
    ss << "}";
    return ss.str();
}

// Trades plus scan counters; the summary is omitted when there are no trades.
inline std::string to_json(const BacktestResult& result) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"bar_count\":" << result.bar_count;
    ss << ",\"signal_count\":" << result.signals.size();
    ss << ",\"skipped_in_position\":" << result.skipped_in_position;
    ss << ",\"scan\":{";
    ss << "\"bars_scanned\":" << result.scan.bars_scanned;
    ss << ",\"undefined_skipped\":" << result.scan.undefined_skipped;
    ss << ",\"touches\":" << result.scan.touches;
    ss << ",\"ambiguous_touches\":" << result.scan.ambiguous_touches;
    ss << ",\"filtered_by_trend\":" << result.scan.filtered_by_trend;
    ss << ",\"filtered_by_friday\":" << result.scan.filtered_by_friday;
    ss << ",\"filtered_by_session\":" << result.scan.filtered_by_session;
    ss << ",\"suppressed_by_gap\":" << result.scan.suppressed_by_gap;
    ss << ",\"emitted\":" << result.scan.emitted;
    ss << "}";
    if (!result.trades.empty()) {
        ss << ",\"summary\":" << to_json(performance::aggregate(result.trades));
    }
    ss << ",\"trades\":[";
    for (size_t i = 0; i < result.trades.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(result.trades[i]);
    }
    ss << "]";
    ss << "}";
    return ss.str();
}

template <typename Key, typename NameFn>
std::string breakdown_json(const std::map<Key, PerformanceSummary>& table, NameFn name) {
    std::ostringstream ss;
    ss << "{";
    bool first = true;
    for (const auto& [key, s] : table) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << json_escape(name(key)) << "\":" << to_json(s);
    }
    ss << "}";
    return ss.str();
}

inline std::string to_json(const BacktestReport& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"overall\":" << to_json(r.overall);
    ss << ",\"by_weekday\":"
       << breakdown_json(r.by_weekday, [](int wd) { return time_utils::weekday_name(wd); });
    ss << ",\"by_month\":"
       << breakdown_json(r.by_month, [](int m) { return std::to_string(m); });
    ss << ",\"by_session\":" << breakdown_json(r.by_session, time_utils::session_name);
    ss << ",\"by_direction\":" << breakdown_json(r.by_direction, direction_str);
    ss << ",\"by_exit_reason\":" << breakdown_json(r.by_exit_reason, exit_reason_str);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const std::vector<SweepResult>& results) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& r = results[i];
        const auto& s = r.config.strategy;
        ss << "{";
        ss << "\"label\":\"" << json_escape(r.label) << "\"";
        ss << ",\"use_trailing_stop\":" << (s.use_trailing_stop ? "true" : "false");
        ss << ",\"trail_activation_atr\":" << json_number(s.trail_activation_atr);
        ss << ",\"trail_distance_atr\":" << json_number(s.trail_distance_atr);
        ss << ",\"stop_atr_mult\":" << json_number(s.stop_atr_mult);
        ss << ",\"target_atr_mult\":" << json_number(s.target_atr_mult);
        ss << ",\"sr_lookback\":" << s.sr_lookback;
        ss << ",\"use_round_number_sr\":" << (s.use_round_number_sr ? "true" : "false");
        ss << ",\"trade_count\":" << r.trade_count;
        if (r.has_summary) ss << ",\"summary\":" << to_json(r.summary);
        ss << "}";
    }
    ss << "]";
    return ss.str();
}

inline void write_text(const std::string& path, const std::string& text) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    file << text << "\n";
}

inline std::string trades_csv_header() {
    return "entry_time,exit_time,direction,entry_price,exit_price,stop_price,"
           "target_price,atr,exit_reason,bars_held,gross_pnl_pct,pnl_pct,"
           "trail_activated,runner_mode,truncated";
}

inline std::string trade_csv_row(const TradeRecord& t) {
    std::ostringstream ss;
    ss << time_utils::to_iso8601(t.entry_ts);
    ss << "," << time_utils::to_iso8601(t.exit_ts);
    ss << "," << direction_str(t.direction);
    ss << "," << format_float(t.entry_price);
    ss << "," << format_float(t.exit_price);
    ss << "," << format_float(t.stop_price);
    ss << "," << format_float(t.target_price);
    ss << "," << format_float(t.atr_at_entry);
    ss << "," << exit_reason_str(t.exit_reason);
    ss << "," << t.bars_held;
    ss << "," << format_float(t.gross_pnl_pct);
    ss << "," << format_float(t.pnl_pct);
    ss << "," << (t.trail_activated ? 1 : 0);
    ss << "," << (t.runner_mode ? 1 : 0);
    ss << "," << (t.truncated ? 1 : 0);
    return ss.str();
}

inline void write_trades_csv(const std::string& path, const std::vector<TradeRecord>& trades) {
    std::ostringstream ss;
    ss << trades_csv_header();
    for (const auto& t : trades) {
        ss << "\n" << trade_csv_row(t);
    }
    write_text(path, ss.str());
}

}  // namespace backtest_io
