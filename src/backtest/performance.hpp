#pragma once

#include "backtest/trade_record.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

// ---------------------------------------------------------------------------
// InsufficientDataError — statistics requested over zero trades
// ---------------------------------------------------------------------------
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what)
        : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// PerformanceSummary — statistics of a non-empty trade list (P&L in percent)
// ---------------------------------------------------------------------------
struct PerformanceSummary {
    int trade_count = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    int flat_trades = 0;
    double win_rate = 0.0;             // wins / trade_count, in [0, 1]
    double gross_profit_pct = 0.0;
    double gross_loss_pct = 0.0;       // positive magnitude
    double profit_factor = 0.0;        // +inf without losers, NaN if all flat
    double total_pnl_pct = 0.0;
    double expectancy_pct = 0.0;
    double max_drawdown_pct = 0.0;     // positive magnitude
    double sharpe = 0.0;               // per-trade mean / stddev
    double avg_bars_held = 0.0;
    double best_trade_pct = 0.0;
    double worst_trade_pct = 0.0;
    int truncated_count = 0;
    std::map<ExitReason, int> exit_reason_counts;
};

namespace performance {

// Trades in realisation order: exit time, then entry time.
inline std::vector<TradeRecord> in_time_order(const std::vector<TradeRecord>& trades) {
    std::vector<TradeRecord> ordered = trades;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TradeRecord& a, const TradeRecord& b) {
                         if (a.exit_ts != b.exit_ts) return a.exit_ts < b.exit_ts;
                         return a.entry_ts < b.entry_ts;
                     });
    return ordered;
}

// Largest peak-to-trough decline of the cumulative P&L curve starting at 0.
inline double max_drawdown_pct(const std::vector<TradeRecord>& trades) {
    double equity = 0.0;
    double peak = 0.0;
    double max_dd = 0.0;
    for (const auto& t : in_time_order(trades)) {
        equity += t.pnl_pct;
        if (equity > peak) peak = equity;
        max_dd = std::max(max_dd, peak - equity);
    }
    return max_dd;
}

inline double profit_factor(double gross_profit, double gross_loss) {
    if (gross_loss > 0.0) return gross_profit / gross_loss;
    if (gross_profit > 0.0) return std::numeric_limits<double>::infinity();
    return std::numeric_limits<double>::quiet_NaN();
}

inline double sharpe(const std::vector<TradeRecord>& trades, double mean) {
    if (trades.size() < 2) return 0.0;
    double sum_sq = 0.0;
    for (const auto& t : trades) {
        double d = t.pnl_pct - mean;
        sum_sq += d * d;
    }
    double stddev = std::sqrt(sum_sq / static_cast<double>(trades.size() - 1));
    return (stddev > 0.0) ? mean / stddev : 0.0;
}

// Throws InsufficientDataError on an empty trade list.
inline PerformanceSummary aggregate(const std::vector<TradeRecord>& trades) {
    if (trades.empty()) {
        throw InsufficientDataError("No trades to aggregate");
    }

    PerformanceSummary s{};
    s.trade_count = static_cast<int>(trades.size());
    s.best_trade_pct = trades.front().pnl_pct;
    s.worst_trade_pct = trades.front().pnl_pct;

    double sum_bars = 0.0;
    for (const auto& t : trades) {
        s.total_pnl_pct += t.pnl_pct;
        sum_bars += static_cast<double>(t.bars_held);
        s.exit_reason_counts[t.exit_reason]++;
        if (t.truncated) s.truncated_count++;
        s.best_trade_pct = std::max(s.best_trade_pct, t.pnl_pct);
        s.worst_trade_pct = std::min(s.worst_trade_pct, t.pnl_pct);

        if (t.pnl_pct > 0.0) {
            s.winning_trades++;
            s.gross_profit_pct += t.pnl_pct;
        } else if (t.pnl_pct < 0.0) {
            s.losing_trades++;
            s.gross_loss_pct -= t.pnl_pct;
        } else {
            s.flat_trades++;
        }
    }

    double n = static_cast<double>(s.trade_count);
    s.win_rate = static_cast<double>(s.winning_trades) / n;
    s.expectancy_pct = s.total_pnl_pct / n;
    s.avg_bars_held = sum_bars / n;
    s.profit_factor = profit_factor(s.gross_profit_pct, s.gross_loss_pct);
    s.max_drawdown_pct = max_drawdown_pct(trades);
    s.sharpe = sharpe(trades, s.expectancy_pct);
    return s;
}

// Partition by key_fn and aggregate each non-empty partition.
template <typename KeyFn,
          typename Key = std::decay_t<std::invoke_result_t<KeyFn, const TradeRecord&>>>
std::map<Key, PerformanceSummary> aggregate_by(const std::vector<TradeRecord>& trades,
                                               KeyFn key_fn) {
    std::map<Key, std::vector<TradeRecord>> bucketed;
    for (const auto& t : trades) {
        bucketed[key_fn(t)].push_back(t);
    }
    std::map<Key, PerformanceSummary> result;
    for (const auto& [key, group] : bucketed) {
        result[key] = aggregate(group);
    }
    return result;
}

}  // namespace performance
