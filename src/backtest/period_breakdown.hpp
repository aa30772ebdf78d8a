#pragma once

#include "backtest/performance.hpp"
#include "backtest/trade_record.hpp"
#include "time_utils.hpp"

#include <map>
#include <vector>

// ---------------------------------------------------------------------------
// Partition keys — all keyed on the entry bar's UTC timestamp
// ---------------------------------------------------------------------------
namespace period_key {

inline int weekday(const TradeRecord& t) { return time_utils::weekday_utc(t.entry_ts); }
inline int month(const TradeRecord& t) { return time_utils::month_int(t.entry_ts); }
inline int hour(const TradeRecord& t) { return time_utils::hour_utc(t.entry_ts); }

inline time_utils::Session session(const TradeRecord& t) {
    return time_utils::classify_session(time_utils::hour_utc(t.entry_ts));
}

inline Direction direction(const TradeRecord& t) { return t.direction; }
inline ExitReason exit_reason(const TradeRecord& t) { return t.exit_reason; }

}  // namespace period_key

// ---------------------------------------------------------------------------
// BacktestReport — overall statistics plus breakdown tables
// ---------------------------------------------------------------------------
struct BacktestReport {
    PerformanceSummary overall;
    std::map<int, PerformanceSummary> by_weekday;
    std::map<int, PerformanceSummary> by_month;
    std::map<time_utils::Session, PerformanceSummary> by_session;
    std::map<Direction, PerformanceSummary> by_direction;
    std::map<ExitReason, PerformanceSummary> by_exit_reason;
};

namespace performance {

// Throws InsufficientDataError on an empty trade list.
inline BacktestReport build_report(const std::vector<TradeRecord>& trades) {
    BacktestReport r;
    r.overall = aggregate(trades);
    r.by_weekday = aggregate_by(trades, period_key::weekday);
    r.by_month = aggregate_by(trades, period_key::month);
    r.by_session = aggregate_by(trades, period_key::session);
    r.by_direction = aggregate_by(trades, period_key::direction);
    r.by_exit_reason = aggregate_by(trades, period_key::exit_reason);
    return r;
}

// Weekday whose trades sum to the lowest P&L; -1 if the map is empty.
inline int worst_weekday(const std::map<int, PerformanceSummary>& by_weekday) {
    int worst = -1;
    double worst_pnl = 0.0;
    for (const auto& [wd, s] : by_weekday) {
        if (worst < 0 || s.total_pnl_pct < worst_pnl) {
            worst = wd;
            worst_pnl = s.total_pnl_pct;
        }
    }
    return worst;
}

}  // namespace performance
