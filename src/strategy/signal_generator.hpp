#pragma once

#include "bars/bar.hpp"
#include "indicators/indicator_frame.hpp"
#include "indicators/round_levels.hpp"
#include "strategy/signal.hpp"
#include "strategy/strategy_config.hpp"
#include "time_utils.hpp"

#include <optional>
#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// ScanStats — why candidate bars did not become signals
// ---------------------------------------------------------------------------
struct ScanStats {
    int bars_scanned = 0;
    int undefined_skipped = 0;     // a required indicator still warming up
    int touches = 0;               // bars touching exactly one level
    int ambiguous_touches = 0;     // bars spanning support and resistance
    int filtered_by_trend = 0;
    int filtered_by_friday = 0;
    int filtered_by_session = 0;
    int suppressed_by_gap = 0;
    int emitted = 0;
};

// ---------------------------------------------------------------------------
// SignalScanner — lazy, restartable scan of a bar series for S/R bounces
//
// Holds references to bars and frame; both must outlive the scanner.
// ---------------------------------------------------------------------------
class SignalScanner {
public:
    SignalScanner(const std::vector<Bar>& bars, const IndicatorFrame& frame,
                  const StrategyConfig& cfg)
        : bars_(bars), frame_(frame), cfg_(cfg) {
        cfg_.validate();
        bar_util::validate_bars(bars_);
        if (frame_.size() != bars_.size()) {
            throw std::invalid_argument("IndicatorFrame size does not match bar count");
        }
    }

    // Next signal in bar order, or nullopt once the series is exhausted.
    std::optional<Signal> next() {
        int n = static_cast<int>(bars_.size());
        while (cursor_ < n) {
            int i = cursor_++;
            ++stats_.bars_scanned;
            auto sig = evaluate(i);
            if (sig.has_value()) {
                last_emitted_ = i;
                ++stats_.emitted;
                return sig;
            }
        }
        return std::nullopt;
    }

    // Restart from bar 0; the replay is identical.
    void reset() {
        cursor_ = 0;
        last_emitted_ = -1;
        stats_ = ScanStats{};
    }

    const ScanStats& stats() const { return stats_; }

private:
    const std::vector<Bar>& bars_;
    const IndicatorFrame& frame_;
    StrategyConfig cfg_;

    int cursor_ = 0;
    int last_emitted_ = -1;
    ScanStats stats_;

    std::optional<Signal> evaluate(int i) {
        const Bar& bar = bars_[i];
        const IndicatorPoint& ind = frame_[i];

        if (!ind.has_atr() || !ind.has_levels() ||
            (cfg_.use_trend_filter && !ind.has_trend())) {
            ++stats_.undefined_skipped;
            return std::nullopt;
        }
        if (ind.atr <= 0.0) {
            ++stats_.undefined_skipped;
            return std::nullopt;
        }

        double support = ind.support;
        double resistance = ind.resistance;
        if (cfg_.use_round_number_sr) {
            auto lv = indicators::round_levels(bar.close, cfg_.round_level_base,
                                               cfg_.round_level_major);
            double w = cfg_.round_number_weight;
            support = indicators::blend_level(support, lv.nearest_below(bar.close), w);
            resistance = indicators::blend_level(resistance, lv.nearest_above(bar.close), w);
        }

        double tolerance = bar.close * (cfg_.sr_tolerance_pct / 100.0)
                           + ind.atr * cfg_.sr_tolerance_atr;
        bool near_support = bar.low <= support + tolerance;
        bool near_resistance = bar.high >= resistance - tolerance;

        if (!near_support && !near_resistance) return std::nullopt;
        if (near_support && near_resistance) {
            ++stats_.ambiguous_touches;
            return std::nullopt;
        }
        ++stats_.touches;

        Direction dir = near_support ? Direction::LONG : Direction::SHORT;
        Trend trend = cfg_.use_trend_filter ? ind.trend : Trend::FLAT;
        if (!trend_allows(dir, trend, i)) {
            ++stats_.filtered_by_trend;
            return std::nullopt;
        }

        if (cfg_.skip_friday && time_utils::weekday_utc(bar.timestamp_ms) == time_utils::FRIDAY) {
            ++stats_.filtered_by_friday;
            return std::nullopt;
        }
        if (cfg_.use_session_filter) {
            auto session = time_utils::classify_session(time_utils::hour_utc(bar.timestamp_ms));
            if (cfg_.allowed_sessions.count(session) == 0) {
                ++stats_.filtered_by_session;
                return std::nullopt;
            }
        }

        if (last_emitted_ >= 0 && i - last_emitted_ < cfg_.min_gap_bars) {
            ++stats_.suppressed_by_gap;
            return std::nullopt;
        }

        Signal sig{};
        sig.bar_index = i;
        sig.timestamp_ms = bar.timestamp_ms;
        sig.direction = dir;
        sig.entry_price = bar.close;
        sig.reference_level = (dir == Direction::LONG) ? support : resistance;
        sig.atr_at_entry = ind.atr;
        sig.rsi_at_entry = ind.rsi;
        sig.trend = ind.trend;
        return sig;
    }

    bool trend_allows(Direction dir, Trend trend, int i) const {
        bool is_long = (dir == Direction::LONG);
        bool aligned = is_long ? (trend == Trend::UP) : (trend == Trend::DOWN);
        bool opposed = is_long ? (trend == Trend::DOWN) : (trend == Trend::UP);

        // With the trend filter off only the contrarian confirmation remains.
        TrendMode mode = cfg_.trend_mode;
        if (!cfg_.use_trend_filter && mode != TrendMode::CONTRARIAN) {
            mode = TrendMode::NOT_OPPOSED;
        }

        switch (mode) {
            case TrendMode::ALIGNED:
                return aligned;
            case TrendMode::NOT_OPPOSED:
                return !opposed;
            case TrendMode::CONTRARIAN:
                if (aligned) return true;
                if (trend != Trend::FLAT) return false;
                return contrarian_move(i) == (is_long ? -1 : 1);
        }
        return false;
    }

    // Sign of the net move over the last ct_bars (open of the first to close
    // of bar i): +1 up, -1 down, 0 unchanged or not enough history.
    int contrarian_move(int i) const {
        int first = i - cfg_.ct_bars + 1;
        if (first < 0) return 0;
        double move = bars_[i].close - bars_[first].open;
        if (move > 0.0) return 1;
        if (move < 0.0) return -1;
        return 0;
    }
};

// Collect every signal of a fresh scan.
inline std::vector<Signal> scan_signals(const std::vector<Bar>& bars,
                                        const IndicatorFrame& frame,
                                        const StrategyConfig& cfg,
                                        ScanStats* stats = nullptr) {
    SignalScanner scanner(bars, frame, cfg);
    std::vector<Signal> signals;
    while (auto sig = scanner.next()) {
        signals.push_back(*sig);
    }
    if (stats) *stats = scanner.stats();
    return signals;
}
