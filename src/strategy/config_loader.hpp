#pragma once

#include "backtest/backtest_runner.hpp"
#include "strategy/strategy_config.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// config_loader — "key = value" files and command-line overrides
//
//   # comment
//   sr_lookback = 24
//   trend_mode = contrarian
//   allowed_sessions = europe,us
//   fee_pct = 0.05
//
// Keys are StrategyConfig field names plus fee_pct / slippage_pct for
// ExecutionCosts. Unknown keys and unparsable values throw
// std::invalid_argument; the result is validated after all keys apply.
// ---------------------------------------------------------------------------
namespace config_loader {

inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline int parse_int(const std::string& key, const std::string& v) {
    char* end = nullptr;
    errno = 0;
    long x = std::strtol(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0') {
        throw std::invalid_argument("Config: '" + key + "' expects an integer, got '" + v + "'");
    }
    if (errno == ERANGE || x < INT_MIN || x > INT_MAX) {
        throw std::invalid_argument("Config: '" + key + "' is out of range: '" + v + "'");
    }
    return static_cast<int>(x);
}

inline double parse_double(const std::string& key, const std::string& v) {
    char* end = nullptr;
    double x = std::strtod(v.c_str(), &end);
    if (v.empty() || *end != '\0') {
        throw std::invalid_argument("Config: '" + key + "' expects a number, got '" + v + "'");
    }
    return x;
}

inline bool parse_bool(const std::string& key, const std::string& v) {
    std::string l = lower(v);
    if (l == "true" || l == "1" || l == "yes" || l == "on") return true;
    if (l == "false" || l == "0" || l == "no" || l == "off") return false;
    throw std::invalid_argument("Config: '" + key + "' expects a boolean, got '" + v + "'");
}

inline TrendMode parse_trend_mode(const std::string& key, const std::string& v) {
    std::string l = lower(v);
    if (l == "aligned") return TrendMode::ALIGNED;
    if (l == "not_opposed") return TrendMode::NOT_OPPOSED;
    if (l == "contrarian") return TrendMode::CONTRARIAN;
    throw std::invalid_argument("Config: '" + key + "' expects aligned, not_opposed or "
                                "contrarian, got '" + v + "'");
}

inline std::set<time_utils::Session> parse_sessions(const std::string& key,
                                                    const std::string& v) {
    std::set<time_utils::Session> out;
    std::stringstream ss(v);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string name = lower(trim(item));
        if (name.empty()) continue;
        if (name == "asia") out.insert(time_utils::Session::ASIA);
        else if (name == "europe") out.insert(time_utils::Session::EUROPE);
        else if (name == "overlap") out.insert(time_utils::Session::OVERLAP);
        else if (name == "us") out.insert(time_utils::Session::US);
        else throw std::invalid_argument("Config: unknown session '" + name + "' in '" + key + "'");
    }
    return out;
}

using Setter = std::function<void(BacktestConfig&, const std::string& key, const std::string& v)>;

inline const std::map<std::string, Setter>& setters() {
    static const std::map<std::string, Setter> table = [] {
        std::map<std::string, Setter> t;
        auto int_field = [&t](const std::string& name, int StrategyConfig::*field) {
            t[name] = [field](BacktestConfig& c, const std::string& k, const std::string& v) {
                c.strategy.*field = parse_int(k, v);
            };
        };
        auto dbl_field = [&t](const std::string& name, double StrategyConfig::*field) {
            t[name] = [field](BacktestConfig& c, const std::string& k, const std::string& v) {
                c.strategy.*field = parse_double(k, v);
            };
        };
        auto bool_field = [&t](const std::string& name, bool StrategyConfig::*field) {
            t[name] = [field](BacktestConfig& c, const std::string& k, const std::string& v) {
                c.strategy.*field = parse_bool(k, v);
            };
        };

        int_field("sr_lookback", &StrategyConfig::sr_lookback);
        dbl_field("sr_tolerance_pct", &StrategyConfig::sr_tolerance_pct);
        dbl_field("sr_tolerance_atr", &StrategyConfig::sr_tolerance_atr);
        int_field("trend_lookback", &StrategyConfig::trend_lookback);
        bool_field("use_trend_filter", &StrategyConfig::use_trend_filter);
        dbl_field("trend_deadband_pct", &StrategyConfig::trend_deadband_pct);
        int_field("ct_bars", &StrategyConfig::ct_bars);
        int_field("atr_period", &StrategyConfig::atr_period);
        dbl_field("stop_atr_mult", &StrategyConfig::stop_atr_mult);
        dbl_field("target_atr_mult", &StrategyConfig::target_atr_mult);
        bool_field("use_trailing_stop", &StrategyConfig::use_trailing_stop);
        dbl_field("trail_activation_atr", &StrategyConfig::trail_activation_atr);
        dbl_field("trail_distance_atr", &StrategyConfig::trail_distance_atr);
        bool_field("use_runner_mode", &StrategyConfig::use_runner_mode);
        int_field("max_hold_bars", &StrategyConfig::max_hold_bars);
        int_field("min_gap_bars", &StrategyConfig::min_gap_bars);
        bool_field("single_position", &StrategyConfig::single_position);
        int_field("rsi_period", &StrategyConfig::rsi_period);
        bool_field("use_rsi_exit", &StrategyConfig::use_rsi_exit);
        dbl_field("rsi_exit_high", &StrategyConfig::rsi_exit_high);
        dbl_field("rsi_exit_low", &StrategyConfig::rsi_exit_low);
        bool_field("skip_friday", &StrategyConfig::skip_friday);
        bool_field("use_session_filter", &StrategyConfig::use_session_filter);
        bool_field("use_round_number_sr", &StrategyConfig::use_round_number_sr);
        dbl_field("round_number_weight", &StrategyConfig::round_number_weight);
        dbl_field("round_level_base", &StrategyConfig::round_level_base);
        dbl_field("round_level_major", &StrategyConfig::round_level_major);

        t["trend_mode"] = [](BacktestConfig& c, const std::string& k, const std::string& v) {
            c.strategy.trend_mode = parse_trend_mode(k, v);
        };
        t["allowed_sessions"] = [](BacktestConfig& c, const std::string& k, const std::string& v) {
            c.strategy.allowed_sessions = parse_sessions(k, v);
        };
        t["fee_pct"] = [](BacktestConfig& c, const std::string& k, const std::string& v) {
            c.costs.fee_pct_per_side = parse_double(k, v);
        };
        t["slippage_pct"] = [](BacktestConfig& c, const std::string& k, const std::string& v) {
            c.costs.slippage_pct_per_side = parse_double(k, v);
        };
        return t;
    }();
    return table;
}

// Apply one key; does not validate the whole config.
inline void apply(BacktestConfig& cfg, const std::string& key, const std::string& value) {
    const auto& table = setters();
    auto it = table.find(key);
    if (it == table.end()) {
        throw std::invalid_argument("Config: unknown key '" + key + "'");
    }
    it->second(cfg, key, value);
}

// "key=value" as given to --set.
inline void apply_override(BacktestConfig& cfg, const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("Config: override must be key=value, got '" + assignment + "'");
    }
    apply(cfg, trim(assignment.substr(0, eq)), trim(assignment.substr(eq + 1)));
}

// Parse file text on top of base. Blank lines and '#' comments are ignored.
inline BacktestConfig parse(const std::string& text, const BacktestConfig& base = BacktestConfig{}) {
    BacktestConfig cfg = base;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Config line " + std::to_string(line_no) +
                                        ": expected key = value");
        }
        apply(cfg, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }
    cfg.strategy.validate();
    cfg.costs.validate();
    return cfg;
}

inline BacktestConfig load(const std::string& path, const BacktestConfig& base = BacktestConfig{}) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream buf;
    buf << file.rdbuf();
    return parse(buf.str(), base);
}

}  // namespace config_loader
