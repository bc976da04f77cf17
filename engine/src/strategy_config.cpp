#include "strategy_config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <set>

namespace {

// Reads one JSON object against a fixed key set. Every key is required;
// finish() rejects anything that was not read.
class StrictObject {
public:
    StrictObject(const nlohmann::json& j, std::string path) : j_(j), path_(std::move(path)) {
        if (!j_.is_object()) {
            throw ConfigError(path_ + ": expected object");
        }
    }

    const nlohmann::json& field(const std::string& key) {
        auto it = j_.find(key);
        if (it == j_.end()) {
            throw ConfigError(path_ + "." + key + ": missing required key");
        }
        seen_.insert(key);
        return *it;
    }

    double number(const std::string& key) {
        const auto& v = field(key);
        if (!v.is_number()) throw ConfigError(path_ + "." + key + ": expected number");
        return v.get<double>();
    }

    int integer(const std::string& key) {
        const auto& v = field(key);
        if (!v.is_number_integer()) throw ConfigError(path_ + "." + key + ": expected integer");
        return v.get<int>();
    }

    int64_t integer64(const std::string& key) {
        const auto& v = field(key);
        if (!v.is_number_integer()) throw ConfigError(path_ + "." + key + ": expected integer");
        return v.get<int64_t>();
    }

    bool boolean(const std::string& key) {
        const auto& v = field(key);
        if (!v.is_boolean()) throw ConfigError(path_ + "." + key + ": expected boolean");
        return v.get<bool>();
    }

    std::string string(const std::string& key) {
        const auto& v = field(key);
        if (!v.is_string()) throw ConfigError(path_ + "." + key + ": expected string");
        return v.get<std::string>();
    }

    int time_of_day(const std::string& key) {
        auto s = string(key);
        try {
            return util::parse_hhmm(s);
        } catch (const std::exception& e) {
            throw ConfigError(path_ + "." + key + ": " + e.what());
        }
    }

    StrictObject object(const std::string& key) {
        return StrictObject(field(key), path_ + "." + key);
    }

    const std::string& path() const { return path_; }

    void finish() const {
        for (const auto& item : j_.items()) {
            if (seen_.find(item.key()) == seen_.end()) {
                throw ConfigError(path_ + "." + item.key() + ": unknown key");
            }
        }
    }

private:
    const nlohmann::json& j_;
    std::string path_;
    std::set<std::string> seen_;
};

SetupThresholds parse_setup(StrictObject obj) {
    SetupThresholds t;
    t.min_clearance_pct = obj.number("min_clearance_pct");
    t.momentum_volume_ratio = obj.number("momentum_volume_ratio");
    t.momentum_candle_pct = obj.number("momentum_candle_pct");
    t.volume_lookback_sec = obj.integer("volume_lookback_sec");
    t.pullback_distance_pct = obj.number("pullback_distance_pct");
    t.max_breakout_age_sec = obj.integer("max_breakout_age_sec");
    t.single_sample_threshold = obj.number("single_sample_threshold");
    t.sustained_threshold = obj.number("sustained_threshold");
    t.sustained_count_threshold = obj.integer("sustained_count_threshold");
    t.stop_offset_pct = obj.number("stop_offset_pct");

    t.stall_window_start_sec = obj.integer("stall_window_start_sec");
    t.stall_window_end_sec = obj.integer("stall_window_end_sec");
    t.stall_tolerance_pct = obj.number("stall_tolerance_pct");

    const auto& levels = obj.field("partial_levels");
    if (!levels.is_array()) {
        throw ConfigError(obj.path() + ".partial_levels: expected array");
    }
    for (size_t i = 0; i < levels.size(); i++) {
        StrictObject level(levels[i], obj.path() + ".partial_levels[" + std::to_string(i) + "]");
        PartialLevel pl;
        pl.gain_pct = level.number("gain_pct");
        pl.fraction = level.number("fraction");
        level.finish();
        t.partial_levels.push_back(pl);
    }

    t.breakeven_after_partial = obj.boolean("breakeven_after_partial");
    t.trail_pct = obj.number("trail_pct");
    t.trail_after_partial_only = obj.boolean("trail_after_partial_only");
    obj.finish();
    return t;
}

nlohmann::json setup_to_json(const SetupThresholds& t) {
    nlohmann::json levels = nlohmann::json::array();
    for (const auto& pl : t.partial_levels) {
        levels.push_back({{"gain_pct", pl.gain_pct}, {"fraction", pl.fraction}});
    }
    return {
        {"min_clearance_pct", t.min_clearance_pct},
        {"momentum_volume_ratio", t.momentum_volume_ratio},
        {"momentum_candle_pct", t.momentum_candle_pct},
        {"volume_lookback_sec", t.volume_lookback_sec},
        {"pullback_distance_pct", t.pullback_distance_pct},
        {"max_breakout_age_sec", t.max_breakout_age_sec},
        {"single_sample_threshold", t.single_sample_threshold},
        {"sustained_threshold", t.sustained_threshold},
        {"sustained_count_threshold", t.sustained_count_threshold},
        {"stop_offset_pct", t.stop_offset_pct},
        {"stall_window_start_sec", t.stall_window_start_sec},
        {"stall_window_end_sec", t.stall_window_end_sec},
        {"stall_tolerance_pct", t.stall_tolerance_pct},
        {"partial_levels", levels},
        {"breakeven_after_partial", t.breakeven_after_partial},
        {"trail_pct", t.trail_pct},
        {"trail_after_partial_only", t.trail_after_partial_only}
    };
}

const SetupType kSetupTypes[] = {SetupType::Momentum, SetupType::Pullback, SetupType::Bounce};

} // namespace

int StrategyConfig::bars_per_confirmation_interval() const {
    return confirmation_interval_seconds / bar_interval_seconds;
}

int StrategyConfig::volume_lookback_bars(SetupType type) const {
    return std::max(1, thresholds(type).volume_lookback_sec / bar_interval_seconds);
}

int StrategyConfig::max_breakout_age_bars(SetupType type) const {
    return std::max(1, thresholds(type).max_breakout_age_sec / bar_interval_seconds);
}

const SetupThresholds& StrategyConfig::thresholds(SetupType type) const {
    auto it = setups.find(type);
    if (it == setups.end()) {
        throw ConfigError("No thresholds for setup " + to_string(type));
    }
    return it->second;
}

void StrategyConfig::set_bar_interval(int seconds) {
    bar_interval_seconds = seconds;
    validate();
    spdlog::info("Bar interval set to {}s ({} bars per {}s confirmation candle)",
                 bar_interval_seconds, bars_per_confirmation_interval(),
                 confirmation_interval_seconds);
}

void StrategyConfig::validate() const {
    if (bar_interval_seconds <= 0 || confirmation_interval_seconds <= 0) {
        throw ConfigError("Bar and confirmation intervals must be positive");
    }
    if (confirmation_interval_seconds % bar_interval_seconds != 0) {
        throw ConfigError("confirmation_interval_seconds (" +
                          std::to_string(confirmation_interval_seconds) +
                          ") is not a multiple of bar_interval_seconds (" +
                          std::to_string(bar_interval_seconds) + ")");
    }
    if (account.account_size <= 0 || account.risk_fraction <= 0 ||
        account.max_position_value <= 0 || account.max_shares <= 0) {
        throw ConfigError("Account limits must be positive");
    }
    if (max_attempts_per_pivot <= 0) {
        throw ConfigError("attempts.max_attempts_per_pivot must be positive");
    }
    if (broker.max_attempts <= 0 || broker.backoff_ms_min < 0 ||
        broker.backoff_ms_max < broker.backoff_ms_min) {
        throw ConfigError("Invalid broker retry settings");
    }
    if (session.min_entry_sec > session.max_entry_sec) {
        throw ConfigError("session.min_entry_time is after session.max_entry_time");
    }

    for (auto type : kSetupTypes) {
        const auto& t = thresholds(type);
        auto name = to_string(type);
        if (t.sustained_count_threshold <= 0 || t.volume_lookback_sec <= 0) {
            throw ConfigError(name + ": counts must be positive");
        }
        if (t.max_breakout_age_sec < confirmation_interval_seconds) {
            throw ConfigError(name + ": max_breakout_age_sec is shorter than one confirmation interval");
        }
        if (buffer_capacity <= max_breakout_age_bars(type) ||
            buffer_capacity <= volume_lookback_bars(type) + bars_per_confirmation_interval()) {
            throw ConfigError("buffer_capacity must exceed the longest lookback of setup " + name);
        }
        if (t.stall_window_start_sec > t.stall_window_end_sec) {
            throw ConfigError(name + ": stall window start is after its end");
        }
        double total = 0.0;
        double last_gain = 0.0;
        for (const auto& pl : t.partial_levels) {
            if (pl.fraction <= 0 || pl.fraction > 1 || pl.gain_pct <= 0) {
                throw ConfigError(name + ": partial level fractions must be in (0, 1] with positive gain");
            }
            if (pl.gain_pct < last_gain) {
                throw ConfigError(name + ": partial levels must be ordered by gain");
            }
            last_gain = pl.gain_pct;
            total += pl.fraction;
        }
        if (total > 1.0 + 1e-9) {
            throw ConfigError(name + ": partial level fractions sum above 1");
        }
    }
}

StrategyConfig StrategyConfig::from_json(const nlohmann::json& j) {
    StrategyConfig cfg;
    StrictObject root(j, "strategy");

    cfg.bar_interval_seconds = root.integer("bar_interval_seconds");
    cfg.confirmation_interval_seconds = root.integer("confirmation_interval_seconds");
    cfg.buffer_capacity = root.integer64("buffer_capacity");

    auto account = root.object("account");
    cfg.account.account_size = account.number("account_size");
    cfg.account.risk_fraction = account.number("risk_fraction");
    cfg.account.max_position_value = account.number("max_position_value");
    cfg.account.max_shares = account.integer("max_shares");
    cfg.account.position_value_buffer_fraction = account.number("position_value_buffer_fraction");
    cfg.account.max_total_exposure = account.number("max_total_exposure");
    cfg.account.commission_per_share = account.number("commission_per_share");
    account.finish();

    auto session = root.object("session");
    cfg.session.min_entry_sec = session.time_of_day("min_entry_time");
    cfg.session.max_entry_sec = session.time_of_day("max_entry_time");
    cfg.session.flatten_sec = session.time_of_day("flatten_time");
    cfg.session.utc_offset_minutes = session.integer("utc_offset_minutes");
    session.finish();

    auto attempts = root.object("attempts");
    cfg.max_attempts_per_pivot = attempts.integer("max_attempts_per_pivot");
    attempts.finish();

    auto broker = root.object("broker");
    cfg.broker.max_attempts = broker.integer("max_attempts");
    cfg.broker.backoff_ms_min = broker.integer("retry_backoff_ms_min");
    cfg.broker.backoff_ms_max = broker.integer("retry_backoff_ms_max");
    broker.finish();

    auto filters = root.object("filters");
    cfg.filters.min_score = filters.number("min_score");
    cfg.filters.min_risk_reward = filters.number("min_risk_reward");
    cfg.filters.min_room_to_target_pct = filters.number("min_room_to_target_pct");
    const auto& avoid = filters.field("avoid_symbols");
    if (!avoid.is_array()) {
        throw ConfigError("strategy.filters.avoid_symbols: expected array");
    }
    for (const auto& s : avoid) {
        if (!s.is_string()) throw ConfigError("strategy.filters.avoid_symbols: expected strings");
        cfg.filters.avoid_symbols.push_back(s.get<std::string>());
    }
    filters.finish();

    auto setups = root.object("setups");
    for (auto type : kSetupTypes) {
        cfg.setups[type] = parse_setup(setups.object(to_string(type)));
    }
    setups.finish();

    root.finish();
    cfg.validate();
    return cfg;
}

StrategyConfig StrategyConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open strategy config " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed strategy config " + path + ": " + e.what());
    }
    auto cfg = from_json(j);
    spdlog::info("Loaded strategy config {} ({}s bars, {} bars per confirmation candle, capacity {})",
                 path, cfg.bar_interval_seconds, cfg.bars_per_confirmation_interval(),
                 cfg.buffer_capacity);
    return cfg;
}

StrategyConfig StrategyConfig::defaults() {
    StrategyConfig cfg;
    cfg.bar_interval_seconds = 5;
    cfg.confirmation_interval_seconds = 60;
    cfg.buffer_capacity = 8192;  // a full 6.5h session of 5s bars is 4680

    cfg.account = {100000.0, 0.01, 20000.0, 1000, 0.05, 100000.0, 0.0};
    cfg.session = {9 * 3600 + 45 * 60, 15 * 3600, 15 * 3600 + 55 * 60, 0};
    cfg.max_attempts_per_pivot = 2;
    cfg.broker = {3, 200, 800};
    cfg.filters = {0.0, 0.0, 0.0, {}};

    SetupThresholds momentum;
    momentum.min_clearance_pct = 0.001;
    momentum.momentum_volume_ratio = 2.0;
    momentum.momentum_candle_pct = 0.003;
    momentum.volume_lookback_sec = 1200;
    momentum.pullback_distance_pct = 0.003;
    momentum.max_breakout_age_sec = 3000;
    momentum.single_sample_threshold = 20.0;
    momentum.sustained_threshold = 10.0;
    momentum.sustained_count_threshold = 3;
    momentum.stop_offset_pct = 0.0;
    momentum.stall_window_start_sec = 300;
    momentum.stall_window_end_sec = 420;
    momentum.stall_tolerance_pct = 0.001;
    momentum.partial_levels = {{0.01, 0.5}, {0.02, 0.25}};
    momentum.breakeven_after_partial = true;
    momentum.trail_pct = 0.005;
    momentum.trail_after_partial_only = true;

    SetupThresholds pullback = momentum;
    pullback.min_clearance_pct = 0.0015;
    pullback.sustained_count_threshold = 4;

    SetupThresholds bounce = momentum;
    bounce.pullback_distance_pct = 0.002;
    bounce.stall_window_end_sec = 300;
    bounce.stall_window_start_sec = 180;

    cfg.setups[SetupType::Momentum] = momentum;
    cfg.setups[SetupType::Pullback] = pullback;
    cfg.setups[SetupType::Bounce] = bounce;
    return cfg;
}

nlohmann::json StrategyConfig::to_json() const {
    nlohmann::json setups_json;
    for (const auto& [type, t] : setups) {
        setups_json[to_string(type)] = setup_to_json(t);
    }
    return {
        {"bar_interval_seconds", bar_interval_seconds},
        {"confirmation_interval_seconds", confirmation_interval_seconds},
        {"buffer_capacity", buffer_capacity},
        {"account", {
            {"account_size", account.account_size},
            {"risk_fraction", account.risk_fraction},
            {"max_position_value", account.max_position_value},
            {"max_shares", account.max_shares},
            {"position_value_buffer_fraction", account.position_value_buffer_fraction},
            {"max_total_exposure", account.max_total_exposure},
            {"commission_per_share", account.commission_per_share}
        }},
        {"session", {
            {"min_entry_time", util::format_hhmm(session.min_entry_sec)},
            {"max_entry_time", util::format_hhmm(session.max_entry_sec)},
            {"flatten_time", util::format_hhmm(session.flatten_sec)},
            {"utc_offset_minutes", session.utc_offset_minutes}
        }},
        {"attempts", {{"max_attempts_per_pivot", max_attempts_per_pivot}}},
        {"broker", {
            {"max_attempts", broker.max_attempts},
            {"retry_backoff_ms_min", broker.backoff_ms_min},
            {"retry_backoff_ms_max", broker.backoff_ms_max}
        }},
        {"filters", {
            {"min_score", filters.min_score},
            {"min_risk_reward", filters.min_risk_reward},
            {"min_room_to_target_pct", filters.min_room_to_target_pct},
            {"avoid_symbols", filters.avoid_symbols}
        }},
        {"setups", setups_json}
    };
}
