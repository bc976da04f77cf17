#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Percent-style thresholds named *_pct are fractions (0.003 = 0.3%).
// Order-flow thresholds are in imbalance percentage points, matching imbalance_pct.

struct PartialLevel {
    double gain_pct;   // unrealized gain from entry that triggers this level
    double fraction;   // fraction of the original share count to sell
};

struct SetupThresholds {
    // Entry
    double min_clearance_pct;
    double momentum_volume_ratio;
    double momentum_candle_pct;
    int volume_lookback_sec;      // average-volume window
    double pullback_distance_pct;
    int max_breakout_age_sec;     // breakout goes stale after this long
    double single_sample_threshold;
    double sustained_threshold;
    int sustained_count_threshold;
    double stop_offset_pct;

    // Exit
    int stall_window_start_sec;
    int stall_window_end_sec;
    double stall_tolerance_pct;
    std::vector<PartialLevel> partial_levels;
    bool breakeven_after_partial;
    double trail_pct;
    bool trail_after_partial_only;
};

struct AccountLimits {
    double account_size;
    double risk_fraction;
    double max_position_value;
    int max_shares;
    double position_value_buffer_fraction;
    double max_total_exposure;
    double commission_per_share;
};

struct SessionWindow {
    int min_entry_sec;
    int max_entry_sec;
    int flatten_sec;
    int utc_offset_minutes;
};

struct BrokerRetry {
    int max_attempts;
    int backoff_ms_min;
    int backoff_ms_max;
};

struct ScannerFilters {
    double min_score;
    double min_risk_reward;
    double min_room_to_target_pct;
    std::vector<std::string> avoid_symbols;
};

struct StrategyConfig {
    int bar_interval_seconds;
    int confirmation_interval_seconds;
    int64_t buffer_capacity;
    AccountLimits account;
    SessionWindow session;
    int max_attempts_per_pivot;
    BrokerRetry broker;
    ScannerFilters filters;
    std::map<SetupType, SetupThresholds> setups;

    // Raw bars per confirmation candle. Derived on every call from the two
    // intervals, never cached, so a change of bar granularity takes effect.
    int bars_per_confirmation_interval() const;
    // Second-based windows in raw bars at the current granularity
    int volume_lookback_bars(SetupType type) const;
    int max_breakout_age_bars(SetupType type) const;

    const SetupThresholds& thresholds(SetupType type) const;

    // Switch bar granularity (e.g. 5s -> 60s) and re-validate
    void set_bar_interval(int seconds);

    void validate() const;

    static StrategyConfig from_json(const nlohmann::json& j);
    static StrategyConfig load_file(const std::string& path);
    static StrategyConfig defaults();
    nlohmann::json to_json() const;
};
