#pragma once

#include "types.hpp"
#include "strategy_config.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class BreakoutKind {
    Strong,
    Weak,
    Pullback
};

enum class FlowDirection {
    None,
    Buying,
    Selling
};

std::string to_string(BreakoutKind kind);
std::string to_string(FlowDirection dir);

// Candle quality of the bar that crossed the pivot
struct CrossingSnapshot {
    double candle_pct;
    std::optional<double> volume_ratio;  // empty when history is insufficient
};

// What happened since the pivot was crossed
struct BreakoutMemory {
    Side side;
    double pivot_price;

    LogicalPosition breakout_logical_position;
    double breakout_price;
    int64_t breakout_time_ms;
    BreakoutKind breakout_kind;

    std::optional<LogicalPosition> candle_close_logical_position;
    std::optional<double> confirmation_volume_ratio;
    std::optional<double> confirmation_candle_pct;

    int bars_held_above_pivot = 0;
    std::optional<double> volume_ratio_at_breakout;
    double candle_pct_at_breakout = 0.0;
    double best_price_since_breakout;

    int consecutive_imbalance_count = 0;
    FlowDirection consecutive_imbalance_direction = FlowDirection::None;
    std::optional<double> last_imbalance_pct;

    std::string entry_reason;

    nlohmann::json to_json() const;
};

// Per-symbol owner of BreakoutMemory. The entry state machine reads the memory
// through get() and drives every mutation through the operations below.
class StateTracker {
public:
    StateTracker(std::string symbol, const SetupThresholds& thresholds);

    // Initializes, or overwrites, the memory with the kind classified from the crossing bar
    const BreakoutMemory& on_pivot_cross(Side side, double pivot, double price,
                                         LogicalPosition pos, int64_t time_ms,
                                         const CrossingSnapshot& snapshot);

    void record_order_flow_sample(double imbalance_pct, LogicalPosition pos);
    void record_bar(double price);
    void record_candle_close(LogicalPosition pos, std::optional<double> volume_ratio,
                             double candle_pct);
    void set_entry_reason(const std::string& reason);

    // Breakout premise falsified (or consumed by an entry). Returns the
    // cleared memory for the audit log.
    std::optional<BreakoutMemory> invalidate();

    const BreakoutMemory* get() const { return memory_ ? &*memory_ : nullptr; }
    const std::string& symbol() const { return symbol_; }

    BreakoutKind classify(const CrossingSnapshot& snapshot, Side side) const;

private:
    std::string symbol_;
    const SetupThresholds& thresholds_;
    std::optional<BreakoutMemory> memory_;

    BreakoutMemory& require();
};
