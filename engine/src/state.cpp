#include "state.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

std::string to_string(BreakoutKind kind) {
    switch (kind) {
        case BreakoutKind::Strong: return "STRONG";
        case BreakoutKind::Weak: return "WEAK";
        case BreakoutKind::Pullback: return "PULLBACK";
    }
    return "WEAK";
}

std::string to_string(FlowDirection dir) {
    switch (dir) {
        case FlowDirection::None: return "NONE";
        case FlowDirection::Buying: return "BUYING";
        case FlowDirection::Selling: return "SELLING";
    }
    return "NONE";
}

nlohmann::json BreakoutMemory::to_json() const {
    nlohmann::json j = {
        {"side", ::to_string(side)},
        {"pivot", pivot_price},
        {"breakout_logical_position", breakout_logical_position},
        {"breakout_price", breakout_price},
        {"breakout_kind", ::to_string(breakout_kind)},
        {"bars_held_above_pivot", bars_held_above_pivot},
        {"candle_pct_at_breakout", candle_pct_at_breakout},
        {"consecutive_imbalance_count", consecutive_imbalance_count},
        {"consecutive_imbalance_direction", ::to_string(consecutive_imbalance_direction)},
        {"entry_reason", entry_reason}
    };
    j["candle_close_logical_position"] = candle_close_logical_position
        ? nlohmann::json(*candle_close_logical_position) : nlohmann::json(nullptr);
    j["volume_ratio_at_breakout"] = volume_ratio_at_breakout
        ? nlohmann::json(*volume_ratio_at_breakout) : nlohmann::json(nullptr);
    return j;
}

StateTracker::StateTracker(std::string symbol, const SetupThresholds& thresholds)
    : symbol_(std::move(symbol)), thresholds_(thresholds) {}

BreakoutMemory& StateTracker::require() {
    if (!memory_) {
        throw std::logic_error(symbol_ + ": no breakout memory");
    }
    return *memory_;
}

BreakoutKind StateTracker::classify(const CrossingSnapshot& snapshot, Side side) const {
    // Re-approach after an initial strong break on the same side
    if (memory_ && memory_->side == side && memory_->breakout_kind == BreakoutKind::Strong) {
        return BreakoutKind::Pullback;
    }

    bool large_candle = snapshot.candle_pct >= thresholds_.momentum_candle_pct;
    bool high_volume = snapshot.volume_ratio &&
                       *snapshot.volume_ratio >= thresholds_.momentum_volume_ratio;
    return (large_candle && high_volume) ? BreakoutKind::Strong : BreakoutKind::Weak;
}

const BreakoutMemory& StateTracker::on_pivot_cross(Side side, double pivot, double price,
                                                   LogicalPosition pos, int64_t time_ms,
                                                   const CrossingSnapshot& snapshot) {
    BreakoutMemory mem;
    mem.side = side;
    mem.pivot_price = pivot;
    mem.breakout_logical_position = pos;
    mem.breakout_price = price;
    mem.breakout_time_ms = time_ms;
    mem.breakout_kind = classify(snapshot, side);
    mem.volume_ratio_at_breakout = snapshot.volume_ratio;
    mem.candle_pct_at_breakout = snapshot.candle_pct;
    mem.best_price_since_breakout = price;

    memory_ = mem;
    spdlog::debug("{}: {} breakout of {:.2f} at position {} ({})",
                  symbol_, to_string(mem.breakout_kind), pivot, pos, ::to_string(side));
    return *memory_;
}

void StateTracker::record_order_flow_sample(double imbalance_pct, LogicalPosition pos) {
    if (!memory_) return;
    auto& mem = *memory_;

    mem.last_imbalance_pct = imbalance_pct;

    if (std::fabs(imbalance_pct) <= thresholds_.sustained_threshold) {
        mem.consecutive_imbalance_count = 0;
        mem.consecutive_imbalance_direction = FlowDirection::None;
        return;
    }

    auto dir = imbalance_pct < 0 ? FlowDirection::Buying : FlowDirection::Selling;
    if (dir == mem.consecutive_imbalance_direction && mem.consecutive_imbalance_count > 0) {
        mem.consecutive_imbalance_count++;
    } else {
        mem.consecutive_imbalance_count = 1;
        mem.consecutive_imbalance_direction = dir;
    }
    spdlog::debug("{}: imbalance {:+.1f}% at position {} -> {} x{}", symbol_, imbalance_pct, pos,
                  to_string(dir), mem.consecutive_imbalance_count);
}

void StateTracker::record_bar(double price) {
    auto& mem = require();
    mem.bars_held_above_pivot++;
    if (mem.side == Side::Long) {
        mem.best_price_since_breakout = std::max(mem.best_price_since_breakout, price);
    } else {
        mem.best_price_since_breakout = std::min(mem.best_price_since_breakout, price);
    }
}

void StateTracker::record_candle_close(LogicalPosition pos, std::optional<double> volume_ratio,
                                       double candle_pct) {
    auto& mem = require();
    mem.candle_close_logical_position = pos;
    mem.confirmation_volume_ratio = volume_ratio;
    mem.confirmation_candle_pct = candle_pct;
}

void StateTracker::set_entry_reason(const std::string& reason) {
    require().entry_reason = reason;
}

std::optional<BreakoutMemory> StateTracker::invalidate() {
    std::optional<BreakoutMemory> cleared;
    cleared.swap(memory_);
    return cleared;
}
