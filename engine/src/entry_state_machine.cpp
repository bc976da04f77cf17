#include "entry_state_machine.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

void apply_memory(EntryDecision& d, const BreakoutMemory* mem) {
    if (!mem) return;
    d.signals.breakout_kind = mem->breakout_kind;
    d.signals.volume_ratio = mem->confirmation_volume_ratio
        ? mem->confirmation_volume_ratio : mem->volume_ratio_at_breakout;
    d.signals.candle_pct = mem->confirmation_candle_pct
        ? *mem->confirmation_candle_pct : mem->candle_pct_at_breakout;
    if (mem->last_imbalance_pct) d.signals.imbalance_pct = mem->last_imbalance_pct;
    d.signals.consecutive_imbalance_count = mem->consecutive_imbalance_count;
}

FlowDirection pressure_for(Side side) {
    return side == Side::Long ? FlowDirection::Buying : FlowDirection::Selling;
}

}

SymbolWatch::SymbolWatch(PivotSetup s, const StrategyConfig& config, LogicalPosition first_position)
    : setup(std::move(s))
    , bars(config.buffer_capacity, first_position)
    , tracker(setup.symbol, config.thresholds(setup.setup_type))
{}

double SymbolWatch::last_close() const {
    return bars.empty() ? 0.0 : bars.get(bars.latest()).close;
}

EntryStateMachine::EntryStateMachine(const StrategyConfig& config)
    : config_(config) {}

ConfirmationCandle EntryStateMachine::build_candle(const BarBuffer& bars, Side side,
                                                   LogicalPosition first, LogicalPosition last) {
    ConfirmationCandle c;
    c.open = bars.get(first).open;
    c.close = bars.get(last).close;
    c.volume = 0.0;
    for (LogicalPosition p = first; p <= last; ++p) {
        c.volume += bars.get(p).volume;
    }
    c.body_pct = side_sign(side) * (c.close - c.open) / c.open;
    return c;
}

std::optional<double> EntryStateMachine::volume_ratio(const BarBuffer& bars, LogicalPosition first,
                                                      LogicalPosition last, int lookback_bars) {
    // The window is clipped at the start of the session, never at the eviction horizon
    LogicalPosition from = std::max<LogicalPosition>(0, first - lookback_bars);
    if (from >= first) return std::nullopt;

    try {
        double history = 0.0;
        for (LogicalPosition p = from; p < first; ++p) {
            history += bars.get(p).volume;
        }
        double avg = history / static_cast<double>(first - from);
        if (avg <= 0) return std::nullopt;

        double volume = 0.0;
        for (LogicalPosition p = first; p <= last; ++p) {
            volume += bars.get(p).volume;
        }
        return volume / (avg * static_cast<double>(last - first + 1));
    } catch (const EvictedRangeError& e) {
        spdlog::debug("Volume lookback unavailable: {}", e.what());
        return std::nullopt;
    }
}

bool EntryStateMachine::in_entry_window(int64_t time_ms) const {
    int sec = util::seconds_of_day(time_ms, config_.session.utc_offset_minutes);
    return sec >= config_.session.min_entry_sec && sec <= config_.session.max_entry_sec;
}

EntryDecision EntryStateMachine::make_decision(const SymbolWatch& watch, int64_t time_ms,
                                               LogicalPosition pos, double price) const {
    EntryDecision d;
    d.symbol = watch.setup.symbol;
    d.time_ms = time_ms;
    d.logical_position = pos;
    d.state_from = watch.state;
    d.state_to = watch.state;
    d.side = watch.setup.side_bias;
    d.setup_type = watch.setup.setup_type;
    d.pivot = watch.setup.pivot_price;
    d.reference_price = price;
    d.signals.price = price;
    apply_memory(d, watch.tracker.get());
    return d;
}

EntryDecision EntryStateMachine::invalidate(SymbolWatch& watch, EntryDecision base,
                                            DecisionReason reason, const std::string& detail) const {
    watch.tracker.invalidate();
    watch.state = MachineState::Idle;
    base.action = DecisionAction::Reject;
    base.reason = reason;
    base.detail = detail;
    base.state_to = MachineState::Idle;
    return base;
}

std::optional<EntryDecision> EntryStateMachine::check_gate(SymbolWatch& watch, const EntryGate& gate,
                                                           EntryDecision base) const {
    if (!in_entry_window(base.time_ms)) {
        base.action = DecisionAction::Reject;
        base.reason = DecisionReason::OutsideEntryWindow;
        base.detail = fmt::format("{} outside {}-{}",
            util::format_hhmm(util::seconds_of_day(base.time_ms, config_.session.utc_offset_minutes)),
            util::format_hhmm(config_.session.min_entry_sec),
            util::format_hhmm(config_.session.max_entry_sec));
        return base;
    }
    if (gate.attempts >= config_.max_attempts_per_pivot) {
        base.action = DecisionAction::Reject;
        base.reason = DecisionReason::AttemptCapExhausted;
        base.detail = fmt::format("{} of {} attempts used on pivot {:.2f}", gate.attempts,
                                  config_.max_attempts_per_pivot, watch.setup.pivot_price);
        return base;
    }
    if (gate.position_open) {
        base.action = DecisionAction::Wait;
        base.reason = DecisionReason::PositionOpen;
        return base;
    }
    if (gate.reconciliation_pending) {
        base.action = DecisionAction::Wait;
        base.reason = DecisionReason::ReconciliationPending;
        return base;
    }
    if (gate.entries_halted) {
        base.action = DecisionAction::Reject;
        base.reason = DecisionReason::ReconciliationHold;
        base.detail = "broker holdings disagree with session state";
        return base;
    }
    return std::nullopt;
}

EntryDecision EntryStateMachine::on_bar(SymbolWatch& watch, LogicalPosition pos,
                                        const EntryGate& gate) const {
    if (watch.bars.empty() || pos != watch.bars.latest()) {
        throw DataError(watch.setup.symbol + ": bar at position " + std::to_string(pos) +
                        " is not the latest");
    }
    const Bar& bar = watch.bars.get(pos);

    EntryDecision d;
    switch (watch.state) {
        case MachineState::WatchingBreakout:
            d = on_watching_bar(watch, pos, bar, gate);
            break;
        case MachineState::AwaitingConfirmation:
            d = on_awaiting_bar(watch, pos, bar, gate);
            break;
        case MachineState::Idle:
        case MachineState::Confirmed:
            watch.state = MachineState::Idle;
            d = on_idle_bar(watch, pos, bar, gate);
            break;
    }
    d.attempts = gate.attempts;
    return d;
}

EntryDecision EntryStateMachine::on_idle_bar(SymbolWatch& watch, LogicalPosition pos, const Bar& bar,
                                             const EntryGate& gate) const {
    const auto& t = config_.thresholds(watch.setup.setup_type);
    Side side = watch.setup.side_bias;
    double pivot = watch.setup.pivot_price;

    auto d = make_decision(watch, bar.open_time_ms, pos, bar.close);
    d.reason = DecisionReason::PriceNotThroughPivot;

    if (!is_beyond_pivot(side, bar.close, pivot)) {
        watch.armed = true;
        return d;
    }
    if (!watch.armed) {
        d.detail = "crossing already evaluated";
        return d;
    }
    if (pivot_clearance(side, bar.close, pivot) < t.min_clearance_pct) {
        d.detail = "below minimum clearance";
        return d;
    }

    // A crossing is consumed whatever the outcome; the next one needs price back at the pivot
    watch.armed = false;
    if (auto blocked = check_gate(watch, gate, d)) {
        return *blocked;
    }

    auto candle = build_candle(watch.bars, side, pos, pos);
    int lookback = config_.volume_lookback_bars(watch.setup.setup_type);
    CrossingSnapshot snapshot{candle.body_pct, volume_ratio(watch.bars, pos, pos, lookback)};
    const auto& mem = watch.tracker.on_pivot_cross(side, pivot, bar.close, pos,
                                                   bar.open_time_ms, snapshot);
    watch.state = MachineState::WatchingBreakout;

    d.state_to = MachineState::WatchingBreakout;
    d.reason = DecisionReason::BreakoutDetected;
    d.detail = to_string(mem.breakout_kind);
    apply_memory(d, &mem);
    return d;
}

std::optional<EntryDecision> EntryStateMachine::check_premise(SymbolWatch& watch,
                                                              const EntryDecision& base,
                                                              LogicalPosition pos,
                                                              double price) const {
    int max_age = config_.max_breakout_age_bars(watch.setup.setup_type);
    const BreakoutMemory* mem = watch.tracker.get();

    if (!is_beyond_pivot(watch.setup.side_bias, price, watch.setup.pivot_price)) {
        watch.armed = true;
        return invalidate(watch, base, DecisionReason::PriceReversal,
                          fmt::format("{:.2f} back through pivot {:.2f}", price,
                                      watch.setup.pivot_price));
    }
    if (pos - mem->breakout_logical_position > max_age) {
        return invalidate(watch, base, DecisionReason::StaleBreakout,
                          fmt::format("breakout at position {} older than {} bars",
                                      mem->breakout_logical_position, max_age));
    }
    return std::nullopt;
}

bool EntryStateMachine::rearm_on_pullback(SymbolWatch& watch, EntryDecision& decision,
                                          LogicalPosition pos, const Bar& bar) const {
    const auto& t = config_.thresholds(watch.setup.setup_type);
    const BreakoutMemory* mem = watch.tracker.get();
    if (mem->breakout_kind != BreakoutKind::Strong) return false;

    Side side = watch.setup.side_bias;
    double pivot = watch.setup.pivot_price;
    double extended = pivot_clearance(side, mem->best_price_since_breakout, pivot);
    double now = pivot_clearance(side, bar.close, pivot);
    if (extended <= t.pullback_distance_pct || now > t.pullback_distance_pct) return false;

    auto candle = build_candle(watch.bars, side, pos, pos);
    int lookback = config_.volume_lookback_bars(watch.setup.setup_type);
    CrossingSnapshot snapshot{candle.body_pct, volume_ratio(watch.bars, pos, pos, lookback)};
    const auto& rearmed = watch.tracker.on_pivot_cross(side, pivot, bar.close, pos,
                                                       bar.open_time_ms, snapshot);
    watch.state = MachineState::WatchingBreakout;

    decision.state_to = MachineState::WatchingBreakout;
    decision.reason = DecisionReason::PullbackRearmed;
    decision.detail = to_string(rearmed.breakout_kind);
    apply_memory(decision, &rearmed);
    return true;
}

EntryDecision EntryStateMachine::on_watching_bar(SymbolWatch& watch, LogicalPosition pos,
                                                 const Bar& bar, const EntryGate& gate) const {
    const auto& t = config_.thresholds(watch.setup.setup_type);
    Side side = watch.setup.side_bias;

    auto d = make_decision(watch, bar.open_time_ms, pos, bar.close);
    if (auto rejected = check_premise(watch, d, pos, bar.close)) {
        return *rejected;
    }

    watch.tracker.record_bar(bar.close);
    if (rearm_on_pullback(watch, d, pos, bar)) {
        return d;
    }

    // Recomputed on every bar so a change of bar granularity is honored
    int n = config_.bars_per_confirmation_interval();
    const BreakoutMemory* mem = watch.tracker.get();
    LogicalPosition target = mem->breakout_logical_position + n;
    if (pos < target) {
        d.reason = DecisionReason::AwaitingConfirmationCandle;
        d.detail = fmt::format("{} of {} bars", pos - mem->breakout_logical_position, n);
        return d;
    }

    LogicalPosition first = mem->breakout_logical_position + 1;
    ConfirmationCandle candle;
    try {
        candle = build_candle(watch.bars, side, first, pos);
    } catch (const EvictedRangeError& e) {
        return invalidate(watch, d, DecisionReason::StaleBreakout,
                          std::string("insufficient_history: ") + e.what());
    }

    auto ratio = volume_ratio(watch.bars, first, pos,
                              config_.volume_lookback_bars(watch.setup.setup_type));
    watch.tracker.record_candle_close(pos, ratio, candle.body_pct);
    bool momentum = ratio && *ratio >= t.momentum_volume_ratio &&
                    candle.body_pct >= t.momentum_candle_pct;

    watch.state = MachineState::AwaitingConfirmation;
    d.state_to = MachineState::AwaitingConfirmation;
    apply_memory(d, watch.tracker.get());

    // Order flow accumulated while watching may already satisfy Path B
    if (auto fired = try_confirm(watch, d, bar.close, std::nullopt, gate)) {
        return *fired;
    }

    d.reason = momentum ? DecisionReason::MomentumConfirmed : DecisionReason::MomentumInconclusive;
    if (!ratio) d.detail = "insufficient_history";
    return d;
}

EntryDecision EntryStateMachine::on_awaiting_bar(SymbolWatch& watch, LogicalPosition pos,
                                                 const Bar& bar, const EntryGate& gate) const {
    auto d = make_decision(watch, bar.open_time_ms, pos, bar.close);
    if (auto rejected = check_premise(watch, d, pos, bar.close)) {
        return *rejected;
    }

    watch.tracker.record_bar(bar.close);
    if (rearm_on_pullback(watch, d, pos, bar)) {
        return d;
    }

    if (!in_entry_window(bar.open_time_ms)) {
        if (auto blocked = check_gate(watch, gate, d)) {
            watch.tracker.invalidate();
            watch.state = MachineState::Idle;
            blocked->state_to = MachineState::Idle;
            return *blocked;
        }
    }

    d.reason = DecisionReason::AwaitingOrderFlow;
    return d;
}

EntryDecision EntryStateMachine::on_order_flow(SymbolWatch& watch, const OrderFlowSample& sample,
                                               const EntryGate& gate) const {
    if (!std::isfinite(sample.imbalance_pct) || std::fabs(sample.imbalance_pct) > 100.0) {
        throw DataError(watch.setup.symbol + ": imbalance_pct out of range");
    }
    if (sample.price && (!std::isfinite(*sample.price) || *sample.price <= 0)) {
        throw DataError(watch.setup.symbol + ": order-flow sample has invalid price");
    }
    if (watch.last_sample_time_ms && sample.time_ms <= *watch.last_sample_time_ms) {
        throw DataError(watch.setup.symbol + ": out-of-order order-flow sample at " +
                        std::to_string(sample.time_ms));
    }
    watch.last_sample_time_ms = sample.time_ms;

    LogicalPosition pos = watch.bars.latest();
    double price = sample.price.value_or(watch.last_close());

    auto d = make_decision(watch, sample.time_ms, pos, price);
    d.attempts = gate.attempts;
    d.signals.imbalance_pct = sample.imbalance_pct;

    if (watch.state == MachineState::Idle || !watch.tracker.get()) {
        d.reason = DecisionReason::NoActiveBreakout;
        return d;
    }

    watch.tracker.record_order_flow_sample(sample.imbalance_pct, pos);
    apply_memory(d, watch.tracker.get());

    // A sample can arrive after price already went back through the pivot
    if (!is_beyond_pivot(watch.setup.side_bias, price, watch.setup.pivot_price)) {
        watch.armed = true;
        return invalidate(watch, d, DecisionReason::PriceReversal,
                          fmt::format("{:.2f} back through pivot {:.2f} at order-flow sample",
                                      price, watch.setup.pivot_price));
    }

    if (watch.state == MachineState::WatchingBreakout) {
        d.reason = DecisionReason::AwaitingConfirmationCandle;
        return d;
    }

    if (auto fired = try_confirm(watch, d, price, sample.imbalance_pct, gate)) {
        return *fired;
    }

    d.reason = DecisionReason::ThresholdNotMet;
    d.detail = fmt::format("imbalance {:+.1f}, {} consecutive", sample.imbalance_pct,
                           d.signals.consecutive_imbalance_count);
    return d;
}

std::optional<EntryDecision> EntryStateMachine::try_confirm(SymbolWatch& watch,
                                                            const EntryDecision& base, double price,
                                                            std::optional<double> sample_imbalance,
                                                            const EntryGate& gate) const {
    const auto& t = config_.thresholds(watch.setup.setup_type);
    const BreakoutMemory* mem = watch.tracker.get();
    Side side = watch.setup.side_bias;

    // Imbalance is negative for buying pressure; fold it so the breakout direction is positive
    bool path_a = sample_imbalance &&
                  -side_sign(side) * *sample_imbalance > t.single_sample_threshold;
    bool path_b = mem->consecutive_imbalance_count >= t.sustained_count_threshold &&
                  mem->consecutive_imbalance_direction == pressure_for(side);
    if (!path_a && !path_b) {
        return std::nullopt;
    }

    if (!is_beyond_pivot(side, price, watch.setup.pivot_price)) {
        watch.armed = true;
        return invalidate(watch, base, DecisionReason::PriceReversal,
                          fmt::format("{:.2f} back through pivot {:.2f} before entry",
                                      price, watch.setup.pivot_price));
    }

    if (auto blocked = check_gate(watch, gate, base)) {
        watch.tracker.invalidate();
        watch.state = MachineState::Idle;
        blocked->state_to = MachineState::Idle;
        return blocked;
    }

    const auto& target = watch.setup.target_price;
    if (target) {
        double room = side_sign(side) * (*target - price) / price;
        if (room < config_.filters.min_room_to_target_pct) {
            return invalidate(watch, base, DecisionReason::InsufficientRoom,
                              fmt::format("{:.2f}% to target {:.2f}", room * 100.0, *target));
        }
    }

    EntryDecision d = base;
    d.action = DecisionAction::Enter;
    d.reason = path_a ? DecisionReason::PathAAggressiveImbalance
                      : DecisionReason::PathBSustainedImbalance;
    d.reference_price = price;
    d.state_to = MachineState::Confirmed;
    d.detail = path_a
        ? fmt::format("single sample {:+.1f}", *sample_imbalance)
        : fmt::format("{} consecutive samples", mem->consecutive_imbalance_count);

    watch.tracker.set_entry_reason(to_string(d.reason));
    spdlog::info("{}: entry confirmed by {} at {:.2f} (pivot {:.2f})", watch.setup.symbol,
                 to_string(d.reason), price, watch.setup.pivot_price);

    // One-shot: the next attempt starts again from a fresh crossing
    auto consumed = watch.tracker.invalidate();
    spdlog::debug("{}: breakout consumed {}", watch.setup.symbol, consumed->to_json().dump());
    watch.state = MachineState::Idle;
    return d;
}
