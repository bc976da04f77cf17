#include "decision.hpp"
#include <spdlog/spdlog.h>

std::string to_string(MachineState state) {
    switch (state) {
        case MachineState::Idle: return "IDLE";
        case MachineState::WatchingBreakout: return "WATCHING_BREAKOUT";
        case MachineState::AwaitingConfirmation: return "AWAITING_CONFIRMATION";
        case MachineState::Confirmed: return "CONFIRMED";
    }
    return "IDLE";
}

std::string to_string(DecisionAction action) {
    switch (action) {
        case DecisionAction::Enter: return "ENTER";
        case DecisionAction::Wait: return "WAIT";
        case DecisionAction::Reject: return "REJECT";
    }
    return "WAIT";
}

std::string to_string(DecisionReason reason) {
    switch (reason) {
        case DecisionReason::PriceNotThroughPivot: return "price_not_through_pivot";
        case DecisionReason::BreakoutDetected: return "breakout_detected";
        case DecisionReason::PullbackRearmed: return "pullback_rearmed";
        case DecisionReason::AwaitingConfirmationCandle: return "awaiting_confirmation_candle";
        case DecisionReason::MomentumConfirmed: return "momentum_confirmed";
        case DecisionReason::MomentumInconclusive: return "momentum_inconclusive";
        case DecisionReason::AwaitingOrderFlow: return "awaiting_order_flow";
        case DecisionReason::ThresholdNotMet: return "threshold_not_met";
        case DecisionReason::NoActiveBreakout: return "no_active_breakout";
        case DecisionReason::PositionOpen: return "position_open";
        case DecisionReason::ReconciliationPending: return "reconciliation_pending";
        case DecisionReason::PathAAggressiveImbalance: return "path_a_aggressive_imbalance";
        case DecisionReason::PathBSustainedImbalance: return "path_b_sustained_imbalance";
        case DecisionReason::PriceReversal: return "price_reversal";
        case DecisionReason::StaleBreakout: return "stale_breakout";
        case DecisionReason::AttemptCapExhausted: return "attempt_cap_exhausted";
        case DecisionReason::OutsideEntryWindow: return "outside_entry_window";
        case DecisionReason::InsufficientRoom: return "insufficient_room";
        case DecisionReason::ReconciliationHold: return "reconciliation_hold";
        case DecisionReason::SizingRejected: return "sizing_rejected";
        case DecisionReason::ExposureLimit: return "exposure_limit";
        case DecisionReason::BrokerRejected: return "broker_rejected";
    }
    return "unknown";
}

namespace {

nlohmann::json opt(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

}

nlohmann::json EntryDecision::to_json() const {
    double vs_pivot = pivot > 0 ? (signals.price - pivot) / pivot : 0.0;
    return {
        {"time_ms", time_ms},
        {"symbol", symbol},
        {"logical_position", logical_position},
        {"action", ::to_string(action)},
        {"reason", ::to_string(reason)},
        {"detail", detail},
        {"state_from", ::to_string(state_from)},
        {"state_to", ::to_string(state_to)},
        {"side", ::to_string(side)},
        {"setup_type", ::to_string(setup_type)},
        {"pivot", pivot},
        {"price", signals.price},
        {"price_vs_pivot_pct", vs_pivot},
        {"volume_ratio", opt(signals.volume_ratio)},
        {"candle_pct", opt(signals.candle_pct)},
        {"imbalance_pct", opt(signals.imbalance_pct)},
        {"consecutive_imbalance_count", signals.consecutive_imbalance_count},
        {"breakout_kind", signals.breakout_kind
            ? nlohmann::json(::to_string(*signals.breakout_kind)) : nlohmann::json(nullptr)},
        {"attempts", attempts}
    };
}

void DecisionLog::add_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void DecisionLog::record(const EntryDecision& decision) {
    if (decision.action == DecisionAction::Wait) {
        spdlog::debug("{} #{}: WAIT {} {}", decision.symbol, decision.logical_position,
                      ::to_string(decision.reason), decision.detail);
        return;
    }

    auto rec = decision.to_json();

    std::lock_guard<std::mutex> lock(mutex_);
    count_++;
    for (auto& sink : sinks_) {
        try {
            sink(rec);
        } catch (const std::exception& e) {
            spdlog::error("Decision sink failed for {}: {}", decision.symbol, e.what());
        }
    }
}

size_t DecisionLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}
