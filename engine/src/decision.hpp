#pragma once

#include "types.hpp"
#include "state.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class MachineState {
    Idle,
    WatchingBreakout,
    AwaitingConfirmation,
    Confirmed
};

enum class DecisionAction {
    Enter,
    Wait,
    Reject
};

enum class DecisionReason {
    // WAIT
    PriceNotThroughPivot,
    BreakoutDetected,
    PullbackRearmed,
    AwaitingConfirmationCandle,
    MomentumConfirmed,
    MomentumInconclusive,
    AwaitingOrderFlow,
    ThresholdNotMet,
    NoActiveBreakout,
    PositionOpen,
    ReconciliationPending,
    // ENTER
    PathAAggressiveImbalance,
    PathBSustainedImbalance,
    // REJECT
    PriceReversal,
    StaleBreakout,
    AttemptCapExhausted,
    OutsideEntryWindow,
    InsufficientRoom,
    ReconciliationHold,
    SizingRejected,
    ExposureLimit,
    BrokerRejected
};

std::string to_string(MachineState state);
std::string to_string(DecisionAction action);
std::string to_string(DecisionReason reason);

// Signal values observed when the decision was taken
struct DecisionSignals {
    double price = 0.0;
    std::optional<double> volume_ratio;
    std::optional<double> candle_pct;
    std::optional<double> imbalance_pct;
    int consecutive_imbalance_count = 0;
    std::optional<BreakoutKind> breakout_kind;
};

struct EntryDecision {
    std::string symbol;
    int64_t time_ms = 0;  // data time of the bar or sample, never wall clock
    LogicalPosition logical_position = -1;
    DecisionAction action = DecisionAction::Wait;
    DecisionReason reason = DecisionReason::PriceNotThroughPivot;
    std::string detail;
    MachineState state_from = MachineState::Idle;
    MachineState state_to = MachineState::Idle;
    Side side = Side::Long;
    SetupType setup_type = SetupType::Momentum;
    double pivot = 0.0;
    double reference_price = 0.0;
    DecisionSignals signals;
    int attempts = 0;

    bool is_enter() const { return action == DecisionAction::Enter; }

    // Structured record; keys are stable across releases
    nlohmann::json to_json() const;
};

// Forwards ENTER and REJECT records to the configured sinks without retaining
// them. WAIT outcomes are only logged at debug level.
class DecisionLog {
public:
    using Sink = std::function<void(const nlohmann::json&)>;

    void add_sink(Sink sink);
    void record(const EntryDecision& decision);

    // Records emitted since construction
    size_t size() const;

private:
    mutable std::mutex mutex_;
    size_t count_ = 0;
    std::vector<Sink> sinks_;
};
