#pragma once

#include "bar_buffer.hpp"
#include "decision.hpp"
#include "state.hpp"
#include "strategy_config.hpp"
#include <optional>

// Account/position facts the machine consults before a crossing is watched and
// again before an entry fires
struct EntryGate {
    bool reconciliation_pending = false;
    bool entries_halted = false;  // reconciliation mismatch for this symbol
    bool position_open = false;   // open or pending-close
    int attempts = 0;             // positions opened on this pivot this session
};

// Per-symbol entry pipeline state, owned by the engine and handed to the
// machine by reference
struct SymbolWatch {
    SymbolWatch(PivotSetup setup, const StrategyConfig& config, LogicalPosition first_position = 0);

    PivotSetup setup;
    BarBuffer bars;
    StateTracker tracker;
    MachineState state = MachineState::Idle;

    // Price has been at or behind the pivot since the last crossing was consumed
    bool armed = true;
    std::optional<int64_t> last_sample_time_ms;

    double last_close() const;
};

struct ConfirmationCandle {
    double open;
    double close;
    double volume;
    double body_pct;  // signed in the breakout direction
};

class EntryStateMachine {
public:
    explicit EntryStateMachine(const StrategyConfig& config);

    // Evaluate the bar just appended at pos. Throws DataError if pos is not the latest bar.
    EntryDecision on_bar(SymbolWatch& watch, LogicalPosition pos, const EntryGate& gate) const;

    // Evaluate an order-flow sample against the current watch. Throws DataError
    // on a malformed or out-of-order sample.
    EntryDecision on_order_flow(SymbolWatch& watch, const OrderFlowSample& sample,
                                const EntryGate& gate) const;

    // Bars [first, last] folded into one candle; throws EvictedRangeError
    static ConfirmationCandle build_candle(const BarBuffer& bars, Side side,
                                           LogicalPosition first, LogicalPosition last);

    // Volume of [first, last] relative to the average bar volume of the lookback
    // window before first. Empty when that window is evicted or has no volume.
    static std::optional<double> volume_ratio(const BarBuffer& bars, LogicalPosition first,
                                              LogicalPosition last, int lookback_bars);

private:
    const StrategyConfig& config_;

    bool in_entry_window(int64_t time_ms) const;
    std::optional<EntryDecision> check_gate(SymbolWatch& watch, const EntryGate& gate,
                                            EntryDecision base) const;

    EntryDecision on_idle_bar(SymbolWatch& watch, LogicalPosition pos, const Bar& bar,
                              const EntryGate& gate) const;
    EntryDecision on_watching_bar(SymbolWatch& watch, LogicalPosition pos, const Bar& bar,
                                  const EntryGate& gate) const;
    EntryDecision on_awaiting_bar(SymbolWatch& watch, LogicalPosition pos, const Bar& bar,
                                  const EntryGate& gate) const;

    // Reversal and staleness checks shared by the watching states
    std::optional<EntryDecision> check_premise(SymbolWatch& watch, const EntryDecision& base,
                                               LogicalPosition pos, double price) const;
    bool rearm_on_pullback(SymbolWatch& watch, EntryDecision& decision, LogicalPosition pos,
                           const Bar& bar) const;

    // Path A / Path B evaluation at the current price; empty when neither path fires
    std::optional<EntryDecision> try_confirm(SymbolWatch& watch, const EntryDecision& base,
                                             double price, std::optional<double> sample_imbalance,
                                             const EntryGate& gate) const;

    EntryDecision invalidate(SymbolWatch& watch, EntryDecision base, DecisionReason reason,
                             const std::string& detail) const;

    EntryDecision make_decision(const SymbolWatch& watch, int64_t time_ms, LogicalPosition pos,
                                double price) const;
};
