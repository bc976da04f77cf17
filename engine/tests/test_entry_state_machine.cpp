#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/entry_state_machine.hpp"
#include "../src/errors.hpp"
#include "test_helpers.hpp"

using Catch::Approx;

namespace {

// Drives the standard strong breakout up to the bar that closes the confirmation candle
EntryDecision run_to_confirmation(const EntryStateMachine& machine, SymbolWatch& watch) {
    EntryDecision last;
    for (const auto& bar : strong_breakout_bars()) {
        last = feed_bar(machine, watch, bar);
    }
    return last;
}

}

TEST_CASE("Strong breakout confirmed by an aggressive sample", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    EntryStateMachine machine(cfg);
    SymbolWatch watch(long_setup(), cfg);
    auto bars = strong_breakout_bars();

    for (int i = 0; i < 20; i++) {
        auto d = feed_bar(machine, watch, bars[i]);
        REQUIRE(d.action == DecisionAction::Wait);
        REQUIRE(d.reason == DecisionReason::PriceNotThroughPivot);
    }

    auto crossing = feed_bar(machine, watch, bars[20]);
    REQUIRE(crossing.reason == DecisionReason::BreakoutDetected);
    REQUIRE(crossing.state_to == MachineState::WatchingBreakout);
    REQUIRE(crossing.signals.breakout_kind == BreakoutKind::Strong);

    for (int i = 21; i < 32; i++) {
        auto d = feed_bar(machine, watch, bars[i]);
        REQUIRE(d.reason == DecisionReason::AwaitingConfirmationCandle);
    }

    auto candle = feed_bar(machine, watch, bars[32]);
    REQUIRE(candle.reason == DecisionReason::MomentumConfirmed);
    REQUIRE(candle.action == DecisionAction::Wait);
    REQUIRE(watch.state == MachineState::AwaitingConfirmation);
    REQUIRE(candle.signals.volume_ratio.has_value());
    REQUIRE(*candle.signals.volume_ratio >= 2.0);

    SECTION("momentum without order flow never enters") {
        for (int i = 33; i <= 36; i++) {
            double open = 101.1 + 0.05 * (i - 33);
            auto d = feed_bar(machine, watch, make_bar(bar_time(i), open, open + 0.05, 6000));
            REQUIRE(d.action == DecisionAction::Wait);
            REQUIRE(d.reason == DecisionReason::AwaitingOrderFlow);
        }
    }

    SECTION("below the single-sample threshold keeps waiting") {
        auto d = machine.on_order_flow(watch, flow(bar_time(32) + 1000, -15.0), EntryGate{});
        REQUIRE(d.action == DecisionAction::Wait);
        REQUIRE(d.reason == DecisionReason::ThresholdNotMet);
    }

    SECTION("a single aggressive sample enters") {
        auto d = machine.on_order_flow(watch, flow(bar_time(32) + 1000, -25.0), EntryGate{});
        REQUIRE(d.is_enter());
        REQUIRE(d.reason == DecisionReason::PathAAggressiveImbalance);
        REQUIRE(d.state_to == MachineState::Confirmed);
        REQUIRE(d.reference_price == Approx(101.1));
        REQUIRE(watch.state == MachineState::Idle);
        REQUIRE(watch.tracker.get() == nullptr);
    }

    SECTION("selling pressure does not confirm a long") {
        auto d = machine.on_order_flow(watch, flow(bar_time(32) + 1000, 40.0), EntryGate{});
        REQUIRE_FALSE(d.is_enter());
    }
}

TEST_CASE("Sustained imbalance confirms through Path B", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    EntryStateMachine machine(cfg);
    auto bars = strong_breakout_bars();

    SECTION("samples after the candle close") {
        SymbolWatch watch(long_setup(), cfg);
        run_to_confirmation(machine, watch);

        auto t = bar_time(32);
        REQUIRE(machine.on_order_flow(watch, flow(t + 1000, -15.0), EntryGate{}).reason ==
                DecisionReason::ThresholdNotMet);
        REQUIRE(machine.on_order_flow(watch, flow(t + 2000, -14.0), EntryGate{}).reason ==
                DecisionReason::ThresholdNotMet);
        auto d = machine.on_order_flow(watch, flow(t + 3000, -13.0), EntryGate{});
        REQUIRE(d.is_enter());
        REQUIRE(d.reason == DecisionReason::PathBSustainedImbalance);
    }

    SECTION("samples collected while watching fire at the candle close") {
        SymbolWatch watch(long_setup(), cfg);
        for (int i = 0; i <= 25; i++) feed_bar(machine, watch, bars[i]);

        for (int k = 1; k <= 3; k++) {
            auto d = machine.on_order_flow(watch, flow(bar_time(25) + k * 1000, -15.0), EntryGate{});
            REQUIRE(d.reason == DecisionReason::AwaitingConfirmationCandle);
        }
        for (int i = 26; i < 32; i++) feed_bar(machine, watch, bars[i]);

        auto d = feed_bar(machine, watch, bars[32]);
        REQUIRE(d.is_enter());
        REQUIRE(d.reason == DecisionReason::PathBSustainedImbalance);
    }

    SECTION("the aggressive path wins when both fire") {
        SymbolWatch watch(long_setup(), cfg);
        run_to_confirmation(machine, watch);
        auto t = bar_time(32);
        machine.on_order_flow(watch, flow(t + 1000, -15.0), EntryGate{});
        machine.on_order_flow(watch, flow(t + 2000, -15.0), EntryGate{});
        auto d = machine.on_order_flow(watch, flow(t + 3000, -30.0), EntryGate{});
        REQUIRE(d.reason == DecisionReason::PathAAggressiveImbalance);
    }
}

TEST_CASE("Confirmation after price reverts through the pivot", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    EntryStateMachine machine(cfg);
    SymbolWatch watch(long_setup(), cfg);
    run_to_confirmation(machine, watch);

    SECTION("sample priced behind the pivot") {
        auto d = machine.on_order_flow(watch, flow(bar_time(32) + 1000, -30.0, 99.9), EntryGate{});
        REQUIRE(d.action == DecisionAction::Reject);
        REQUIRE(d.reason == DecisionReason::PriceReversal);
        REQUIRE(to_string(d.reason) == "price_reversal");
        REQUIRE(watch.state == MachineState::Idle);
    }

    SECTION("bar closing behind the pivot") {
        auto d = feed_bar(machine, watch, make_bar(bar_time(33), 101.1, 99.8, 2000));
        REQUIRE(d.reason == DecisionReason::PriceReversal);

        // The watch is gone, so a late aggressive sample cannot enter
        auto late = machine.on_order_flow(watch, flow(bar_time(33) + 1000, -30.0), EntryGate{});
        REQUIRE_FALSE(late.is_enter());
        REQUIRE(late.reason == DecisionReason::NoActiveBreakout);
    }
}

TEST_CASE("Confirmation interval follows the bar interval", "[entry]") {
    auto bars_to_awaiting = [](StrategyConfig& cfg, int interval_sec) {
        EntryStateMachine machine(cfg);
        SymbolWatch watch(long_setup(), cfg);
        auto bars = strong_breakout_bars(interval_sec);
        for (int i = 0; i <= 20; i++) feed_bar(machine, watch, bars[i]);
        REQUIRE(watch.state == MachineState::WatchingBreakout);

        int count = 0;
        for (int i = 21; i < static_cast<int>(bars.size()); i++) {
            feed_bar(machine, watch, bars[i]);
            count++;
            if (watch.state == MachineState::AwaitingConfirmation) break;
        }
        return count;
    };

    auto cfg = StrategyConfig::defaults();
    REQUIRE(cfg.bars_per_confirmation_interval() == 12);
    REQUIRE(bars_to_awaiting(cfg, 5) == 12);

    cfg.set_bar_interval(60);
    REQUIRE(cfg.bars_per_confirmation_interval() == 1);
    REQUIRE(bars_to_awaiting(cfg, 60) == 1);
}

TEST_CASE("Entry gates", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    EntryStateMachine machine(cfg);
    SymbolWatch watch(long_setup(), cfg);
    auto bars = strong_breakout_bars();
    for (int i = 0; i < 20; i++) feed_bar(machine, watch, bars[i]);

    SECTION("attempt cap") {
        EntryGate gate;
        gate.attempts = cfg.max_attempts_per_pivot;
        auto d = feed_bar(machine, watch, bars[20], gate);
        REQUIRE(d.action == DecisionAction::Reject);
        REQUIRE(d.reason == DecisionReason::AttemptCapExhausted);

        // The crossing is consumed; the next bar above the pivot is not a new one
        auto next = feed_bar(machine, watch, bars[21]);
        REQUIRE(next.reason == DecisionReason::PriceNotThroughPivot);

        feed_bar(machine, watch, make_bar(bar_time(22), 100.5, 99.7, 1000));
        auto again = feed_bar(machine, watch, make_bar(bar_time(23), 99.8, 100.6, 3000));
        REQUIRE(again.reason == DecisionReason::BreakoutDetected);
    }

    SECTION("open position") {
        EntryGate gate;
        gate.position_open = true;
        auto d = feed_bar(machine, watch, bars[20], gate);
        REQUIRE(d.action == DecisionAction::Wait);
        REQUIRE(d.reason == DecisionReason::PositionOpen);
    }

    SECTION("reconciliation pending and halted") {
        EntryGate pending;
        pending.reconciliation_pending = true;
        REQUIRE(feed_bar(machine, watch, bars[20], pending).reason ==
                DecisionReason::ReconciliationPending);

        feed_bar(machine, watch, make_bar(bar_time(21), 100.5, 99.7, 1000));
        EntryGate halted;
        halted.entries_halted = true;
        auto d = feed_bar(machine, watch, make_bar(bar_time(22), 99.8, 100.6, 3000), halted);
        REQUIRE(d.action == DecisionAction::Reject);
        REQUIRE(d.reason == DecisionReason::ReconciliationHold);
    }
}

TEST_CASE("Entry window", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    EntryStateMachine machine(cfg);
    SymbolWatch watch(long_setup(), cfg);

    // Shift the whole sequence to 09:30
    for (auto bar : strong_breakout_bars()) {
        bar.open_time_ms -= 30 * 60 * 1000;
        auto d = feed_bar(machine, watch, bar);
        if (d.action == DecisionAction::Reject) {
            REQUIRE(d.reason == DecisionReason::OutsideEntryWindow);
            REQUIRE(d.logical_position == 20);
            return;
        }
    }
    FAIL("crossing before the entry window was not rejected");
}

TEST_CASE("Room to target", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    cfg.filters.min_room_to_target_pct = 0.005;
    EntryStateMachine machine(cfg);

    auto setup = long_setup();
    setup.target_price = 101.3;
    SymbolWatch watch(setup, cfg);
    run_to_confirmation(machine, watch);

    auto d = machine.on_order_flow(watch, flow(bar_time(32) + 1000, -30.0), EntryGate{});
    REQUIRE(d.action == DecisionAction::Reject);
    REQUIRE(d.reason == DecisionReason::InsufficientRoom);
}

TEST_CASE("Pullback re-arms the confirmation interval", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    EntryStateMachine machine(cfg);
    SymbolWatch watch(long_setup(), cfg);
    auto bars = strong_breakout_bars();
    for (int i = 0; i <= 20; i++) feed_bar(machine, watch, bars[i]);

    // 100.5 cleared the pivot by 0.5%; 100.2 is back within the 0.3% pullback distance
    auto d = feed_bar(machine, watch, make_bar(bar_time(21), 100.5, 100.2, 1500));
    REQUIRE(d.reason == DecisionReason::PullbackRearmed);
    REQUIRE(watch.tracker.get()->breakout_kind == BreakoutKind::Pullback);
    REQUIRE(watch.tracker.get()->breakout_logical_position == 21);
    REQUIRE(watch.state == MachineState::WatchingBreakout);
}

TEST_CASE("Stale breakout", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    cfg.setups[SetupType::Momentum].max_breakout_age_sec = 100;
    EntryStateMachine machine(cfg);
    SymbolWatch watch(long_setup(), cfg);
    run_to_confirmation(machine, watch);

    for (int i = 33; i <= 40; i++) {
        double open = 101.1 + 0.01 * (i - 33);
        auto d = feed_bar(machine, watch, make_bar(bar_time(i), open, open + 0.01, 1000));
        REQUIRE(d.reason == DecisionReason::AwaitingOrderFlow);
    }
    auto d = feed_bar(machine, watch, make_bar(bar_time(41), 101.2, 101.2, 1000));
    REQUIRE(d.reason == DecisionReason::StaleBreakout);
    REQUIRE(watch.state == MachineState::Idle);
}

TEST_CASE("Breakout age follows the clock at any bar interval", "[entry]") {
    for (int interval : {5, 60}) {
        auto cfg = StrategyConfig::defaults();
        cfg.setups[SetupType::Momentum].max_breakout_age_sec = 600;
        cfg.set_bar_interval(interval);
        EntryStateMachine machine(cfg);
        SymbolWatch watch(long_setup(), cfg);
        auto bars = strong_breakout_bars(interval);

        int64_t stale_after_sec = -1;
        for (int i = 0; i < 400 && stale_after_sec < 0; i++) {
            double open = 100.5 + 0.01 * (i - 21);
            Bar bar = i < static_cast<int>(bars.size())
                          ? bars[i]
                          : make_bar(bar_time(i, interval), open, open + 0.01, 1000);
            auto d = feed_bar(machine, watch, bar);
            if (d.reason == DecisionReason::StaleBreakout) {
                stale_after_sec = (bar.open_time_ms - bar_time(20, interval)) / 1000;
            }
        }

        INFO("bar interval " << interval << "s");
        REQUIRE(stale_after_sec > 600);
        REQUIRE(stale_after_sec <= 600 + interval);
    }
}

TEST_CASE("Volume ratio lookback", "[entry]") {
    BarBuffer bars(16);
    for (int i = 0; i < 40; i++) {
        bars.append(make_bar(bar_time(i), 10.0, 10.0, i < 35 ? 100.0 : 300.0));
    }

    REQUIRE(EntryStateMachine::volume_ratio(bars, 35, 36, 10) == Approx(3.0));
    // Window reaches before the oldest retained bar
    REQUIRE_FALSE(EntryStateMachine::volume_ratio(bars, 35, 35, 20).has_value());

    BarBuffer fresh(16);
    fresh.append(make_bar(bar_time(0), 10.0, 10.0, 100.0));
    REQUIRE_FALSE(EntryStateMachine::volume_ratio(fresh, 0, 0, 10).has_value());
}

TEST_CASE("Malformed order-flow samples", "[entry]") {
    auto cfg = StrategyConfig::defaults();
    EntryStateMachine machine(cfg);
    SymbolWatch watch(long_setup(), cfg);
    feed_bar(machine, watch, make_bar(bar_time(0), 99.5, 99.5, 1000));

    REQUIRE_THROWS_AS(machine.on_order_flow(watch, flow(bar_time(0) + 1, 150.0), EntryGate{}),
                      DataError);
    REQUIRE_THROWS_AS(machine.on_order_flow(watch, flow(bar_time(0) + 1, -5.0, -1.0), EntryGate{}),
                      DataError);

    machine.on_order_flow(watch, flow(bar_time(0) + 2000, -5.0), EntryGate{});
    REQUIRE_THROWS_AS(machine.on_order_flow(watch, flow(bar_time(0) + 1000, -5.0), EntryGate{}),
                      DataError);
}
