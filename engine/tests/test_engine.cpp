#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/engine.hpp"
#include "../src/errors.hpp"
#include "../src/sim_broker.hpp"
#include "test_helpers.hpp"
#include <thread>

using Catch::Approx;

namespace {

void no_sleep(std::chrono::milliseconds) {}

// Feeds the breakout and a confirming sample; returns the sample's decision
EntryDecision enter_long(Engine& engine, SimulatedBroker& broker, const std::string& symbol) {
    for (const auto& bar : strong_breakout_bars()) {
        broker.on_price(symbol, bar.close, bar.open_time_ms);
        engine.on_bar(symbol, bar);
    }
    auto decision = engine.on_order_flow(symbol, flow(bar_time(33), -25.0));
    engine.poll_broker();
    return decision;
}

}

TEST_CASE("Engine enters and closes through the broker", "[engine]") {
    auto broker = std::make_shared<SimulatedBroker>();
    auto decisions = std::make_shared<DecisionLog>();
    Engine engine(StrategyConfig::defaults(), broker, nullptr, decisions, no_sleep);
    engine.load_watchlist({long_setup("AAPL")});

    std::vector<ClosedTrade> closed;
    engine.on_trade_closed([&](const ClosedTrade& t) { closed.push_back(t); });

    SECTION("nothing is entered before reconciliation") {
        for (const auto& bar : strong_breakout_bars()) engine.on_bar("AAPL", bar);
        auto decision = engine.on_order_flow("AAPL", flow(bar_time(33), -25.0));
        REQUIRE(decision.action == DecisionAction::Wait);
        REQUIRE(decision.reason == DecisionReason::ReconciliationPending);
        REQUIRE_FALSE(engine.positions().has_position("AAPL"));
    }

    SECTION("entry, stop fill and trade listener") {
        engine.start();
        auto decision = enter_long(engine, *broker, "AAPL");
        REQUIRE(decision.action == DecisionAction::Enter);
        REQUIRE(decision.attempts == 1);

        auto pos = engine.positions().get("AAPL");
        REQUIRE(pos);
        REQUIRE(pos->entry_filled);
        REQUIRE(pos->shares == 197);
        REQUIRE(pos->stop_price == Approx(100.0));
        REQUIRE(engine.exposure() == Approx(197 * 101.1));

        broker->on_price("AAPL", 99.9, bar_time(34));
        engine.poll_broker();
        REQUIRE_FALSE(engine.positions().has_position("AAPL"));
        REQUIRE(closed.size() == 1);
        REQUIRE(closed[0].reason == ExitReason::StopHit);
        REQUIRE(engine.exposure() == Approx(0.0));
        REQUIRE(engine.attempts("AAPL") == 1);
    }

    SECTION("status reports open P&L at the last bar close") {
        engine.start();
        enter_long(engine, *broker, "AAPL");
        REQUIRE(engine.status()["unrealized_pnl"].get<double>() == Approx(0.0));

        broker->on_price("AAPL", 101.3, bar_time(34));
        engine.on_bar("AAPL", make_bar(bar_time(34), 101.2, 101.3, 1500));
        auto status = engine.status();
        REQUIRE(status["open_positions"] == 1);
        REQUIRE(status["unrealized_pnl"].get<double>() == Approx(197 * 0.2));
        REQUIRE(status["decisions"] == 1);
    }

    SECTION("unwatched symbols are rejected as bad data") {
        REQUIRE_THROWS_AS(engine.on_bar("ZZZ", make_bar(bar_time(0), 1.0, 1.0, 1.0)), DataError);
    }
}

TEST_CASE("Decision log records entries and rejections only", "[engine]") {
    auto broker = std::make_shared<SimulatedBroker>();
    auto decisions = std::make_shared<DecisionLog>();
    std::vector<nlohmann::json> forwarded;
    decisions->add_sink([&](const nlohmann::json& rec) { forwarded.push_back(rec); });
    decisions->add_sink([](const nlohmann::json&) { throw std::runtime_error("sink down"); });

    Engine engine(StrategyConfig::defaults(), broker, nullptr, decisions, no_sleep);
    engine.load_watchlist({long_setup("AAPL")});
    engine.start();
    enter_long(engine, *broker, "AAPL");

    REQUIRE(decisions->size() == 1);
    REQUIRE(forwarded.size() == 1);
    const auto& rec = forwarded[0];
    for (const char* key : {"time_ms", "symbol", "logical_position", "action", "reason", "detail",
                            "state_from", "state_to", "side", "setup_type", "pivot", "price",
                            "price_vs_pivot_pct", "volume_ratio", "candle_pct", "imbalance_pct",
                            "consecutive_imbalance_count", "breakout_kind", "attempts"}) {
        INFO(key);
        REQUIRE(rec.contains(key));
    }
    REQUIRE(rec["action"] == "ENTER");
    REQUIRE(rec["time_ms"] == bar_time(33));
}

TEST_CASE("Symbols are processed concurrently", "[engine]") {
    auto broker = std::make_shared<SimulatedBroker>();
    Engine engine(StrategyConfig::defaults(), broker, nullptr, nullptr, no_sleep);
    engine.load_watchlist({long_setup("AAPL"), long_setup("MSFT")});
    engine.start();

    EntryDecision aapl;
    EntryDecision msft;
    std::thread a([&] { aapl = enter_long(engine, *broker, "AAPL"); });
    std::thread m([&] { msft = enter_long(engine, *broker, "MSFT"); });
    a.join();
    m.join();
    engine.poll_broker();

    REQUIRE(aapl.action == DecisionAction::Enter);
    REQUIRE(msft.action == DecisionAction::Enter);
    REQUIRE(engine.positions().get("AAPL")->shares == 197);
    REQUIRE(engine.positions().get("MSFT")->shares == 197);
    REQUIRE(engine.latest_position("AAPL") == 32);
    REQUIRE(engine.latest_position("MSFT") == 32);
    REQUIRE(engine.exposure() == Approx(2 * 197 * 101.1));
}

TEST_CASE("Exposure cap across symbols", "[engine]") {
    auto cfg = StrategyConfig::defaults();
    cfg.account.max_total_exposure = 30000;
    auto broker = std::make_shared<SimulatedBroker>();
    Engine engine(cfg, broker, nullptr, nullptr, no_sleep);
    engine.load_watchlist({long_setup("AAPL"), long_setup("MSFT")});
    engine.start();

    REQUIRE(enter_long(engine, *broker, "AAPL").action == DecisionAction::Enter);
    auto second = enter_long(engine, *broker, "MSFT");
    REQUIRE(second.action == DecisionAction::Reject);
    REQUIRE(second.reason == DecisionReason::ExposureLimit);
    REQUIRE_FALSE(engine.positions().has_position("MSFT"));
}

TEST_CASE("Restart reconciles persisted state with the broker", "[engine]") {
    TempDir dir;
    auto backend = std::make_shared<JsonFileSessionBackend>(dir.path.string());

    SessionSnapshot snap;
    snap.as_of_ms = bar_time(50);
    snap.positions = {held_position("AAPL", Side::Long, 100), held_position("MSFT", Side::Long, 20)};
    snap.last_positions = {{"AAPL", 40}, {"MSFT", 50}};
    snap.attempts[AttemptGuard::key("MSFT", 100.0)] = 1;
    SessionStateStore(backend, kSessionDate).save(snap);

    auto broker = std::make_shared<SimulatedBroker>();
    broker->set_holding("MSFT", 20, 100.5);
    broker->set_holding("AMD", 5, 160.0);

    auto store = std::make_shared<SessionStateStore>(backend, kSessionDate);
    Engine engine(StrategyConfig::defaults(), broker, store, nullptr, no_sleep);
    engine.load_watchlist({long_setup("AAPL"), long_setup("MSFT"), long_setup("AMD")});
    auto report = engine.start();

    REQUIRE(engine.reconciled());
    REQUIRE(report.clean == std::vector<std::string>{"MSFT"});
    REQUIRE(report.halted.count("AAPL") == 1);
    REQUIRE(report.untracked == std::vector<std::string>{"AMD"});

    SECTION("mismatched symbols are halted and not restored") {
        REQUIRE(engine.is_halted("AAPL"));
        REQUIRE_FALSE(engine.positions().has_position("AAPL"));
        REQUIRE(engine.is_halted("AMD"));
        REQUIRE_FALSE(engine.is_halted("MSFT"));
        REQUIRE(engine.status()["halted"].size() == 2);
    }

    SECTION("clean positions resume with their counters") {
        REQUIRE(engine.positions().has_position("MSFT"));
        REQUIRE(engine.exposure() == Approx(20 * 100.5));
        REQUIRE(engine.attempts("MSFT") == 1);
    }

    SECTION("bar numbering continues after the last processed bar") {
        REQUIRE(engine.latest_position("MSFT") == 50);
        REQUIRE(engine.latest_position("AAPL") == 40);
        auto decision = engine.on_bar("MSFT", make_bar(bar_time(51), 100.5, 100.6, 1000));
        REQUIRE(decision.logical_position == 51);
        REQUIRE(engine.latest_position("MSFT") == 51);
    }
}

TEST_CASE("Shutdown and restart keep the session", "[engine]") {
    TempDir dir;
    auto backend = std::make_shared<JsonFileSessionBackend>(dir.path.string());
    auto bars = strong_breakout_bars();

    {
        auto broker = std::make_shared<SimulatedBroker>();
        auto store = std::make_shared<SessionStateStore>(backend, kSessionDate);
        Engine engine(StrategyConfig::defaults(), broker, store, nullptr, no_sleep);
        engine.load_watchlist({long_setup("AAPL")});
        engine.start();
        for (int i = 0; i < 10; i++) engine.on_bar("AAPL", bars[i]);
        engine.shutdown();
    }

    auto store = std::make_shared<SessionStateStore>(backend, kSessionDate);
    Engine engine(StrategyConfig::defaults(), std::make_shared<SimulatedBroker>(), store, nullptr,
                  no_sleep);
    engine.load_watchlist({long_setup("AAPL")});
    engine.start();

    REQUIRE(engine.latest_position("AAPL") == 9);
    engine.on_bar("AAPL", bars[10]);
    REQUIRE(engine.latest_position("AAPL") == 10);

    SECTION("a new session starts numbering over") {
        engine.begin_session("2024-03-05");
        REQUIRE(engine.latest_position("AAPL") == -1);
        REQUIRE(store->session_date() == "2024-03-05");
        engine.on_bar("AAPL", make_bar(bar_time(0) + 86400000, 99.5, 99.5, 1000));
        REQUIRE(engine.latest_position("AAPL") == 0);
    }
}
