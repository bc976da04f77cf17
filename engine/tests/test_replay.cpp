#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/replay.hpp"
#include "test_helpers.hpp"
#include <fstream>

namespace {

FeedEvent bar_event(const std::string& symbol, const Bar& bar) {
    FeedEvent ev;
    ev.kind = FeedEvent::Kind::Bar;
    ev.symbol = symbol;
    ev.bar = bar;
    return ev;
}

FeedEvent flow_event(const std::string& symbol, const OrderFlowSample& sample) {
    FeedEvent ev;
    ev.kind = FeedEvent::Kind::Flow;
    ev.symbol = symbol;
    ev.sample = sample;
    return ev;
}

// Breakout, confirming sample, run-up through the first partial, then a fade
// that takes out the breakeven stop
std::vector<FeedEvent> recorded_session() {
    std::vector<FeedEvent> events;
    for (const auto& bar : strong_breakout_bars()) {
        events.push_back(bar_event("AAPL", bar));
    }
    events.push_back(flow_event("AAPL", flow(bar_time(33), -25.0)));

    double price = 101.1;
    int i = 33;
    for (; price < 102.3; ++i) {
        events.push_back(bar_event("AAPL", make_bar(bar_time(i), price, price + 0.1, 2000)));
        price += 0.1;
    }
    for (; price > 100.5; ++i) {
        events.push_back(bar_event("AAPL", make_bar(bar_time(i), price, price - 0.2, 1500)));
        price -= 0.2;
    }
    return events;
}

ReplayResult replay(const std::vector<FeedEvent>& events) {
    auto broker = std::make_shared<SimulatedBroker>();
    Engine engine(StrategyConfig::defaults(), broker, nullptr, nullptr,
                  [](std::chrono::milliseconds) {});
    engine.load_watchlist({long_setup("AAPL")});
    engine.start();
    ReplayDriver driver(engine, broker);
    return driver.run(events);
}

}

TEST_CASE("Replay is deterministic", "[replay]") {
    auto events = recorded_session();
    auto first = replay(events);
    auto second = replay(events);

    REQUIRE(first.events == static_cast<int64_t>(events.size()));
    REQUIRE(first.rejected == 0);
    REQUIRE_FALSE(first.ledger.empty());
    REQUIRE(first.ledger[0].partials.size() == 1);

    REQUIRE(first.decisions == second.decisions);
    REQUIRE(first.ledger.size() == second.ledger.size());
    for (size_t i = 0; i < first.ledger.size(); ++i) {
        REQUIRE(first.ledger[i].to_json() == second.ledger[i].to_json());
    }
}

TEST_CASE("Replay collects only the decisions it drove", "[replay]") {
    auto broker = std::make_shared<SimulatedBroker>();
    Engine engine(StrategyConfig::defaults(), broker, nullptr, nullptr,
                  [](std::chrono::milliseconds) {});
    engine.load_watchlist({long_setup("AAPL")});
    engine.start();

    EntryDecision earlier;
    earlier.symbol = "AAPL";
    earlier.action = DecisionAction::Reject;
    earlier.reason = DecisionReason::OutsideEntryWindow;
    engine.decisions().record(earlier);
    REQUIRE(engine.decisions().size() == 1);

    ReplayDriver driver(engine, broker);
    auto res = driver.run(recorded_session());
    REQUIRE(engine.decisions().size() == res.decisions.size() + 1);
    REQUIRE(res.decisions.at(0)["action"] == "ENTER");
}

TEST_CASE("Events from separate streams are merged by time", "[replay]") {
    // Bars arrive as one batch and samples as another
    std::vector<FeedEvent> events{
        bar_event("AAPL", make_bar(bar_time(0), 99.5, 99.6, 1000)),
        bar_event("AAPL", make_bar(bar_time(2), 99.6, 99.4, 1000)),
        bar_event("MSFT", make_bar(bar_time(1), 50.0, 50.1, 800)),
        flow_event("AAPL", flow(bar_time(1) + 500, -30.0, 99.7)),
        flow_event("AAPL", flow(bar_time(0), 5.0)),
    };

    auto order = time_order(events);
    REQUIRE(order == std::vector<size_t>{0, 4, 2, 3, 1});

    SECTION("a bar keeps its place ahead of a sample stamped at its open") {
        REQUIRE(events[order[0]].kind == FeedEvent::Kind::Bar);
        REQUIRE(events[order[1]].kind == FeedEvent::Kind::Flow);
    }

    SECTION("an empty batch") {
        REQUIRE(time_order({}).empty());
    }
}

TEST_CASE("Replay feed reads JSON lines", "[replay]") {
    TempDir dir;
    auto path = (dir.path / "session.jsonl").string();
    {
        std::ofstream out(path);
        out << "# AAPL 2024-03-04\n";
        out << feed_event_to_json(bar_event("AAPL", make_bar(bar_time(0), 99.5, 99.6, 1000))).dump() << "\n";
        out << "{not json\n";
        out << R"({"type":"bar","symbol":"AAPL","open_time_ms":1709546405000})" << "\n";
        out << R"({"type":"quote","symbol":"AAPL"})" << "\n";
        out << "\n";
        out << feed_event_to_json(flow_event("AAPL", flow(bar_time(1), 12.5, 99.7))).dump() << "\n";
    }

    ReplayFeed feed(path);
    auto bar = feed.next();
    REQUIRE(bar);
    REQUIRE(bar->kind == FeedEvent::Kind::Bar);
    REQUIRE(bar->bar.close == 99.6);

    auto sample = feed.next();
    REQUIRE(sample);
    REQUIRE(sample->kind == FeedEvent::Kind::Flow);
    REQUIRE(sample->sample.price);
    REQUIRE(*sample->sample.price == 99.7);

    REQUIRE_FALSE(feed.next());
    REQUIRE(feed.rejected() == 3);
    REQUIRE(feed.line() == 7);
}

TEST_CASE("Feed event parsing", "[replay]") {
    SECTION("order events") {
        nlohmann::json j = {{"type", "order"}, {"event", "FILLED"}, {"order_id", "SIM-4"},
                            {"symbol", "AAPL"}, {"filled_shares", 50}, {"fill_price", 101.2},
                            {"time_ms", bar_time(40)}};
        auto ev = parse_feed_event(j);
        REQUIRE(ev.kind == FeedEvent::Kind::Order);
        REQUIRE(ev.order.type == OrderEventType::Filled);
        REQUIRE(ev.order.filled_shares == 50);
        REQUIRE(ev.time_ms() == bar_time(40));
        REQUIRE(feed_event_to_json(ev)["event"] == "FILLED");
    }

    SECTION("malformed events") {
        REQUIRE_THROWS_AS(parse_feed_event({{"type", "bar"}, {"symbol", "AAPL"}}), DataError);
        REQUIRE_THROWS_AS(parse_feed_event({{"symbol", "AAPL"}}), DataError);
        REQUIRE_THROWS_AS(parse_feed_event({{"type", "flow"}, {"symbol", "AAPL"},
                                            {"time_ms", "soon"}, {"imbalance_pct", 3.0}}),
                          DataError);
    }

    SECTION("out-of-order bars are counted, not fatal") {
        auto broker = std::make_shared<SimulatedBroker>();
        Engine engine(StrategyConfig::defaults(), broker, nullptr, nullptr,
                      [](std::chrono::milliseconds) {});
        engine.load_watchlist({long_setup("AAPL")});
        engine.start();
        ReplayDriver driver(engine, broker);

        REQUIRE(driver.dispatch(bar_event("AAPL", make_bar(bar_time(1), 99.5, 99.5, 1000))));
        REQUIRE_FALSE(driver.dispatch(bar_event("AAPL", make_bar(bar_time(0), 99.5, 99.5, 1000))));
        REQUIRE_FALSE(driver.dispatch(bar_event("MSFT", make_bar(bar_time(2), 99.5, 99.5, 1000))));
        REQUIRE(engine.latest_position("AAPL") == 0);
    }
}
