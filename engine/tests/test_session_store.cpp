#include <catch2/catch_test_macros.hpp>
#include "../src/attempt_guard.hpp"
#include "../src/errors.hpp"
#include "../src/session_store.hpp"
#include "test_helpers.hpp"
#include <fstream>

TEST_CASE("JsonFileSessionBackend", "[session]") {
    TempDir dir;
    auto backend = std::make_shared<JsonFileSessionBackend>(dir.path.string());
    SessionStateStore store(backend, kSessionDate);

    SessionSnapshot first;
    first.as_of_ms = kSessionOpenMs;
    first.positions.push_back(held_position("AAPL", Side::Long, 100));
    first.attempts[AttemptGuard::key("AAPL", 100.0)] = 1;
    first.last_positions["AAPL"] = 32;

    SECTION("nothing saved loads as empty") {
        REQUIRE_FALSE(store.load());
    }

    SECTION("a saved snapshot loads back") {
        store.save(first);
        auto loaded = store.load();
        REQUIRE(loaded);
        REQUIRE(loaded->session_date == kSessionDate);
        REQUIRE(loaded->positions.size() == 1);
        REQUIRE(loaded->positions[0].symbol == "AAPL");
        REQUIRE(loaded->positions[0].remaining_shares == 100);
        REQUIRE(loaded->attempts.at("AAPL@100.0000") == 1);
        REQUIRE(loaded->last_positions.at("AAPL") == 32);
        REQUIRE(store.saves() == 1);
    }

    SECTION("a corrupt file falls back to the previous copy") {
        store.save(first);
        SessionSnapshot second = first;
        second.as_of_ms = kSessionOpenMs + 5000;
        second.last_positions["AAPL"] = 33;
        store.save(second);

        {
            std::ofstream out(backend->path_for(kSessionDate), std::ios::trunc);
            out << "{\"session_date\": \"2024-03";
        }

        auto loaded = store.load();
        REQUIRE(loaded);
        REQUIRE(loaded->as_of_ms == kSessionOpenMs);
        REQUIRE(loaded->last_positions.at("AAPL") == 32);
    }

    SECTION("another day's state is not loaded") {
        store.save(first);
        store.set_session_date("2024-03-05");
        REQUIRE_FALSE(store.load());
    }
}

TEST_CASE("Reconciling persisted positions against broker holdings", "[session]") {
    auto pos = held_position("AAPL", Side::Long, 100);

    SECTION("matching holding passes") {
        REQUIRE_NOTHROW(SessionStateStore::reconcile_position(pos, {{"AAPL", 100, 100.5}}));
    }

    SECTION("no holding") {
        REQUIRE_THROWS_AS(SessionStateStore::reconcile_position(pos, {}), ReconciliationMismatch);
        REQUIRE_THROWS_AS(SessionStateStore::reconcile_position(pos, {{"AAPL", 0, 0.0}}),
                          ReconciliationMismatch);
    }

    SECTION("opposite side") {
        REQUIRE_THROWS_AS(SessionStateStore::reconcile_position(pos, {{"AAPL", -100, 100.5}}),
                          ReconciliationMismatch);
    }

    SECTION("share count differs") {
        REQUIRE_THROWS_AS(SessionStateStore::reconcile_position(pos, {{"AAPL", 60, 100.5}}),
                          ReconciliationMismatch);
    }

    SECTION("short positions hold negative shares") {
        auto short_pos = held_position("TSLA", Side::Short, 40);
        REQUIRE_NOTHROW(SessionStateStore::reconcile_position(short_pos, {{"TSLA", -40, 180.0}}));
    }

    SECTION("report separates clean, halted and untracked symbols") {
        std::vector<Position> persisted = {pos, held_position("MSFT", Side::Long, 20)};
        std::vector<Holding> holdings = {{"MSFT", 20, 410.0}, {"NVDA", 15, 880.0}};

        auto report = SessionStateStore::reconcile(persisted, holdings);
        REQUIRE(report.clean == std::vector<std::string>{"MSFT"});
        REQUIRE(report.halted.count("AAPL") == 1);
        REQUIRE(report.untracked == std::vector<std::string>{"NVDA"});
        REQUIRE_FALSE(report.ok());
    }
}
