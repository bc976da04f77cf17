#include "pg_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        // One row per trading day, overwritten on every mutation
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS session_state (
                session_date TEXT PRIMARY KEY,
                as_of_ms BIGINT NOT NULL,
                snapshot JSONB NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS closed_trades (
                id BIGSERIAL PRIMARY KEY,
                session_date TEXT NOT NULL,
                symbol TEXT NOT NULL,
                side TEXT NOT NULL,
                setup_type TEXT NOT NULL,
                entry_price NUMERIC NOT NULL,
                exit_price NUMERIC NOT NULL,
                shares BIGINT NOT NULL,
                fees NUMERIC NOT NULL,
                realized_pnl NUMERIC NOT NULL,
                reason TEXT NOT NULL,
                entry_time_ms BIGINT NOT NULL,
                exit_time_ms BIGINT NOT NULL,
                detail JSONB,
                UNIQUE (symbol, entry_time_ms, exit_time_ms)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS entry_decisions (
                id BIGSERIAL PRIMARY KEY,
                symbol TEXT NOT NULL,
                time_ms BIGINT NOT NULL,
                action TEXT NOT NULL,
                reason TEXT NOT NULL,
                record JSONB NOT NULL,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PostgresStore::save(const SessionSnapshot& snapshot) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    txn.exec_params(
        "INSERT INTO session_state (session_date, as_of_ms, snapshot) "
        "VALUES ($1, $2, $3::jsonb) "
        "ON CONFLICT (session_date) DO UPDATE SET as_of_ms = $2, snapshot = $3::jsonb, "
        "updated_at = NOW()",
        snapshot.session_date, snapshot.as_of_ms, snapshot.to_json().dump()
    );

    txn.commit();
}

std::optional<SessionSnapshot> PostgresStore::load(const std::string& session_date) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec_params(
        "SELECT snapshot::text FROM session_state WHERE session_date = $1",
        session_date
    );
    txn.commit();

    if (result.empty()) return std::nullopt;

    try {
        return SessionSnapshot::from_json(nlohmann::json::parse(result[0][0].as<std::string>()));
    } catch (const nlohmann::json::parse_error& e) {
        throw DataError("Corrupt session state for " + session_date + ": " + e.what());
    }
}

void PostgresStore::record_trade(const std::string& session_date, const ClosedTrade& trade) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO closed_trades (session_date, symbol, side, setup_type, entry_price, "
            "exit_price, shares, fees, realized_pnl, reason, entry_time_ms, exit_time_ms, detail) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13::jsonb) "
            "ON CONFLICT (symbol, entry_time_ms, exit_time_ms) DO NOTHING",
            session_date, trade.symbol, to_string(trade.side), to_string(trade.setup_type),
            trade.entry_price, trade.exit_price, trade.shares, trade.fees, trade.realized_pnl,
            to_string(trade.reason), trade.entry_time_ms, trade.exit_time_ms,
            trade.to_json().dump()
        );

        txn.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to record trade for {}: {}", trade.symbol, e.what());
    }
}

void PostgresStore::record_decision(const nlohmann::json& decision) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO entry_decisions (symbol, time_ms, action, reason, record) "
            "VALUES ($1, $2, $3, $4, $5::jsonb)",
            decision.at("symbol").get<std::string>(), decision.at("time_ms").get<int64_t>(),
            decision.at("action").get<std::string>(), decision.at("reason").get<std::string>(),
            decision.dump()
        );

        txn.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to record decision: {}", e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
