#pragma once

#include "position_manager.hpp"
#include "session_store.hpp"
#include <string>
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>

// Session snapshots, the closed-trade ledger and the decision audit in Postgres
class PostgresStore : public SessionBackend {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();

    void save(const SessionSnapshot& snapshot) override;
    std::optional<SessionSnapshot> load(const std::string& session_date) override;
    std::string name() const override { return "postgres"; }

    void record_trade(const std::string& session_date, const ClosedTrade& trade);
    void record_decision(const nlohmann::json& decision);

    bool ping();

private:
    std::string dsn_;

    pqxx::connection make_connection();
};
