#pragma once
#include "engine.hpp"
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>

// Backing for GET /health. Redis and Postgres are optional (replay mode,
// file-backed session state) and reported only when present.
class HealthCheck {
public:
    HealthCheck(const Engine& engine, std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg);

    nlohmann::json get_status();
    bool is_healthy();

    void set_loop_status(const std::string& status);
    void update_last_decision();

private:
    const Engine& engine_;
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::mutex mutex_;
    std::string loop_status_;
    std::string last_decision_ts_;
};
