#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(const Engine& engine, std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg)
    : engine_(engine), redis_(redis), pg_(pg), loop_status_("starting") {}

void HealthCheck::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthCheck::update_last_decision() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_decision_ts_ = util::current_iso8601();
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = !redis_ || redis_->ping();
    bool pg_ok = !pg_ || pg_->ping();

    std::string loop;
    nlohmann::json last_decision = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_status_;
        if (!last_decision_ts_.empty()) last_decision = last_decision_ts_;
    }

    auto engine = engine_.status();
    nlohmann::json status = {
        {"ok", redis_ok && pg_ok && engine_.reconciled()},
        {"redis", redis_ ? nlohmann::json(redis_ok) : nlohmann::json("disabled")},
        {"postgres", pg_ ? nlohmann::json(pg_ok) : nlohmann::json("disabled")},
        {"loop", loop},
        {"reconciled", engine_.reconciled()},
        {"halted_symbols", engine["halted"]},
        {"open_positions", engine["open_positions"]},
        {"last_decision_ts", last_decision},
        {"engine", engine}
    };

    return status;
}

bool HealthCheck::is_healthy() {
    return (!redis_ || redis_->ping()) && (!pg_ || pg_->ping()) && engine_.reconciled();
}
