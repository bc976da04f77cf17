#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_bars = get_env("STREAM_BARS", "pivot.bars");
    cfg.stream_flow = get_env("STREAM_FLOW", "pivot.orderflow");
    cfg.stream_order_events = get_env("STREAM_ORDER_EVENTS", "pivot.orders.events");
    cfg.stream_order_requests = get_env("STREAM_ORDER_REQUESTS", "pivot.orders.requests");
    cfg.stream_decisions = get_env("STREAM_DECISIONS", "pivot.decisions");
    cfg.stream_trades = get_env("STREAM_TRADES", "pivot.trades");
    cfg.holdings_key = get_env("HOLDINGS_KEY", "pivot:holdings");

    cfg.pg_dsn = get_env("PG_DSN");
    cfg.state_dir = get_env("STATE_DIR", "./state");

    cfg.strategy_config_path = get_env("STRATEGY_CONFIG", "strategy.json");
    cfg.watchlist_path = get_env("WATCHLIST", "watchlist.json");

    cfg.mode = get_env("ENGINE_MODE", "live");
    cfg.replay_file = get_env("REPLAY_FILE");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "pivotbreak");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (mode != "live" && mode != "replay") {
        throw std::runtime_error("ENGINE_MODE must be 'live' or 'replay'");
    }
    if (mode == "replay" && replay_file.empty()) {
        throw std::runtime_error("REPLAY_FILE is required in replay mode");
    }
    if (strategy_config_path.empty() || watchlist_path.empty()) {
        throw std::runtime_error("STRATEGY_CONFIG and WATCHLIST are required");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Mode: {}", mode);
    spdlog::info("  Session store: {}", pg_dsn.empty() ? state_dir : util::redact_dsn(pg_dsn));
}
