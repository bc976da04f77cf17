#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_bars;
    std::string stream_flow;
    std::string stream_order_events;
    std::string stream_order_requests;
    std::string stream_decisions;
    std::string stream_trades;
    std::string holdings_key;

    // Postgres (optional; file-backed session state when empty)
    std::string pg_dsn;
    std::string state_dir;

    // Strategy inputs
    std::string strategy_config_path;
    std::string watchlist_path;

    // "live" reads Redis streams, "replay" reads replay_file
    std::string mode;
    std::string replay_file;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
