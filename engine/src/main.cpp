#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "pg_store.hpp"
#include "redis_broker_client.hpp"
#include "redis_bus.hpp"
#include "replay.hpp"
#include "session_store.hpp"
#include "sim_broker.hpp"
#include "strategy_config.hpp"
#include "util.hpp"
#include "watchlist.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("pivotbreak", console_sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

static std::shared_ptr<SessionBackend> make_backend(const Config& config,
                                                    std::shared_ptr<PostgresStore>& pg) {
    if (!config.pg_dsn.empty()) {
        pg = std::make_shared<PostgresStore>(config.pg_dsn);
        pg->init_schema();
        return pg;
    }
    return std::make_shared<JsonFileSessionBackend>(config.state_dir);
}

static int run_replay(const Config& config, const StrategyConfig& strategy,
                      const std::vector<PivotSetup>& watchlist) {
    std::string session_date;
    {
        ReplayFeed probe(config.replay_file);
        auto first = probe.next();
        if (!first) {
            spdlog::error("Replay file {} has no events", config.replay_file);
            return 1;
        }
        session_date = util::session_date(first->time_ms(), strategy.session.utc_offset_minutes);
    }

    std::shared_ptr<PostgresStore> pg;
    auto store = std::make_shared<SessionStateStore>(make_backend(config, pg), session_date);
    auto decisions = std::make_shared<DecisionLog>();
    if (pg) {
        decisions->add_sink([pg](const nlohmann::json& rec) { pg->record_decision(rec); });
    }

    auto broker = std::make_shared<SimulatedBroker>();
    // Replay never waits out broker backoff
    Engine engine(strategy, broker, store, decisions, [](std::chrono::milliseconds) {});
    engine.load_watchlist(watchlist);
    engine.start();

    ReplayFeed feed(config.replay_file);
    ReplayDriver driver(engine, broker);
    auto result = driver.run(feed);
    engine.shutdown();

    nlohmann::json ledger = nlohmann::json::array();
    for (const auto& t : result.ledger) ledger.push_back(t.to_json());

    nlohmann::json out = {
        {"events", result.events},
        {"rejected_events", result.rejected},
        {"decisions", result.decisions},
        {"ledger", ledger},
        {"summary", engine.positions().summary().to_json()}
    };
    std::cout << out.dump(2) << std::endl;
    return 0;
}

static int run_live(const Config& config, const StrategyConfig& strategy,
                    const std::vector<PivotSetup>& watchlist) {
    auto redis = std::make_shared<RedisBus>(config.redis_url);
    if (!redis->ping()) {
        spdlog::error("Failed to connect to Redis");
        return 1;
    }

    std::shared_ptr<PostgresStore> pg;
    std::string session_date = util::session_date(util::current_timestamp_ms(),
                                                  strategy.session.utc_offset_minutes);
    auto store = std::make_shared<SessionStateStore>(make_backend(config, pg), session_date);

    auto broker = std::make_shared<RedisBrokerClient>(redis, config.stream_order_requests,
                                                      config.stream_order_events,
                                                      config.holdings_key, config.service_name);

    auto decisions = std::make_shared<DecisionLog>();
    decisions->add_sink([redis, &config](const nlohmann::json& rec) {
        redis->publish(config.stream_decisions, rec);
    });
    if (pg) {
        decisions->add_sink([pg](const nlohmann::json& rec) { pg->record_decision(rec); });
    }

    Engine engine(strategy, broker, store, decisions);
    engine.load_watchlist(watchlist);

    engine.on_trade_closed([redis, pg, store, &config](const ClosedTrade& trade) {
        redis->publish(config.stream_trades, trade.to_json());
        if (pg) pg->record_trade(store->session_date(), trade);
    });

    HealthCheck health(engine, redis, pg);
    decisions->add_sink([&health](const nlohmann::json&) { health.update_last_decision(); });

    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);

    // Nothing is entered until persisted positions agree with the broker
    health.set_loop_status("reconciling");
    while (!shutdown_requested && !engine.reconciled()) {
        try {
            auto report = engine.start();
            if (!report.ok()) {
                spdlog::error("Reconciliation found {} mismatched and {} untracked symbols",
                              report.halted.size(), report.untracked.size());
            }
        } catch (const BrokerFailure& e) {
            spdlog::error("Holdings unavailable, retrying: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(5));
        }
    }

    // /health comes up once the symbol set is final
    httplib::Server http_server;

    http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
        auto status = health.get_status();
        res.set_content(status.dump(), "application/json");
        res.status = status["ok"].get<bool>() ? 200 : 503;
    });

    std::thread http_thread([&]() {
        spdlog::info("HTTP server listening on {}:{}", config.listen_addr, config.listen_port);
        http_server.listen(config.listen_addr.c_str(), config.listen_port);
    });

    const std::string group = config.service_name + "_md";
    redis->create_consumer_group(config.stream_bars, group);
    redis->create_consumer_group(config.stream_flow, group);

    spdlog::info("Entering main loop");
    health.set_loop_status("running");

    while (!shutdown_requested) {
        try {
            // 1. Bars and order-flow samples, merged by data time
            std::vector<FeedEvent> events;
            std::vector<std::pair<std::string, std::string>> acks;  // stream, message id
            auto collect = [&](const std::string& stream, const char* type, int block_ms) {
                for (const auto& [msg_id, data] : redis->read_entries(
                         stream, group, config.service_name, 100, block_ms)) {
                    try {
                        auto msg = data;
                        msg["type"] = type;
                        events.push_back(parse_feed_event(msg));
                        acks.emplace_back(stream, msg_id);
                    } catch (const std::exception& e) {
                        spdlog::warn("{} {} dropped: {}", type, msg_id, e.what());
                        redis->ack_message(stream, group, msg_id);
                    }
                }
            };
            collect(config.stream_bars, "bar", 50);
            collect(config.stream_flow, "flow", 10);

            for (size_t i : time_order(events)) {
                const auto& ev = events[i];
                try {
                    if (ev.kind == FeedEvent::Kind::Bar) {
                        engine.on_bar(ev.symbol, ev.bar);
                    } else {
                        engine.on_order_flow(ev.symbol, ev.sample);
                    }
                } catch (const std::exception& e) {
                    spdlog::warn("{} event {} dropped: {}", ev.symbol, acks[i].second, e.what());
                }
                redis->ack_message(acks[i].first, group, acks[i].second);
            }

            // 2. Fills and order status
            engine.poll_broker();

            // 3. Trading day rollover
            std::string today = util::session_date(util::current_timestamp_ms(),
                                                   strategy.session.utc_offset_minutes);
            if (today != store->session_date()) {
                engine.begin_session(today);
            }

        } catch (const std::exception& e) {
            spdlog::error("Error in main loop: {}", e.what());
            health.set_loop_status("error");
            std::this_thread::sleep_for(std::chrono::seconds(1));
            health.set_loop_status("running");
        }
    }

    spdlog::info("Shutting down gracefully");
    health.set_loop_status("shutdown");
    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }

    // Session state is flushed while the broker connection is still up
    engine.shutdown();
    spdlog::info("Shutdown complete");
    return 0;
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} ({} mode)", config.service_name, config.mode);

        auto strategy = StrategyConfig::load_file(config.strategy_config_path);
        auto watchlist = load_watchlist(config.watchlist_path, strategy.filters);
        spdlog::info("Watchlist: {} setups from {}", watchlist.size(), config.watchlist_path);

        if (config.mode == "replay") {
            return run_replay(config, strategy, watchlist);
        }
        return run_live(config, strategy, watchlist);

    } catch (const ConfigError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
