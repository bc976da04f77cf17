#pragma once

#include "broker_client.hpp"
#include "strategy_config.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Retries transient broker errors with bounded attempts and jittered exponential
// backoff; anything else, or the last failed attempt, surfaces as BrokerFailure.
class OrderRouter {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    OrderRouter(std::shared_ptr<BrokerClient> broker, BrokerRetry retry, Sleeper sleeper = nullptr);

    std::string submit_order(const OrderRequest& req);
    std::string submit_stop(const StopRequest& req);
    void modify_stop(const std::string& symbol, const std::string& order_id, double stop_price);
    void cancel_order(const std::string& symbol, const std::string& order_id);

    // A failed poll is logged and yields no events; the next poll picks them up
    std::vector<OrderEvent> poll_events();
    std::vector<Holding> current_holdings();

private:
    std::shared_ptr<BrokerClient> broker_;
    BrokerRetry retry_;
    Sleeper sleeper_;

    template <typename Fn>
    auto with_retry(const std::string& symbol, const std::string& what, Fn&& fn) -> decltype(fn());
};
