#pragma once

#include "broker_client.hpp"
#include "redis_bus.hpp"
#include <atomic>
#include <memory>
#include <string>

// Broker adapter over Redis. Order intents go out on the request stream with a
// client-assigned id; the execution gateway answers on the event stream and
// mirrors account holdings into a hash (symbol -> {"shares", "avg_price"}).
class RedisBrokerClient : public BrokerClient {
public:
    RedisBrokerClient(std::shared_ptr<RedisBus> bus, std::string request_stream,
                      std::string event_stream, std::string holdings_key,
                      std::string consumer_name);

    std::string submit_order(const OrderRequest& req) override;
    std::string submit_stop(const StopRequest& req) override;
    void modify_stop(const std::string& order_id, double stop_price) override;
    void cancel_order(const std::string& order_id) override;

    std::vector<OrderEvent> poll_events() override;
    std::vector<Holding> current_holdings() override;

private:
    std::shared_ptr<RedisBus> bus_;
    std::string request_stream_;
    std::string event_stream_;
    std::string holdings_key_;
    std::string consumer_;
    std::string group_;
    std::atomic<int64_t> seq_{0};

    std::string next_order_id();
    void send(nlohmann::json request);
};
