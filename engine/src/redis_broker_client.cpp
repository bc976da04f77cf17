#include "redis_broker_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

RedisBrokerClient::RedisBrokerClient(std::shared_ptr<RedisBus> bus, std::string request_stream,
                                     std::string event_stream, std::string holdings_key,
                                     std::string consumer_name)
    : bus_(std::move(bus))
    , request_stream_(std::move(request_stream))
    , event_stream_(std::move(event_stream))
    , holdings_key_(std::move(holdings_key))
    , consumer_(std::move(consumer_name))
    , group_(consumer_ + "_orders") {
    bus_->create_consumer_group(event_stream_, group_);
}

std::string RedisBrokerClient::next_order_id() {
    return fmt::format("{}-{}-{}", consumer_, util::current_timestamp_ms(), ++seq_);
}

void RedisBrokerClient::send(nlohmann::json request) {
    request["sent_at"] = util::current_iso8601();
    if (!bus_->publish(request_stream_, request)) {
        throw BrokerError("order request not delivered to " + request_stream_, true);
    }
}

std::string RedisBrokerClient::submit_order(const OrderRequest& req) {
    auto id = next_order_id();
    auto j = req.to_json();
    j["op"] = "market";
    j["order_id"] = id;
    send(std::move(j));
    return id;
}

std::string RedisBrokerClient::submit_stop(const StopRequest& req) {
    auto id = next_order_id();
    auto j = req.to_json();
    j["op"] = "stop";
    j["order_id"] = id;
    send(std::move(j));
    return id;
}

void RedisBrokerClient::modify_stop(const std::string& order_id, double stop_price) {
    send({{"op", "modify_stop"}, {"order_id", order_id}, {"stop_price", stop_price}});
}

void RedisBrokerClient::cancel_order(const std::string& order_id) {
    send({{"op", "cancel"}, {"order_id", order_id}});
}

std::vector<OrderEvent> RedisBrokerClient::poll_events() {
    std::vector<OrderEvent> events;
    for (const auto& [msg_id, data] : bus_->read_entries(event_stream_, group_, consumer_, 100, 10)) {
        try {
            events.push_back(OrderEvent::from_json(data));
        } catch (const DataError& e) {
            spdlog::warn("Dropping order event {}: {}", msg_id, e.what());
        }
        bus_->ack_message(event_stream_, group_, msg_id);
    }
    return events;
}

std::vector<Holding> RedisBrokerClient::current_holdings() {
    auto hash = bus_->read_hash(holdings_key_);
    if (!hash) {
        throw BrokerError("holdings unavailable at " + holdings_key_, true);
    }

    std::vector<Holding> holdings;
    for (const auto& [symbol, raw] : *hash) {
        try {
            auto j = nlohmann::json::parse(raw);
            holdings.push_back({symbol, j.at("shares").get<int64_t>(), j.value("avg_price", 0.0)});
        } catch (const nlohmann::json::exception& e) {
            throw BrokerError(fmt::format("malformed holding for {}: {}", symbol, e.what()), false);
        }
    }
    return holdings;
}
