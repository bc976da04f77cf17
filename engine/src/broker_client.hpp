#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class OrderSide {
    Buy,
    Sell
};

enum class OrderEventType {
    Accepted,
    Filled,
    Rejected,
    Cancelled
};

std::string to_string(OrderSide side);
std::string to_string(OrderEventType type);
OrderSide order_side_from_string(const std::string& s);
OrderEventType order_event_type_from_string(const std::string& s);

// Side of the order that opens / closes a position of the given side
inline OrderSide opening_side(Side side) {
    return side == Side::Long ? OrderSide::Buy : OrderSide::Sell;
}

inline OrderSide closing_side(Side side) {
    return side == Side::Long ? OrderSide::Sell : OrderSide::Buy;
}

struct OrderRequest {
    std::string symbol;
    OrderSide side;
    int64_t shares;
    double reference_price;
    std::string tag;  // entry / partial / close

    nlohmann::json to_json() const;
};

struct StopRequest {
    std::string symbol;
    OrderSide side;
    int64_t shares;
    double stop_price;

    nlohmann::json to_json() const;
};

struct OrderEvent {
    std::string order_id;
    std::string symbol;
    OrderEventType type;
    int64_t filled_shares = 0;
    double fill_price = 0.0;
    int64_t time_ms = 0;
    std::string reason;

    static OrderEvent from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Signed share count: negative for a short holding
struct Holding {
    std::string symbol;
    int64_t shares;
    double avg_price;
};

// Broker seam. Implementations throw BrokerError; transient errors may be retried.
class BrokerClient {
public:
    virtual ~BrokerClient() = default;

    // Returns the broker order id
    virtual std::string submit_order(const OrderRequest& req) = 0;
    virtual std::string submit_stop(const StopRequest& req) = 0;
    virtual void modify_stop(const std::string& order_id, double stop_price) = 0;
    virtual void cancel_order(const std::string& order_id) = 0;

    // Order status and fill events since the previous call
    virtual std::vector<OrderEvent> poll_events() = 0;

    virtual std::vector<Holding> current_holdings() = 0;
};
