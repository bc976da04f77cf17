#include "broker_client.hpp"
#include "errors.hpp"

std::string to_string(OrderSide side) {
    return side == OrderSide::Buy ? "BUY" : "SELL";
}

std::string to_string(OrderEventType type) {
    switch (type) {
        case OrderEventType::Accepted: return "ACCEPTED";
        case OrderEventType::Filled: return "FILLED";
        case OrderEventType::Rejected: return "REJECTED";
        case OrderEventType::Cancelled: return "CANCELLED";
    }
    return "ACCEPTED";
}

OrderSide order_side_from_string(const std::string& s) {
    if (s == "BUY") return OrderSide::Buy;
    if (s == "SELL") return OrderSide::Sell;
    throw DataError("Unknown order side: " + s);
}

OrderEventType order_event_type_from_string(const std::string& s) {
    if (s == "ACCEPTED") return OrderEventType::Accepted;
    if (s == "FILLED") return OrderEventType::Filled;
    if (s == "REJECTED") return OrderEventType::Rejected;
    if (s == "CANCELLED") return OrderEventType::Cancelled;
    throw DataError("Unknown order event type: " + s);
}

nlohmann::json OrderRequest::to_json() const {
    return {
        {"symbol", symbol},
        {"side", ::to_string(side)},
        {"shares", shares},
        {"reference_price", reference_price},
        {"tag", tag}
    };
}

nlohmann::json StopRequest::to_json() const {
    return {
        {"symbol", symbol},
        {"side", ::to_string(side)},
        {"shares", shares},
        {"stop_price", stop_price}
    };
}

OrderEvent OrderEvent::from_json(const nlohmann::json& j) {
    try {
        OrderEvent ev;
        ev.order_id = j.at("order_id").get<std::string>();
        ev.symbol = j.at("symbol").get<std::string>();
        ev.type = order_event_type_from_string(j.at("type").get<std::string>());
        ev.filled_shares = j.value("filled_shares", int64_t{0});
        ev.fill_price = j.value("fill_price", 0.0);
        ev.time_ms = j.at("time_ms").get<int64_t>();
        ev.reason = j.value("reason", "");
        return ev;
    } catch (const nlohmann::json::exception& e) {
        throw DataError(std::string("Malformed order event: ") + e.what());
    }
}

nlohmann::json OrderEvent::to_json() const {
    return {
        {"order_id", order_id},
        {"symbol", symbol},
        {"type", ::to_string(type)},
        {"filled_shares", filled_shares},
        {"fill_price", fill_price},
        {"time_ms", time_ms},
        {"reason", reason}
    };
}
