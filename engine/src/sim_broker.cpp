#include "sim_broker.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

void SimulatedBroker::maybe_fail(const char* op) {
    if (failures_left_ > 0) {
        failures_left_--;
        throw BrokerError(std::string("simulated failure in ") + op, failures_transient_);
    }
}

std::string SimulatedBroker::next_id() {
    return "SIM-" + std::to_string(next_id_++);
}

void SimulatedBroker::apply_fill(const std::string& symbol, OrderSide side, int64_t shares,
                                 double price) {
    auto& h = holdings_[symbol];
    h.symbol = symbol;
    int64_t signed_qty = side == OrderSide::Buy ? shares : -shares;
    int64_t before = h.shares;
    h.shares += signed_qty;

    if (h.shares == 0) {
        holdings_.erase(symbol);
    } else if (before == 0 || (before > 0) != (h.shares > 0)) {
        h.avg_price = price;
    } else if ((before > 0) == (signed_qty > 0)) {
        h.avg_price = (h.avg_price * std::abs(before) + price * shares) / std::abs(h.shares);
    }
}

void SimulatedBroker::emit_fill(const std::string& id, const std::string& symbol, OrderSide side,
                                int64_t shares, double price, int64_t time_ms) {
    apply_fill(symbol, side, shares, price);
    OrderEvent ev;
    ev.order_id = id;
    ev.symbol = symbol;
    ev.type = OrderEventType::Filled;
    ev.filled_shares = shares;
    ev.fill_price = price;
    ev.time_ms = time_ms;
    events_.push_back(ev);
}

std::string SimulatedBroker::submit_order(const OrderRequest& req) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail("submit_order");

    std::string id = next_id();
    submitted_++;

    if (reject_reason_) {
        OrderEvent ev;
        ev.order_id = id;
        ev.symbol = req.symbol;
        ev.type = OrderEventType::Rejected;
        ev.time_ms = clock_ms_;
        ev.reason = *reject_reason_;
        events_.push_back(ev);
        reject_reason_.reset();
        return id;
    }

    if (auto_fill_) {
        emit_fill(id, req.symbol, req.side, req.shares, req.reference_price, clock_ms_);
    } else {
        pending_[id] = req;
        OrderEvent ev;
        ev.order_id = id;
        ev.symbol = req.symbol;
        ev.type = OrderEventType::Accepted;
        ev.time_ms = clock_ms_;
        events_.push_back(ev);
    }
    return id;
}

std::string SimulatedBroker::submit_stop(const StopRequest& req) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail("submit_stop");
    std::string id = next_id();
    stops_[id] = RestingStop{req, true};
    return id;
}

void SimulatedBroker::modify_stop(const std::string& order_id, double stop_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail("modify_stop");
    auto it = stops_.find(order_id);
    if (it == stops_.end() || !it->second.active) {
        throw BrokerError("unknown or inactive stop " + order_id, false);
    }
    it->second.req.stop_price = stop_price;
}

void SimulatedBroker::cancel_order(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail("cancel_order");
    auto it = stops_.find(order_id);
    if (it != stops_.end() && it->second.active) {
        it->second.active = false;
        OrderEvent ev;
        ev.order_id = order_id;
        ev.symbol = it->second.req.symbol;
        ev.type = OrderEventType::Cancelled;
        ev.time_ms = clock_ms_;
        events_.push_back(ev);
        return;
    }
    if (pending_.erase(order_id) == 0 && it == stops_.end()) {
        throw BrokerError("unknown order " + order_id, false);
    }
}

std::vector<OrderEvent> SimulatedBroker::poll_events() {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail("poll_events");
    std::vector<OrderEvent> out(events_.begin(), events_.end());
    events_.clear();
    return out;
}

std::vector<Holding> SimulatedBroker::current_holdings() {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail("current_holdings");
    std::vector<Holding> out;
    for (const auto& [_, h] : holdings_) {
        out.push_back(h);
    }
    return out;
}

void SimulatedBroker::on_price(const std::string& symbol, double price, int64_t time_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ms_ = std::max(clock_ms_, time_ms);
    for (auto& [id, stop] : stops_) {
        if (!stop.active || stop.req.symbol != symbol) continue;
        bool hit = stop.req.side == OrderSide::Sell ? price <= stop.req.stop_price
                                                    : price >= stop.req.stop_price;
        if (hit) {
            stop.active = false;
            spdlog::debug("SIM {}: stop {} triggered at {:.2f}", symbol, id, price);
            emit_fill(id, symbol, stop.req.side, stop.req.shares, stop.req.stop_price, time_ms);
        }
    }
}

void SimulatedBroker::fail_next(int n, bool transient) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_left_ = n;
    failures_transient_ = transient;
}

void SimulatedBroker::reject_next_order(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_reason_ = reason;
}

void SimulatedBroker::set_auto_fill(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_fill_ = on;
}

void SimulatedBroker::fill_pending(int64_t time_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, req] : pending_) {
        emit_fill(id, req.symbol, req.side, req.shares, req.reference_price, time_ms);
    }
    pending_.clear();
}

void SimulatedBroker::set_holding(const std::string& symbol, int64_t shares, double avg_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shares == 0) {
        holdings_.erase(symbol);
    } else {
        holdings_[symbol] = Holding{symbol, shares, avg_price};
    }
}

std::optional<double> SimulatedBroker::stop_price(const std::string& order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stops_.find(order_id);
    if (it == stops_.end() || !it->second.active) return std::nullopt;
    return it->second.req.stop_price;
}

int SimulatedBroker::submitted_orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
}
