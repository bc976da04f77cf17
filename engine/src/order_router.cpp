#include "order_router.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <thread>
#include <spdlog/spdlog.h>

OrderRouter::OrderRouter(std::shared_ptr<BrokerClient> broker, BrokerRetry retry, Sleeper sleeper)
    : broker_(std::move(broker)), retry_(retry), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

template <typename Fn>
auto OrderRouter::with_retry(const std::string& symbol, const std::string& what, Fn&& fn)
    -> decltype(fn()) {
    for (int attempt = 1; ; ++attempt) {
        try {
            return fn();
        } catch (const BrokerError& e) {
            if (!e.transient() || attempt >= retry_.max_attempts) {
                spdlog::error("{}: {} failed after {} attempt(s): {}", symbol, what, attempt, e.what());
                throw BrokerFailure(symbol, what + " failed: " + e.what());
            }
            int delay = util::random_jitter(retry_.backoff_ms_min, retry_.backoff_ms_max) *
                        (1 << (attempt - 1));
            spdlog::warn("{}: {} attempt {}/{} failed ({}), retrying in {}ms", symbol, what,
                         attempt, retry_.max_attempts, e.what(), delay);
            sleeper_(std::chrono::milliseconds(delay));
        }
    }
}

std::string OrderRouter::submit_order(const OrderRequest& req) {
    return with_retry(req.symbol, "submit " + req.tag + " order",
                      [&] { return broker_->submit_order(req); });
}

std::string OrderRouter::submit_stop(const StopRequest& req) {
    return with_retry(req.symbol, "submit stop",
                      [&] { return broker_->submit_stop(req); });
}

void OrderRouter::modify_stop(const std::string& symbol, const std::string& order_id,
                              double stop_price) {
    with_retry(symbol, "modify stop " + order_id,
               [&] { broker_->modify_stop(order_id, stop_price); });
}

void OrderRouter::cancel_order(const std::string& symbol, const std::string& order_id) {
    with_retry(symbol, "cancel " + order_id,
               [&] { broker_->cancel_order(order_id); });
}

std::vector<OrderEvent> OrderRouter::poll_events() {
    try {
        return broker_->poll_events();
    } catch (const BrokerError& e) {
        spdlog::warn("Order event poll failed: {}", e.what());
        return {};
    }
}

std::vector<Holding> OrderRouter::current_holdings() {
    return with_retry("*", "holdings snapshot", [&] { return broker_->current_holdings(); });
}
