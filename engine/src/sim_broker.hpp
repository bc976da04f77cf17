#pragma once

#include "broker_client.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <optional>

// In-process broker used for replay and tests. Market orders fill at their
// reference price; resting stops fill when on_price() crosses them.
class SimulatedBroker : public BrokerClient {
public:
    std::string submit_order(const OrderRequest& req) override;
    std::string submit_stop(const StopRequest& req) override;
    void modify_stop(const std::string& order_id, double stop_price) override;
    void cancel_order(const std::string& order_id) override;
    std::vector<OrderEvent> poll_events() override;
    std::vector<Holding> current_holdings() override;

    // Drive resting stops with the latest trade price
    void on_price(const std::string& symbol, double price, int64_t time_ms);

    // Fault injection: the next n calls throw BrokerError
    void fail_next(int n, bool transient);
    // The next submitted market order is rejected with an event instead of filled
    void reject_next_order(const std::string& reason);
    // When off, market orders stay accepted until fill_pending()
    void set_auto_fill(bool on);
    void fill_pending(int64_t time_ms);

    void set_holding(const std::string& symbol, int64_t shares, double avg_price);
    std::optional<double> stop_price(const std::string& order_id) const;
    int submitted_orders() const;

private:
    struct RestingStop {
        StopRequest req;
        bool active;
    };

    mutable std::mutex mutex_;
    int64_t next_id_ = 1;
    int64_t clock_ms_ = 0;
    int failures_left_ = 0;
    bool failures_transient_ = true;
    std::optional<std::string> reject_reason_;
    bool auto_fill_ = true;
    int submitted_ = 0;

    std::map<std::string, RestingStop> stops_;
    std::map<std::string, OrderRequest> pending_;
    std::map<std::string, Holding> holdings_;
    std::deque<OrderEvent> events_;

    void maybe_fail(const char* op);
    std::string next_id();
    void apply_fill(const std::string& symbol, OrderSide side, int64_t shares, double price);
    void emit_fill(const std::string& id, const std::string& symbol, OrderSide side,
                   int64_t shares, double price, int64_t time_ms);
};
