#pragma once

#include "engine.hpp"
#include "sim_broker.hpp"
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One line of a recorded session: a bar, an order-flow sample or a broker event
struct FeedEvent {
    enum class Kind {
        Bar,
        Flow,
        Order
    };

    Kind kind;
    std::string symbol;
    Bar bar{};
    OrderFlowSample sample{};
    OrderEvent order{};

    int64_t time_ms() const;
};

// Throws DataError on a malformed event
FeedEvent parse_feed_event(const nlohmann::json& j);
nlohmann::json feed_event_to_json(const FeedEvent& ev);

// Dispatch order for events gathered from separate streams: by time_ms(),
// arrival order among equal times. Returns indices into events.
std::vector<size_t> time_order(const std::vector<FeedEvent>& events);

// Reads JSON lines; malformed lines are logged, counted and skipped
class ReplayFeed {
public:
    explicit ReplayFeed(const std::string& path);

    std::optional<FeedEvent> next();
    int64_t line() const { return line_; }
    int64_t rejected() const { return rejected_; }

private:
    std::string path_;
    std::ifstream in_;
    int64_t line_ = 0;
    int64_t rejected_ = 0;
};

struct ReplayResult {
    int64_t events = 0;
    int64_t rejected = 0;
    std::vector<nlohmann::json> decisions;
    std::vector<ClosedTrade> ledger;
};

// Drives recorded events through the same Engine the live loop uses, with a
// SimulatedBroker standing in for the exchange. Decision records are collected
// through a sink on the engine's log.
class ReplayDriver {
public:
    ReplayDriver(Engine& engine, std::shared_ptr<SimulatedBroker> broker);

    // Returns false if the engine rejected the event
    bool dispatch(const FeedEvent& ev);

    ReplayResult run(ReplayFeed& feed);
    ReplayResult run(const std::vector<FeedEvent>& events);

private:
    Engine& engine_;
    std::shared_ptr<SimulatedBroker> broker_;
    std::shared_ptr<std::vector<nlohmann::json>> decisions_;
    std::string session_date_;
    int64_t events_ = 0;
    int64_t rejected_ = 0;

    void roll_session(int64_t time_ms);
    ReplayResult result() const;
};
