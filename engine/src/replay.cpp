#include "replay.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>

int64_t FeedEvent::time_ms() const {
    switch (kind) {
        case Kind::Bar: return bar.open_time_ms;
        case Kind::Flow: return sample.time_ms;
        case Kind::Order: return order.time_ms;
    }
    return 0;
}

std::vector<size_t> time_order(const std::vector<FeedEvent>& events) {
    std::vector<size_t> order(events.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&events](size_t a, size_t b) {
        return events[a].time_ms() < events[b].time_ms();
    });
    return order;
}

FeedEvent parse_feed_event(const nlohmann::json& j) {
    try {
        FeedEvent ev;
        std::string type = j.at("type").get<std::string>();
        ev.symbol = j.at("symbol").get<std::string>();

        if (type == "bar") {
            ev.kind = FeedEvent::Kind::Bar;
            ev.bar.open_time_ms = j.at("open_time_ms").get<int64_t>();
            ev.bar.open = j.at("open").get<double>();
            ev.bar.high = j.at("high").get<double>();
            ev.bar.low = j.at("low").get<double>();
            ev.bar.close = j.at("close").get<double>();
            ev.bar.volume = j.at("volume").get<double>();
        } else if (type == "flow") {
            ev.kind = FeedEvent::Kind::Flow;
            ev.sample.time_ms = j.at("time_ms").get<int64_t>();
            ev.sample.imbalance_pct = j.at("imbalance_pct").get<double>();
            if (j.contains("price") && !j.at("price").is_null()) {
                ev.sample.price = j.at("price").get<double>();
            }
        } else if (type == "order") {
            // Feed lines carry the order event type under "event"
            ev.kind = FeedEvent::Kind::Order;
            auto order = j;
            order["type"] = j.at("event");
            ev.order = OrderEvent::from_json(order);
        } else {
            throw DataError("Unknown feed event type: " + type);
        }
        return ev;
    } catch (const nlohmann::json::exception& e) {
        throw DataError(std::string("Malformed feed event: ") + e.what());
    }
}

nlohmann::json feed_event_to_json(const FeedEvent& ev) {
    switch (ev.kind) {
        case FeedEvent::Kind::Bar:
            return {
                {"type", "bar"},
                {"symbol", ev.symbol},
                {"open_time_ms", ev.bar.open_time_ms},
                {"open", ev.bar.open},
                {"high", ev.bar.high},
                {"low", ev.bar.low},
                {"close", ev.bar.close},
                {"volume", ev.bar.volume}
            };
        case FeedEvent::Kind::Flow: {
            nlohmann::json j = {
                {"type", "flow"},
                {"symbol", ev.symbol},
                {"time_ms", ev.sample.time_ms},
                {"imbalance_pct", ev.sample.imbalance_pct}
            };
            if (ev.sample.price) j["price"] = *ev.sample.price;
            return j;
        }
        case FeedEvent::Kind::Order: {
            auto j = ev.order.to_json();
            j["event"] = j["type"];
            j["type"] = "order";
            return j;
        }
    }
    return nlohmann::json::object();
}

ReplayFeed::ReplayFeed(const std::string& path) : path_(path), in_(path) {
    if (!in_) {
        throw std::runtime_error("Cannot open replay file " + path);
    }
}

std::optional<FeedEvent> ReplayFeed::next() {
    std::string text;
    while (std::getline(in_, text)) {
        line_++;
        if (text.empty() || text[0] == '#') continue;
        try {
            return parse_feed_event(nlohmann::json::parse(text));
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("{}:{}: {}", path_, line_, e.what());
            rejected_++;
        } catch (const DataError& e) {
            spdlog::warn("{}:{}: {}", path_, line_, e.what());
            rejected_++;
        }
    }
    return std::nullopt;
}

ReplayDriver::ReplayDriver(Engine& engine, std::shared_ptr<SimulatedBroker> broker)
    : engine_(engine),
      broker_(std::move(broker)),
      decisions_(std::make_shared<std::vector<nlohmann::json>>()) {
    auto collected = decisions_;
    engine_.decisions().add_sink([collected](const nlohmann::json& rec) { collected->push_back(rec); });
}

void ReplayDriver::roll_session(int64_t time_ms) {
    std::string date = util::session_date(time_ms, engine_.config().session.utc_offset_minutes);
    if (session_date_.empty()) {
        session_date_ = date;
    } else if (date != session_date_) {
        spdlog::info("Replay crossed into session {}", date);
        session_date_ = date;
        engine_.begin_session(date);
    }
}

bool ReplayDriver::dispatch(const FeedEvent& ev) {
    events_++;
    roll_session(ev.time_ms());

    try {
        switch (ev.kind) {
            case FeedEvent::Kind::Bar:
                // Resting stops see the bar before the engine does
                broker_->on_price(ev.symbol, ev.bar.close, ev.bar.open_time_ms);
                engine_.poll_broker();
                engine_.on_bar(ev.symbol, ev.bar);
                break;
            case FeedEvent::Kind::Flow:
                if (ev.sample.price) {
                    broker_->on_price(ev.symbol, *ev.sample.price, ev.sample.time_ms);
                    engine_.poll_broker();
                }
                engine_.on_order_flow(ev.symbol, ev.sample);
                break;
            case FeedEvent::Kind::Order:
                engine_.on_order_event(ev.order);
                break;
        }
        engine_.poll_broker();
        return true;
    } catch (const DataError& e) {
        spdlog::warn("Replay event rejected: {}", e.what());
        rejected_++;
        return false;
    }
}

ReplayResult ReplayDriver::result() const {
    ReplayResult res;
    res.events = events_;
    res.rejected = rejected_;
    res.decisions = *decisions_;
    res.ledger = engine_.positions().ledger();
    return res;
}

ReplayResult ReplayDriver::run(ReplayFeed& feed) {
    while (auto ev = feed.next()) {
        dispatch(*ev);
    }
    auto res = result();
    res.rejected += feed.rejected();
    spdlog::info("Replay done: {} events ({} rejected), {} decisions, {} closed trades",
                 res.events, res.rejected, res.decisions.size(), res.ledger.size());
    return res;
}

ReplayResult ReplayDriver::run(const std::vector<FeedEvent>& events) {
    for (const auto& ev : events) {
        dispatch(ev);
    }
    return result();
}
