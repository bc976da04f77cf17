#include "position_manager.hpp"
#include "errors.hpp"
#include "risk_sizer.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

std::string to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::Partial: return "PARTIAL";
        case ExitReason::ProfitTarget: return "PROFIT_TARGET";
        case ExitReason::StallExit: return "STALL_EXIT";
        case ExitReason::StopHit: return "STOP_HIT";
        case ExitReason::TrailStop: return "TRAIL_STOP";
        case ExitReason::EodClose: return "EOD_CLOSE";
    }
    return "STOP_HIT";
}

std::string to_string(StopKind kind) {
    switch (kind) {
        case StopKind::Initial: return "INITIAL";
        case StopKind::Breakeven: return "BREAKEVEN";
        case StopKind::Trailing: return "TRAILING";
    }
    return "INITIAL";
}

ExitReason exit_reason_from_string(const std::string& s) {
    if (s == "PARTIAL") return ExitReason::Partial;
    if (s == "PROFIT_TARGET") return ExitReason::ProfitTarget;
    if (s == "STALL_EXIT") return ExitReason::StallExit;
    if (s == "STOP_HIT") return ExitReason::StopHit;
    if (s == "TRAIL_STOP") return ExitReason::TrailStop;
    if (s == "EOD_CLOSE") return ExitReason::EodClose;
    throw DataError("Unknown exit reason: " + s);
}

StopKind stop_kind_from_string(const std::string& s) {
    if (s == "INITIAL") return StopKind::Initial;
    if (s == "BREAKEVEN") return StopKind::Breakeven;
    if (s == "TRAILING") return StopKind::Trailing;
    throw DataError("Unknown stop kind: " + s);
}

namespace {

nlohmann::json partials_to_json(const std::vector<PartialFill>& partials) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& pf : partials) {
        arr.push_back({
            {"fraction", pf.fraction},
            {"shares", pf.shares},
            {"price", pf.price},
            {"time_ms", pf.time_ms}
        });
    }
    return arr;
}

std::vector<PartialFill> partials_from_json(const nlohmann::json& arr) {
    std::vector<PartialFill> out;
    for (const auto& item : arr) {
        out.push_back(PartialFill{
            item.at("fraction").get<double>(),
            item.at("shares").get<int64_t>(),
            item.at("price").get<double>(),
            item.at("time_ms").get<int64_t>()
        });
    }
    return out;
}

bool is_tighter(Side side, double candidate, double current) {
    return side == Side::Long ? candidate > current : candidate < current;
}

}

double Position::unrealized_gain_pct(double price) const {
    return side_sign(side) * (price - entry_price) / entry_price;
}

nlohmann::json Position::to_json() const {
    nlohmann::json j = {
        {"symbol", symbol},
        {"side", ::to_string(side)},
        {"setup_type", ::to_string(setup_type)},
        {"pivot_price", pivot_price},
        {"entry_price", entry_price},
        {"shares", shares},
        {"remaining_shares", remaining_shares},
        {"remaining_fraction", remaining_fraction},
        {"stop_price", stop_price},
        {"stop_kind", ::to_string(stop_kind)},
        {"best_price", best_price},
        {"entry_logical_position", entry_logical_position},
        {"entry_time_ms", entry_time_ms},
        {"partials_taken", partials_to_json(partials_taken)},
        {"levels_taken", levels_taken},
        {"fees", fees},
        {"entry_filled", entry_filled},
        {"entry_order_id", entry_order_id},
        {"stop_order_id", stop_order_id},
        {"broker_order_ids", broker_order_ids}
    };
    if (pending_exit) {
        j["pending_exit"] = {
            {"order_id", pending_exit->order_id},
            {"reason", ::to_string(pending_exit->reason)},
            {"shares", pending_exit->shares},
            {"full", pending_exit->full},
            {"level", pending_exit->level},
            {"reference_price", pending_exit->reference_price},
            {"time_ms", pending_exit->time_ms}
        };
    } else {
        j["pending_exit"] = nullptr;
    }
    return j;
}

Position Position::from_json(const nlohmann::json& j) {
    try {
        Position p;
        p.symbol = j.at("symbol").get<std::string>();
        p.side = side_from_string(j.at("side").get<std::string>());
        p.setup_type = setup_type_from_string(j.at("setup_type").get<std::string>());
        p.pivot_price = j.at("pivot_price").get<double>();
        p.entry_price = j.at("entry_price").get<double>();
        p.shares = j.at("shares").get<int64_t>();
        p.remaining_shares = j.at("remaining_shares").get<int64_t>();
        p.remaining_fraction = j.at("remaining_fraction").get<double>();
        p.stop_price = j.at("stop_price").get<double>();
        p.stop_kind = stop_kind_from_string(j.at("stop_kind").get<std::string>());
        p.best_price = j.at("best_price").get<double>();
        p.entry_logical_position = j.at("entry_logical_position").get<LogicalPosition>();
        p.entry_time_ms = j.at("entry_time_ms").get<int64_t>();
        p.partials_taken = partials_from_json(j.at("partials_taken"));
        p.levels_taken = j.at("levels_taken").get<std::vector<int>>();
        p.fees = j.at("fees").get<double>();
        p.entry_filled = j.at("entry_filled").get<bool>();
        p.entry_order_id = j.at("entry_order_id").get<std::string>();
        p.stop_order_id = j.at("stop_order_id").get<std::string>();
        p.broker_order_ids = j.at("broker_order_ids").get<std::vector<std::string>>();

        const auto& pe = j.at("pending_exit");
        if (!pe.is_null()) {
            PendingExit pending;
            pending.order_id = pe.at("order_id").get<std::string>();
            pending.reason = exit_reason_from_string(pe.at("reason").get<std::string>());
            pending.shares = pe.at("shares").get<int64_t>();
            pending.full = pe.at("full").get<bool>();
            pending.level = pe.at("level").get<int>();
            pending.reference_price = pe.at("reference_price").get<double>();
            pending.time_ms = pe.at("time_ms").get<int64_t>();
            p.pending_exit = pending;
        }

        if (p.shares <= 0 || p.remaining_shares <= 0 || p.remaining_shares > p.shares) {
            throw DataError(p.symbol + ": persisted position has inconsistent share counts");
        }
        return p;
    } catch (const nlohmann::json::exception& e) {
        throw DataError(std::string("Malformed persisted position: ") + e.what());
    }
}

nlohmann::json ClosedTrade::to_json() const {
    return {
        {"symbol", symbol},
        {"side", ::to_string(side)},
        {"setup_type", ::to_string(setup_type)},
        {"entry_price", entry_price},
        {"exit_price", exit_price},
        {"shares", shares},
        {"fees", fees},
        {"realized_pnl", realized_pnl},
        {"reason", ::to_string(reason)},
        {"entry_time_ms", entry_time_ms},
        {"exit_time_ms", exit_time_ms},
        {"duration_ms", duration_ms},
        {"partials", partials_to_json(partials)}
    };
}

ClosedTrade ClosedTrade::from_json(const nlohmann::json& j) {
    try {
        ClosedTrade t;
        t.symbol = j.at("symbol").get<std::string>();
        t.side = side_from_string(j.at("side").get<std::string>());
        t.setup_type = setup_type_from_string(j.at("setup_type").get<std::string>());
        t.entry_price = j.at("entry_price").get<double>();
        t.exit_price = j.at("exit_price").get<double>();
        t.shares = j.at("shares").get<int64_t>();
        t.fees = j.at("fees").get<double>();
        t.realized_pnl = j.at("realized_pnl").get<double>();
        t.reason = exit_reason_from_string(j.at("reason").get<std::string>());
        t.entry_time_ms = j.at("entry_time_ms").get<int64_t>();
        t.exit_time_ms = j.at("exit_time_ms").get<int64_t>();
        t.duration_ms = j.at("duration_ms").get<int64_t>();
        t.partials = partials_from_json(j.at("partials"));
        return t;
    } catch (const nlohmann::json::exception& e) {
        throw DataError(std::string("Malformed closed trade: ") + e.what());
    }
}

nlohmann::json DailySummary::to_json() const {
    return {
        {"trades", trades},
        {"winners", winners},
        {"losers", losers},
        {"gross_pnl", gross_pnl},
        {"fees", fees},
        {"net_pnl", net_pnl}
    };
}

AccountExposure::AccountExposure(double max_total_exposure)
    : max_total_(max_total_exposure) {}

bool AccountExposure::try_reserve(const std::string& symbol, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& [sym, v] : by_symbol_) {
        if (sym != symbol) total += v;
    }
    if (total + value > max_total_) {
        return false;
    }
    by_symbol_[symbol] = value;
    return true;
}

void AccountExposure::release(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    by_symbol_.erase(symbol);
}

void AccountExposure::set(const std::string& symbol, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    by_symbol_[symbol] = value;
}

double AccountExposure::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& [_, v] : by_symbol_) total += v;
    return total;
}

PositionManager::PositionManager(const StrategyConfig& config, std::shared_ptr<OrderRouter> router)
    : config_(config), router_(std::move(router)) {}

void PositionManager::add_symbol(const std::string& symbol) {
    if (!slots_.count(symbol)) {
        slots_[symbol] = std::make_unique<Slot>();
    }
}

PositionManager::Slot& PositionManager::slot(const std::string& symbol) const {
    auto it = slots_.find(symbol);
    if (it == slots_.end()) {
        throw std::out_of_range(symbol + " is not on the watchlist");
    }
    return *it->second;
}

Position PositionManager::open(const EntryDecision& decision, int64_t shares, double stop_price) {
    Slot& s = slot(decision.symbol);
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.position) {
        throw std::runtime_error(decision.symbol + ": position already open");
    }
    RiskSizer::check_pre_trade(shares, decision.reference_price, config_.account);

    Position p;
    p.symbol = decision.symbol;
    p.side = decision.side;
    p.setup_type = decision.setup_type;
    p.pivot_price = decision.pivot;
    p.entry_price = decision.reference_price;
    p.shares = shares;
    p.remaining_shares = shares;
    p.remaining_fraction = 1.0;
    p.stop_price = stop_price;
    p.best_price = decision.reference_price;
    p.entry_logical_position = decision.logical_position;
    p.entry_time_ms = decision.time_ms;

    OrderRequest req{p.symbol, opening_side(p.side), shares, p.entry_price, "entry"};
    p.entry_order_id = router_->submit_order(req);
    p.broker_order_ids.push_back(p.entry_order_id);

    try {
        p.stop_order_id = router_->submit_stop(
            StopRequest{p.symbol, closing_side(p.side), shares, stop_price});
        p.broker_order_ids.push_back(p.stop_order_id);
    } catch (const BrokerFailure& e) {
        spdlog::error("{}: protective stop not placed, stop enforced in-engine: {}",
                      p.symbol, e.what());
    }

    spdlog::info("{}: opened {} {} x{} @ {:.2f}, stop {:.2f}", p.symbol, to_string(p.side),
                 to_string(p.setup_type), shares, p.entry_price, stop_price);
    s.position = p;
    return p;
}

void PositionManager::tighten_stop(Position& p, double candidate, StopKind kind) {
    if (!is_tighter(p.side, candidate, p.stop_price)) return;

    spdlog::debug("{}: stop {:.2f} -> {:.2f} ({})", p.symbol, p.stop_price, candidate,
                  to_string(kind));
    p.stop_price = candidate;
    p.stop_kind = kind;

    if (!p.stop_order_id.empty()) {
        try {
            router_->modify_stop(p.symbol, p.stop_order_id, candidate);
        } catch (const BrokerFailure& e) {
            spdlog::error("{}: broker stop not moved, stop enforced in-engine: {}", p.symbol, e.what());
        }
    }
}

void PositionManager::replace_stop(Position& p) {
    if (!p.stop_order_id.empty()) {
        try {
            router_->cancel_order(p.symbol, p.stop_order_id);
            p.stop_order_id.clear();
        } catch (const BrokerFailure& e) {
            spdlog::error("{}: could not resize protective stop: {}", p.symbol, e.what());
            return;
        }
    }
    try {
        p.stop_order_id = router_->submit_stop(
            StopRequest{p.symbol, closing_side(p.side), p.remaining_shares, p.stop_price});
        p.broker_order_ids.push_back(p.stop_order_id);
    } catch (const BrokerFailure& e) {
        spdlog::error("{}: protective stop not placed, stop enforced in-engine: {}",
                      p.symbol, e.what());
    }
}

std::optional<ExitAction> PositionManager::send_exit(Position& p, ExitReason reason, int64_t shares,
                                                     bool full, int level, double price,
                                                     int64_t time_ms) {
    // The resting stop must be gone before a full close so the two cannot both fill
    if (full && !p.stop_order_id.empty()) {
        try {
            router_->cancel_order(p.symbol, p.stop_order_id);
            p.stop_order_id.clear();
        } catch (const BrokerFailure& e) {
            spdlog::warn("{}: stop cancel failed before {}, waiting on broker: {}", p.symbol,
                         to_string(reason), e.what());
            return std::nullopt;
        }
    }

    if (level >= 0) p.levels_taken.push_back(level);

    std::string order_id;
    try {
        order_id = router_->submit_order(OrderRequest{
            p.symbol, closing_side(p.side), shares, price, full ? "close" : "partial"});
    } catch (const BrokerFailure&) {
        if (level >= 0) p.levels_taken.pop_back();
        if (full) replace_stop(p);
        throw;
    }

    p.pending_exit = PendingExit{order_id, reason, shares, full, level, price, time_ms};
    p.broker_order_ids.push_back(order_id);

    spdlog::info("{}: {} {} x{} @ {:.2f} (order {})", p.symbol, to_string(reason),
                 full ? "close" : "partial", shares, price, order_id);
    return ExitAction{p.symbol, reason, shares, full, price, order_id};
}

std::optional<ExitAction> PositionManager::evaluate(Position& p, double price, int64_t time_ms) {
    const auto& t = config_.thresholds(p.setup_type);

    if (is_tighter(p.side, price, p.best_price)) {
        p.best_price = price;
    }
    double gain = p.unrealized_gain_pct(price);
    int64_t sec_in_trade = (time_ms - p.entry_time_ms) / 1000;

    // 1. Stall: no favorable movement early in the trade; any partial suppresses it
    if (p.partials_taken.empty() &&
        sec_in_trade >= t.stall_window_start_sec && sec_in_trade <= t.stall_window_end_sec &&
        gain <= t.stall_tolerance_pct) {
        return send_exit(p, ExitReason::StallExit, p.remaining_shares, true, -1, price, time_ms);
    }

    // 2. Partial profit, levels ordered by gain
    for (size_t i = 0; i < t.partial_levels.size(); ++i) {
        int level = static_cast<int>(i);
        if (std::find(p.levels_taken.begin(), p.levels_taken.end(), level) != p.levels_taken.end()) {
            continue;
        }
        const auto& pl = t.partial_levels[i];
        if (gain < pl.gain_pct) break;

        auto qty = static_cast<int64_t>(std::floor(static_cast<double>(p.shares) * pl.fraction));
        if (qty <= 0) {
            spdlog::debug("{}: partial level {} rounds to zero shares, skipped", p.symbol, level);
            p.levels_taken.push_back(level);
            continue;
        }
        if (qty >= p.remaining_shares) {
            return send_exit(p, ExitReason::ProfitTarget, p.remaining_shares, true, level,
                             price, time_ms);
        }
        return send_exit(p, ExitReason::Partial, qty, false, level, price, time_ms);
    }

    // 3. Trailing stop from the best excursion, tighten only
    if (t.trail_pct > 0 && (!t.trail_after_partial_only || !p.partials_taken.empty())) {
        double candidate = p.best_price * (1.0 - side_sign(p.side) * t.trail_pct);
        tighten_stop(p, candidate, StopKind::Trailing);
    }

    // 4. Stop hit
    bool stopped = p.side == Side::Long ? price <= p.stop_price : price >= p.stop_price;
    if (stopped) {
        auto reason = p.stop_kind == StopKind::Trailing ? ExitReason::TrailStop : ExitReason::StopHit;
        return send_exit(p, reason, p.remaining_shares, true, -1, price, time_ms);
    }

    // 5. End-of-day flatten
    if (util::seconds_of_day(time_ms, config_.session.utc_offset_minutes) >= config_.session.flatten_sec) {
        return send_exit(p, ExitReason::EodClose, p.remaining_shares, true, -1, price, time_ms);
    }

    return std::nullopt;
}

std::optional<ExitAction> PositionManager::on_tick(const std::string& symbol, double price,
                                                   int64_t time_ms) {
    Slot& s = slot(symbol);
    std::lock_guard<std::mutex> lock(s.mutex);

    // Positions with an order in flight wait for the broker. Until the entry
    // fills only the resting broker stop protects the position.
    if (!s.position || !s.position->entry_filled || s.position->pending_exit) {
        return std::nullopt;
    }
    return evaluate(*s.position, price, time_ms);
}

ClosedTrade PositionManager::close_out(Position& p, ExitReason reason, int64_t shares, double price,
                                       int64_t time_ms) {
    double sign = side_sign(p.side);
    double gross = sign * (price - p.entry_price) * static_cast<double>(shares);
    double exit_value = price * static_cast<double>(shares);
    int64_t exit_shares = shares;
    for (const auto& pf : p.partials_taken) {
        gross += sign * (pf.price - p.entry_price) * static_cast<double>(pf.shares);
        exit_value += pf.price * static_cast<double>(pf.shares);
        exit_shares += pf.shares;
    }
    p.fees += config_.account.commission_per_share * static_cast<double>(shares);

    ClosedTrade t;
    t.symbol = p.symbol;
    t.side = p.side;
    t.setup_type = p.setup_type;
    t.entry_price = p.entry_price;
    t.exit_price = exit_value / static_cast<double>(exit_shares);
    t.shares = p.shares;
    t.fees = p.fees;
    t.realized_pnl = gross - p.fees;
    t.reason = reason;
    t.entry_time_ms = p.entry_time_ms;
    t.exit_time_ms = time_ms;
    t.duration_ms = time_ms - p.entry_time_ms;
    t.partials = p.partials_taken;

    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        ledger_.push_back(t);
    }
    spdlog::info("{}: closed {} x{} @ {:.2f}, pnl {:.2f} ({})", p.symbol, to_string(p.side),
                 shares, price, t.realized_pnl, to_string(reason));
    return t;
}

std::vector<ClosedTrade> PositionManager::on_order_event(const OrderEvent& ev) {
    auto it = slots_.find(ev.symbol);
    if (it == slots_.end()) {
        spdlog::warn("Order event {} for unwatched symbol {}", ev.order_id, ev.symbol);
        return {};
    }
    Slot& s = *it->second;
    std::lock_guard<std::mutex> lock(s.mutex);

    std::vector<ClosedTrade> closed;
    if (!s.position) {
        spdlog::debug("{}: order event {} with no open position", ev.symbol, ev.order_id);
        return closed;
    }
    Position& p = *s.position;
    double commission = config_.account.commission_per_share;

    if (ev.order_id == p.entry_order_id) {
        if (ev.type == OrderEventType::Filled) {
            if (ev.fill_price > 0) {
                p.entry_price = ev.fill_price;
            }
            if (ev.time_ms > p.entry_time_ms) {
                p.entry_time_ms = ev.time_ms;
            }
            p.entry_filled = true;
            p.fees += commission * static_cast<double>(p.shares);
        } else if (ev.type == OrderEventType::Rejected || ev.type == OrderEventType::Cancelled) {
            spdlog::error("{}: entry order {} {}: {}", p.symbol, ev.order_id,
                          to_string(ev.type), ev.reason);
            if (!p.stop_order_id.empty()) {
                try {
                    router_->cancel_order(p.symbol, p.stop_order_id);
                } catch (const BrokerFailure& e) {
                    spdlog::error("{}: orphan stop {} not cancelled: {}", p.symbol,
                                  p.stop_order_id, e.what());
                }
            }
            s.position.reset();
        }
        return closed;
    }

    if (p.pending_exit && ev.order_id == p.pending_exit->order_id) {
        PendingExit pending = *p.pending_exit;
        if (ev.type == OrderEventType::Filled) {
            double price = ev.fill_price > 0 ? ev.fill_price : pending.reference_price;
            if (pending.full) {
                closed.push_back(close_out(p, pending.reason, p.remaining_shares, price, ev.time_ms));
                s.position.reset();
                return closed;
            }

            PartialFill pf{static_cast<double>(pending.shares) / static_cast<double>(p.shares),
                           pending.shares, price, ev.time_ms};
            p.partials_taken.push_back(pf);
            p.remaining_shares -= pending.shares;
            p.remaining_fraction = static_cast<double>(p.remaining_shares) / static_cast<double>(p.shares);
            p.fees += commission * static_cast<double>(pending.shares);
            p.pending_exit.reset();

            if (config_.thresholds(p.setup_type).breakeven_after_partial) {
                tighten_stop(p, p.entry_price, StopKind::Breakeven);
            }
            replace_stop(p);
        } else if (ev.type == OrderEventType::Rejected || ev.type == OrderEventType::Cancelled) {
            spdlog::warn("{}: {} order {} {}: {}", p.symbol, to_string(pending.reason),
                         ev.order_id, to_string(ev.type), ev.reason);
            if (pending.level >= 0) {
                auto lt = std::find(p.levels_taken.begin(), p.levels_taken.end(), pending.level);
                if (lt != p.levels_taken.end()) p.levels_taken.erase(lt);
            }
            p.pending_exit.reset();
            if (pending.full) replace_stop(p);
        }
        return closed;
    }

    if (ev.order_id == p.stop_order_id && ev.type == OrderEventType::Filled) {
        // Stop executed at the broker without a close from this engine
        if (p.pending_exit) {
            spdlog::warn("{}: stop filled while order {} in flight", p.symbol,
                         p.pending_exit->order_id);
        }
        auto reason = p.stop_kind == StopKind::Trailing ? ExitReason::TrailStop : ExitReason::StopHit;
        double price = ev.fill_price > 0 ? ev.fill_price : p.stop_price;
        closed.push_back(close_out(p, reason, p.remaining_shares, price, ev.time_ms));
        s.position.reset();
        return closed;
    }

    spdlog::debug("{}: ignoring {} for order {}", ev.symbol, to_string(ev.type), ev.order_id);
    return closed;
}

bool PositionManager::has_position(const std::string& symbol) const {
    Slot& s = slot(symbol);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.position.has_value();
}

bool PositionManager::is_pending_close(const std::string& symbol) const {
    Slot& s = slot(symbol);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.position && s.position->pending_close();
}

std::optional<Position> PositionManager::get(const std::string& symbol) const {
    Slot& s = slot(symbol);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.position;
}

std::vector<Position> PositionManager::open_positions() const {
    std::vector<Position> out;
    for (const auto& [_, s] : slots_) {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->position) out.push_back(*s->position);
    }
    return out;
}

std::vector<ClosedTrade> PositionManager::ledger() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return ledger_;
}

DailySummary PositionManager::summary() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    DailySummary sum;
    for (const auto& t : ledger_) {
        sum.trades++;
        if (t.realized_pnl > 0) {
            sum.winners++;
        } else {
            sum.losers++;
        }
        sum.gross_pnl += t.realized_pnl + t.fees;
        sum.fees += t.fees;
        sum.net_pnl += t.realized_pnl;
    }
    return sum;
}

double PositionManager::unrealized_pnl(const std::string& symbol, double price) const {
    Slot& s = slot(symbol);
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.position) return 0.0;
    const auto& p = *s.position;
    return side_sign(p.side) * (price - p.entry_price) * static_cast<double>(p.remaining_shares);
}

void PositionManager::restore(const Position& pos) {
    Slot& s = slot(pos.symbol);
    std::lock_guard<std::mutex> lock(s.mutex);
    s.position = pos;
}

void PositionManager::restore_ledger(const std::vector<ClosedTrade>& trades) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    ledger_ = trades;
}
