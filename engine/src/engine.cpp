#include "engine.hpp"
#include "errors.hpp"
#include "risk_sizer.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

Engine::Engine(StrategyConfig config, std::shared_ptr<BrokerClient> broker,
               std::shared_ptr<SessionStateStore> store, std::shared_ptr<DecisionLog> decisions,
               OrderRouter::Sleeper sleeper)
    : config_(std::move(config))
    , machine_(config_)
    , router_(std::make_shared<OrderRouter>(std::move(broker), config_.broker, std::move(sleeper)))
    , positions_(config_, router_)
    , exposure_(config_.account.max_total_exposure)
    , attempts_(config_.max_attempts_per_pivot)
    , store_(std::move(store))
    , decisions_(decisions ? std::move(decisions) : std::make_shared<DecisionLog>())
{
    config_.validate();
}

void Engine::add_pipeline(const PivotSetup& setup, LogicalPosition first_position) {
    auto pl = std::make_unique<Pipeline>();
    pl->watch = std::make_unique<SymbolWatch>(setup, config_, first_position);
    pl->last_position = first_position - 1;
    pipelines_[setup.symbol] = std::move(pl);
    positions_.add_symbol(setup.symbol);
}

void Engine::load_watchlist(const std::vector<PivotSetup>& setups) {
    for (const auto& s : setups) {
        if (pipelines_.count(s.symbol)) {
            spdlog::warn("{}: duplicate watchlist entry ignored", s.symbol);
            continue;
        }
        add_pipeline(s, 0);
        spdlog::info("Watching {} {} pivot {:.2f} ({})", s.symbol, to_string(s.side_bias),
                     s.pivot_price, to_string(s.setup_type));
    }
}

Engine::Pipeline& Engine::pipeline(const std::string& symbol) const {
    auto it = pipelines_.find(symbol);
    if (it == pipelines_.end()) {
        throw DataError(symbol + " is not on the watchlist");
    }
    return *it->second;
}

void Engine::halt(Pipeline& pl, const std::string& symbol, const std::string& reason) {
    pl.halted = true;
    pl.halt_reason = reason;
    spdlog::error("{}: new entries halted: {}", symbol, reason);
}

ReconciliationReport Engine::start() {
    std::vector<Position> persisted;

    if (store_) {
        auto snap = store_->load();
        if (snap) {
            spdlog::info("Resuming session {}: {} open positions, {} closed trades",
                         snap->session_date, snap->positions.size(), snap->closed_trades.size());
            positions_.restore_ledger(snap->closed_trades);
            attempts_.restore(snap->attempts);
            last_data_ms_ = snap->as_of_ms;

            for (const auto& [symbol, last] : snap->last_positions) {
                auto it = pipelines_.find(symbol);
                if (it == pipelines_.end()) continue;
                auto setup = it->second->watch->setup;
                it->second->watch = std::make_unique<SymbolWatch>(setup, config_, last + 1);
                it->second->last_position = last;
            }

            for (const auto& p : snap->positions) {
                if (!pipelines_.count(p.symbol)) {
                    // Still ours to manage even if today's scan dropped it
                    PivotSetup setup{p.symbol, p.pivot_price, p.side, 0.0, 0.0, p.setup_type, std::nullopt};
                    LogicalPosition first = 0;
                    auto lp = snap->last_positions.find(p.symbol);
                    if (lp != snap->last_positions.end()) first = lp->second + 1;
                    add_pipeline(setup, first);
                }
                persisted.push_back(p);
            }
        }
    }

    auto holdings = router_->current_holdings();
    auto report = SessionStateStore::reconcile(persisted, holdings);

    for (const auto& p : persisted) {
        if (report.halted.count(p.symbol)) {
            halt(pipeline(p.symbol), p.symbol, report.halted.at(p.symbol));
            continue;
        }
        positions_.restore(p);
        exposure_.set(p.symbol, static_cast<double>(p.remaining_shares) * p.entry_price);
        spdlog::info("{}: resumed {} x{} @ {:.2f}, stop {:.2f}", p.symbol, to_string(p.side),
                     p.remaining_shares, p.entry_price, p.stop_price);
    }
    for (const auto& symbol : report.untracked) {
        auto it = pipelines_.find(symbol);
        if (it != pipelines_.end()) {
            halt(*it->second, symbol, "untracked broker holding");
        }
    }

    reconciled_ = true;
    spdlog::info("Reconciliation complete: {} clean, {} halted, {} untracked",
                 report.clean.size(), report.halted.size(), report.untracked.size());
    persist(last_data_ms_);
    return report;
}

EntryGate Engine::gate_for(const Pipeline& pl) const {
    const auto& setup = pl.watch->setup;
    EntryGate gate;
    gate.reconciliation_pending = !reconciled_;
    gate.entries_halted = pl.halted;
    gate.position_open = positions_.has_position(setup.symbol);
    gate.attempts = attempts_.attempts(setup.symbol, setup.pivot_price);
    return gate;
}

EntryDecision Engine::on_bar(const std::string& symbol, const Bar& bar) {
    Pipeline& pl = pipeline(symbol);
    std::lock_guard<std::mutex> lock(pl.mutex);

    LogicalPosition pos = pl.watch->bars.append(bar);
    pl.last_position = pos;
    last_data_ms_ = std::max<int64_t>(last_data_ms_, bar.open_time_ms);

    manage_position(pl, symbol, bar.close, bar.open_time_ms);

    auto decision = machine_.on_bar(*pl.watch, pos, gate_for(pl));
    if (decision.is_enter()) {
        handle_entry(pl, decision);
    }
    decisions_->record(decision);
    return decision;
}

EntryDecision Engine::on_order_flow(const std::string& symbol, const OrderFlowSample& sample) {
    Pipeline& pl = pipeline(symbol);
    std::lock_guard<std::mutex> lock(pl.mutex);

    auto decision = machine_.on_order_flow(*pl.watch, sample, gate_for(pl));
    last_data_ms_ = std::max<int64_t>(last_data_ms_, sample.time_ms);
    if (decision.is_enter()) {
        handle_entry(pl, decision);
    }
    decisions_->record(decision);
    return decision;
}

void Engine::handle_entry(Pipeline& pl, EntryDecision& decision) {
    const auto& setup = pl.watch->setup;
    const auto& t = config_.thresholds(setup.setup_type);

    double stop = RiskSizer::initial_stop(setup.side_bias, setup.pivot_price, t.stop_offset_pct);
    auto sizing = RiskSizer::size(config_.account, decision.reference_price, stop);
    if (!sizing.ok()) {
        decision.action = DecisionAction::Reject;
        decision.reason = DecisionReason::SizingRejected;
        decision.detail = sizing.rationale;
        return;
    }

    double value = static_cast<double>(sizing.shares) * decision.reference_price;
    if (!exposure_.try_reserve(setup.symbol, value)) {
        decision.action = DecisionAction::Reject;
        decision.reason = DecisionReason::ExposureLimit;
        decision.detail = fmt::format("{:.2f} on top of {:.2f} exceeds {:.2f}", value,
                                      exposure_.total(), config_.account.max_total_exposure);
        return;
    }

    try {
        positions_.open(decision, sizing.shares, stop);
    } catch (const SizingError& e) {
        exposure_.release(setup.symbol);
        decision.action = DecisionAction::Reject;
        decision.reason = DecisionReason::SizingRejected;
        decision.detail = e.what();
        return;
    } catch (const BrokerFailure& e) {
        exposure_.release(setup.symbol);
        decision.action = DecisionAction::Reject;
        decision.reason = DecisionReason::BrokerRejected;
        decision.detail = e.what();
        return;
    }

    decision.attempts = attempts_.record_attempt(setup.symbol, setup.pivot_price);
    decision.detail += fmt::format("; {} shares ({}), stop {:.2f}", sizing.shares,
                                   sizing.rationale, stop);
    persist(decision.time_ms);
}

void Engine::manage_position(Pipeline& pl, const std::string& symbol, double price, int64_t time_ms) {
    pl.last_price = price;
    if (!positions_.has_position(symbol)) return;

    try {
        positions_.on_tick(symbol, price, time_ms);
    } catch (const BrokerFailure& e) {
        halt(pl, symbol, e.what());
    }
    persist(time_ms);
}

void Engine::after_fill(const std::string& symbol, const std::vector<ClosedTrade>& closed) {
    auto pos = positions_.get(symbol);
    if (pos) {
        exposure_.set(symbol, static_cast<double>(pos->remaining_shares) * pos->entry_price);
    } else {
        exposure_.release(symbol);
    }

    if (closed.empty()) return;
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto& trade : closed) {
        for (auto& listener : listeners_) {
            try {
                listener(trade);
            } catch (const std::exception& e) {
                spdlog::error("{}: trade listener failed: {}", symbol, e.what());
            }
        }
    }
}

void Engine::on_order_event(const OrderEvent& ev) {
    if (!pipelines_.count(ev.symbol)) {
        spdlog::warn("Order event {} for unwatched symbol {}", ev.order_id, ev.symbol);
        return;
    }
    auto closed = positions_.on_order_event(ev);
    after_fill(ev.symbol, closed);
    last_data_ms_ = std::max<int64_t>(last_data_ms_, ev.time_ms);
    persist(ev.time_ms);
}

void Engine::poll_broker() {
    for (const auto& ev : router_->poll_events()) {
        on_order_event(ev);
    }
}

void Engine::begin_session(const std::string& session_date) {
    for (auto& [symbol, pl] : pipelines_) {
        std::lock_guard<std::mutex> lock(pl->mutex);
        auto setup = pl->watch->setup;
        pl->watch = std::make_unique<SymbolWatch>(setup, config_, 0);
        pl->last_position = -1;
    }
    attempts_.clear();
    positions_.restore_ledger({});
    if (store_) {
        store_->set_session_date(session_date);
    }
    persist(last_data_ms_);
}

void Engine::persist(int64_t as_of_ms) {
    if (!store_) return;
    std::lock_guard<std::mutex> lock(persist_mutex_);

    SessionSnapshot snap;
    snap.as_of_ms = as_of_ms;
    snap.positions = positions_.open_positions();
    snap.attempts = attempts_.snapshot();
    for (const auto& [symbol, pl] : pipelines_) {
        LogicalPosition last = pl->last_position;
        if (last >= 0) snap.last_positions[symbol] = last;
    }
    snap.closed_trades = positions_.ledger();
    snap.summary = positions_.summary();

    try {
        store_->save(snap);
    } catch (const std::exception& e) {
        spdlog::error("Session state save failed: {}", e.what());
    }
}

void Engine::shutdown() {
    spdlog::info("Flushing session state ({} open positions)", positions_.open_positions().size());
    persist(last_data_ms_);
}

void Engine::on_trade_closed(TradeListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

bool Engine::is_halted(const std::string& symbol) const {
    return pipeline(symbol).halted;
}

int Engine::attempts(const std::string& symbol) const {
    const auto& setup = pipeline(symbol).watch->setup;
    return attempts_.attempts(setup.symbol, setup.pivot_price);
}

LogicalPosition Engine::latest_position(const std::string& symbol) const {
    return pipeline(symbol).last_position;
}

nlohmann::json Engine::status() const {
    nlohmann::json halted = nlohmann::json::object();
    double unrealized = 0.0;
    for (const auto& [symbol, pl] : pipelines_) {
        double price = pl->last_price;
        if (price > 0) {
            unrealized += positions_.unrealized_pnl(symbol, price);
        }
        if (pl->halted) {
            std::lock_guard<std::mutex> lock(pl->mutex);
            halted[symbol] = pl->halt_reason;
        }
    }
    return {
        {"reconciled", reconciled_.load()},
        {"symbols", pipelines_.size()},
        {"halted", halted},
        {"open_positions", positions_.open_positions().size()},
        {"exposure", exposure_.total()},
        {"unrealized_pnl", unrealized},
        {"decisions", decisions_->size()},
        {"last_data_ms", last_data_ms_.load()},
        {"summary", positions_.summary().to_json()}
    };
}
