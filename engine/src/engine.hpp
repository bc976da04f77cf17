#pragma once

#include "attempt_guard.hpp"
#include "decision.hpp"
#include "entry_state_machine.hpp"
#include "order_router.hpp"
#include "position_manager.hpp"
#include "session_store.hpp"
#include "strategy_config.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Wires the per-symbol pipelines (bars, breakout state, entry machine, open
// position) to sizing, the broker and session persistence. The set of symbols
// is fixed by load_watchlist(); after that every entry point is safe to call
// concurrently for different symbols.
class Engine {
public:
    using TradeListener = std::function<void(const ClosedTrade&)>;

    Engine(StrategyConfig config, std::shared_ptr<BrokerClient> broker,
           std::shared_ptr<SessionStateStore> store, std::shared_ptr<DecisionLog> decisions,
           OrderRouter::Sleeper sleeper = nullptr);

    void load_watchlist(const std::vector<PivotSetup>& setups);

    // Restores the persisted session and reconciles it against broker holdings.
    // New entries stay blocked until this returns. Throws BrokerFailure if the
    // holdings snapshot cannot be read.
    ReconciliationReport start();

    // Throws DataError for a malformed, out-of-order or unwatched tick
    EntryDecision on_bar(const std::string& symbol, const Bar& bar);
    EntryDecision on_order_flow(const std::string& symbol, const OrderFlowSample& sample);

    void poll_broker();
    void on_order_event(const OrderEvent& ev);

    // Session boundary: fresh bar numbering, breakout state and attempt counters
    void begin_session(const std::string& session_date);

    // Flushes session state; call before the broker connection is released
    void shutdown();

    void on_trade_closed(TradeListener listener);

    bool reconciled() const { return reconciled_; }
    bool is_halted(const std::string& symbol) const;
    int attempts(const std::string& symbol) const;
    LogicalPosition latest_position(const std::string& symbol) const;

    const StrategyConfig& config() const { return config_; }
    PositionManager& positions() { return positions_; }
    DecisionLog& decisions() { return *decisions_; }
    double exposure() const { return exposure_.total(); }

    nlohmann::json status() const;

private:
    struct Pipeline {
        std::mutex mutex;
        std::unique_ptr<SymbolWatch> watch;
        std::atomic<LogicalPosition> last_position{-1};
        std::atomic<double> last_price{0.0};
        std::atomic<bool> halted{false};
        std::string halt_reason;
    };

    StrategyConfig config_;
    EntryStateMachine machine_;
    std::shared_ptr<OrderRouter> router_;
    PositionManager positions_;
    AccountExposure exposure_;
    AttemptGuard attempts_;
    std::shared_ptr<SessionStateStore> store_;
    std::shared_ptr<DecisionLog> decisions_;

    std::map<std::string, std::unique_ptr<Pipeline>> pipelines_;
    std::atomic<bool> reconciled_{false};
    std::atomic<int64_t> last_data_ms_{0};

    std::mutex persist_mutex_;
    std::mutex listeners_mutex_;
    std::vector<TradeListener> listeners_;

    Pipeline& pipeline(const std::string& symbol) const;
    void add_pipeline(const PivotSetup& setup, LogicalPosition first_position);
    void halt(Pipeline& pl, const std::string& symbol, const std::string& reason);

    EntryGate gate_for(const Pipeline& pl) const;
    void handle_entry(Pipeline& pl, EntryDecision& decision);
    void manage_position(Pipeline& pl, const std::string& symbol, double price, int64_t time_ms);
    void after_fill(const std::string& symbol, const std::vector<ClosedTrade>& closed);
    void persist(int64_t as_of_ms);
};
