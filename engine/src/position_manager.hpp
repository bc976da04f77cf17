#pragma once

#include "decision.hpp"
#include "order_router.hpp"
#include "strategy_config.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class ExitReason {
    Partial,
    ProfitTarget,
    StallExit,
    StopHit,
    TrailStop,
    EodClose
};

enum class StopKind {
    Initial,
    Breakeven,
    Trailing
};

std::string to_string(ExitReason reason);
std::string to_string(StopKind kind);
ExitReason exit_reason_from_string(const std::string& s);
StopKind stop_kind_from_string(const std::string& s);

struct PartialFill {
    double fraction;   // of the original share count
    int64_t shares;
    double price;
    int64_t time_ms;
};

// Close or partial sent to the broker and not yet confirmed
struct PendingExit {
    std::string order_id;
    ExitReason reason;
    int64_t shares;
    bool full;
    int level = -1;    // partial level index, -1 for a full close
    double reference_price;
    int64_t time_ms;
};

struct Position {
    std::string symbol;
    Side side;
    SetupType setup_type;
    double pivot_price;
    double entry_price;
    int64_t shares;             // at entry
    int64_t remaining_shares;
    double remaining_fraction;  // remaining_shares / shares
    double stop_price;
    StopKind stop_kind = StopKind::Initial;
    double best_price;          // most favorable price since entry
    LogicalPosition entry_logical_position;
    int64_t entry_time_ms;
    std::vector<PartialFill> partials_taken;
    std::vector<int> levels_taken;
    double fees = 0.0;
    bool entry_filled = false;

    std::string entry_order_id;
    std::string stop_order_id;
    std::vector<std::string> broker_order_ids;
    std::optional<PendingExit> pending_exit;

    bool pending_close() const { return pending_exit && pending_exit->full; }
    double unrealized_gain_pct(double price) const;

    nlohmann::json to_json() const;
    static Position from_json(const nlohmann::json& j);
};

struct ClosedTrade {
    std::string symbol;
    Side side;
    SetupType setup_type;
    double entry_price;
    double exit_price;          // share-weighted over partials and the final close
    int64_t shares;
    double fees;
    double realized_pnl;        // net of fees
    ExitReason reason;
    int64_t entry_time_ms;
    int64_t exit_time_ms;
    int64_t duration_ms;
    std::vector<PartialFill> partials;

    nlohmann::json to_json() const;
    static ClosedTrade from_json(const nlohmann::json& j);
};

struct DailySummary {
    int trades = 0;
    int winners = 0;
    int losers = 0;
    double gross_pnl = 0.0;
    double fees = 0.0;
    double net_pnl = 0.0;

    nlohmann::json to_json() const;
};

// Exit decided on a tick; the order is in flight when returned
struct ExitAction {
    std::string symbol;
    ExitReason reason;
    int64_t shares;
    bool full;
    double price;
    std::string order_id;
};

// Account-level total exposure; the only state shared across symbol pipelines
class AccountExposure {
public:
    explicit AccountExposure(double max_total_exposure);

    // Reserves value for a new position; false if the limit would be exceeded
    bool try_reserve(const std::string& symbol, double value);
    void release(const std::string& symbol);
    void set(const std::string& symbol, double value);
    double total() const;

private:
    mutable std::mutex mutex_;
    double max_total_;
    std::map<std::string, double> by_symbol_;
};

// Owns open positions, exit-rule evaluation and the closed-trade ledger.
// Slots are created per watched symbol up front; each slot has its own lock
// so symbols never contend with each other.
class PositionManager {
public:
    PositionManager(const StrategyConfig& config, std::shared_ptr<OrderRouter> router);

    void add_symbol(const std::string& symbol);

    // Sends the entry order and the protective stop. Throws SizingError before
    // submission, BrokerFailure if the entry order cannot be placed.
    Position open(const EntryDecision& decision, int64_t shares, double stop_price);

    // Exit rules for one tick, first applicable wins. Throws BrokerFailure when
    // the close order cannot be placed.
    std::optional<ExitAction> on_tick(const std::string& symbol, double price, int64_t time_ms);

    // Correlates a broker event by order id; returns trades closed by it
    std::vector<ClosedTrade> on_order_event(const OrderEvent& ev);

    bool has_position(const std::string& symbol) const;
    bool is_pending_close(const std::string& symbol) const;
    std::optional<Position> get(const std::string& symbol) const;
    std::vector<Position> open_positions() const;
    std::vector<ClosedTrade> ledger() const;
    DailySummary summary() const;
    // Open P&L of the remaining shares at price; 0 when flat
    double unrealized_pnl(const std::string& symbol, double price) const;

    // Session resume and reconciliation
    void restore(const Position& pos);
    void restore_ledger(const std::vector<ClosedTrade>& trades);

private:
    struct Slot {
        std::mutex mutex;
        std::optional<Position> position;
    };

    const StrategyConfig& config_;
    std::shared_ptr<OrderRouter> router_;
    std::map<std::string, std::unique_ptr<Slot>> slots_;

    mutable std::mutex ledger_mutex_;
    std::vector<ClosedTrade> ledger_;

    Slot& slot(const std::string& symbol) const;

    std::optional<ExitAction> evaluate(Position& p, double price, int64_t time_ms);
    std::optional<ExitAction> send_exit(Position& p, ExitReason reason, int64_t shares, bool full,
                                        int level, double price, int64_t time_ms);
    void tighten_stop(Position& p, double candidate, StopKind kind);
    void replace_stop(Position& p);
    ClosedTrade close_out(Position& p, ExitReason reason, int64_t shares, double price,
                          int64_t time_ms);
};
