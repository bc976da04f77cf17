#pragma once

#include "broker_client.hpp"
#include "position_manager.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Everything needed to resume a trading session after a restart
struct SessionSnapshot {
    std::string session_date;
    int64_t as_of_ms = 0;  // data time of the mutation that produced it
    std::vector<Position> positions;
    std::map<std::string, int> attempts;                     // AttemptGuard::key -> count
    std::map<std::string, LogicalPosition> last_positions;   // symbol -> last processed bar
    std::vector<ClosedTrade> closed_trades;
    DailySummary summary;

    nlohmann::json to_json() const;
    static SessionSnapshot from_json(const nlohmann::json& j);
};

class SessionBackend {
public:
    virtual ~SessionBackend() = default;
    virtual void save(const SessionSnapshot& snapshot) = 0;
    virtual std::optional<SessionSnapshot> load(const std::string& session_date) = 0;
    virtual std::string name() const = 0;
};

// One JSON document per session date under a directory. Writes go to a temp
// file renamed over the previous copy, which is kept as .bak.
class JsonFileSessionBackend : public SessionBackend {
public:
    explicit JsonFileSessionBackend(std::string dir);

    void save(const SessionSnapshot& snapshot) override;
    std::optional<SessionSnapshot> load(const std::string& session_date) override;
    std::string name() const override { return "file:" + dir_; }

    std::string path_for(const std::string& session_date) const;

private:
    std::string dir_;

    static std::optional<SessionSnapshot> read_file(const std::string& path);
};

struct ReconciliationReport {
    std::vector<std::string> clean;
    std::map<std::string, std::string> halted;  // symbol -> mismatch
    std::vector<std::string> untracked;         // held at the broker, unknown to the session

    bool ok() const { return halted.empty() && untracked.empty(); }
};

class SessionStateStore {
public:
    SessionStateStore(std::shared_ptr<SessionBackend> backend, std::string session_date);

    void save(SessionSnapshot snapshot);
    std::optional<SessionSnapshot> load();

    std::string session_date() const;
    // New trading day; subsequent saves and loads use this date
    void set_session_date(const std::string& date);
    int64_t saves() const;

    // Throws ReconciliationMismatch when the broker does not hold exactly this position
    static void reconcile_position(const Position& pos, const std::vector<Holding>& holdings);

    // Per-symbol reconciliation; mismatches are collected, never thrown
    static ReconciliationReport reconcile(const std::vector<Position>& persisted,
                                          const std::vector<Holding>& holdings);

private:
    std::shared_ptr<SessionBackend> backend_;
    std::string session_date_;
    mutable std::mutex mutex_;
    int64_t saves_ = 0;
};
