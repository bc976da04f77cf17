#include "session_store.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

nlohmann::json SessionSnapshot::to_json() const {
    nlohmann::json pos = nlohmann::json::array();
    for (const auto& p : positions) pos.push_back(p.to_json());

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& t : closed_trades) trades.push_back(t.to_json());

    return {
        {"session_date", session_date},
        {"as_of_ms", as_of_ms},
        {"positions", pos},
        {"attempts", attempts},
        {"last_positions", last_positions},
        {"closed_trades", trades},
        {"summary", summary.to_json()}
    };
}

SessionSnapshot SessionSnapshot::from_json(const nlohmann::json& j) {
    try {
        SessionSnapshot s;
        s.session_date = j.at("session_date").get<std::string>();
        s.as_of_ms = j.at("as_of_ms").get<int64_t>();
        for (const auto& p : j.at("positions")) {
            s.positions.push_back(Position::from_json(p));
        }
        s.attempts = j.at("attempts").get<std::map<std::string, int>>();
        s.last_positions = j.at("last_positions").get<std::map<std::string, LogicalPosition>>();
        for (const auto& t : j.at("closed_trades")) {
            s.closed_trades.push_back(ClosedTrade::from_json(t));
        }
        const auto& sum = j.at("summary");
        s.summary.trades = sum.at("trades").get<int>();
        s.summary.winners = sum.at("winners").get<int>();
        s.summary.losers = sum.at("losers").get<int>();
        s.summary.gross_pnl = sum.at("gross_pnl").get<double>();
        s.summary.fees = sum.at("fees").get<double>();
        s.summary.net_pnl = sum.at("net_pnl").get<double>();
        return s;
    } catch (const nlohmann::json::exception& e) {
        throw DataError(std::string("Malformed session snapshot: ") + e.what());
    }
}

JsonFileSessionBackend::JsonFileSessionBackend(std::string dir) : dir_(std::move(dir)) {
    fs::create_directories(dir_);
}

std::string JsonFileSessionBackend::path_for(const std::string& session_date) const {
    return (fs::path(dir_) / ("session_" + session_date + ".json")).string();
}

void JsonFileSessionBackend::save(const SessionSnapshot& snapshot) {
    std::string path = path_for(snapshot.session_date);
    std::string tmp = path + ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write session state " + tmp);
        }
        out << snapshot.to_json().dump(2);
        out.flush();
        if (!out) {
            throw std::runtime_error("Short write to session state " + tmp);
        }
    }

    if (fs::exists(path)) {
        fs::copy_file(path, path + ".bak", fs::copy_options::overwrite_existing);
    }
    fs::rename(tmp, path);
}

std::optional<SessionSnapshot> JsonFileSessionBackend::read_file(const std::string& path) {
    if (!fs::exists(path)) return std::nullopt;

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot read session state " + path);
    }
    try {
        return SessionSnapshot::from_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::parse_error& e) {
        throw DataError("Corrupt session state " + path + ": " + e.what());
    }
}

std::optional<SessionSnapshot> JsonFileSessionBackend::load(const std::string& session_date) {
    std::string path = path_for(session_date);
    try {
        return read_file(path);
    } catch (const DataError& e) {
        spdlog::error("{}; falling back to backup", e.what());
        return read_file(path + ".bak");
    }
}

SessionStateStore::SessionStateStore(std::shared_ptr<SessionBackend> backend, std::string session_date)
    : backend_(std::move(backend)), session_date_(std::move(session_date)) {
    spdlog::info("Session state for {} via {}", session_date_, backend_->name());
}

void SessionStateStore::save(SessionSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.session_date = session_date_;
    backend_->save(snapshot);
    saves_++;
}

std::optional<SessionSnapshot> SessionStateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto snap = backend_->load(session_date_);
    if (snap && snap->session_date != session_date_) {
        spdlog::warn("Ignoring session state for {} (current session {})", snap->session_date,
                     session_date_);
        return std::nullopt;
    }
    return snap;
}

std::string SessionStateStore::session_date() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_date_;
}

void SessionStateStore::set_session_date(const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::info("Session rolled {} -> {}", session_date_, date);
    session_date_ = date;
}

int64_t SessionStateStore::saves() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saves_;
}

void SessionStateStore::reconcile_position(const Position& pos, const std::vector<Holding>& holdings) {
    const Holding* held = nullptr;
    for (const auto& h : holdings) {
        if (h.symbol == pos.symbol) {
            held = &h;
            break;
        }
    }

    if (!held || held->shares == 0) {
        throw ReconciliationMismatch(pos.symbol, fmt::format(
            "session holds {} x{} but broker reports no position",
            to_string(pos.side), pos.remaining_shares));
    }

    Side broker_side = held->shares > 0 ? Side::Long : Side::Short;
    if (broker_side != pos.side) {
        throw ReconciliationMismatch(pos.symbol, fmt::format(
            "session side {} but broker side {}", to_string(pos.side), to_string(broker_side)));
    }

    int64_t broker_shares = held->shares > 0 ? held->shares : -held->shares;
    if (broker_shares != pos.remaining_shares) {
        throw ReconciliationMismatch(pos.symbol, fmt::format(
            "session holds {} shares, broker {}", pos.remaining_shares, broker_shares));
    }
}

ReconciliationReport SessionStateStore::reconcile(const std::vector<Position>& persisted,
                                                  const std::vector<Holding>& holdings) {
    ReconciliationReport report;
    std::set<std::string> tracked;

    for (const auto& pos : persisted) {
        tracked.insert(pos.symbol);
        try {
            reconcile_position(pos, holdings);
            report.clean.push_back(pos.symbol);
        } catch (const ReconciliationMismatch& e) {
            spdlog::error("Reconciliation mismatch: {}", e.what());
            report.halted[e.symbol()] = e.what();
        }
    }

    for (const auto& h : holdings) {
        if (h.shares != 0 && !tracked.count(h.symbol)) {
            spdlog::error("Reconciliation mismatch: {} x{} held at broker but not in session state",
                          h.symbol, h.shares);
            report.untracked.push_back(h.symbol);
        }
    }
    return report;
}
