#pragma once

#include <map>
#include <mutex>
#include <string>

// Per-pivot entry attempt counters for the current session
class AttemptGuard {
public:
    explicit AttemptGuard(int max_attempts_per_pivot);

    int attempts(const std::string& symbol, double pivot) const;
    bool can_attempt(const std::string& symbol, double pivot) const;
    int record_attempt(const std::string& symbol, double pivot);

    std::map<std::string, int> snapshot() const;
    void restore(const std::map<std::string, int>& counts);
    void clear();

    // Map key for one pivot, also used by persisted session snapshots
    static std::string key(const std::string& symbol, double pivot);

private:
    mutable std::mutex mutex_;
    int max_attempts_;
    std::map<std::string, int> counts_;
};
