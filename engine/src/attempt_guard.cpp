#include "attempt_guard.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

AttemptGuard::AttemptGuard(int max_attempts_per_pivot) : max_attempts_(max_attempts_per_pivot) {}

int AttemptGuard::attempts(const std::string& symbol, double pivot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(key(symbol, pivot));
    return it == counts_.end() ? 0 : it->second;
}

bool AttemptGuard::can_attempt(const std::string& symbol, double pivot) const {
    return attempts(symbol, pivot) < max_attempts_;
}

int AttemptGuard::record_attempt(const std::string& symbol, double pivot) {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = ++counts_[key(symbol, pivot)];
    spdlog::debug("{}: attempt {}/{} on pivot {:.2f}", symbol, n, max_attempts_, pivot);
    return n;
}

std::map<std::string, int> AttemptGuard::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

void AttemptGuard::restore(const std::map<std::string, int>& counts) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_ = counts;
}

std::string AttemptGuard::key(const std::string& symbol, double pivot) {
    return fmt::format("{}@{:.4f}", symbol, pivot);
}

void AttemptGuard::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.clear();
}
