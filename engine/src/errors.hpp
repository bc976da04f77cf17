#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

// Malformed or out-of-order bar/sample. The tick is dropped, the session continues.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& msg) : std::runtime_error(msg) {}
};

// A lookback reference points outside the retained buffer window
class EvictedRangeError : public std::runtime_error {
public:
    EvictedRangeError(LogicalPosition requested, LogicalPosition latest, int64_t capacity)
        : std::runtime_error("Logical position " + std::to_string(requested) +
                             " evicted (latest " + std::to_string(latest) +
                             ", capacity " + std::to_string(capacity) + ")")
        , requested_(requested) {}

    LogicalPosition requested() const { return requested_; }

private:
    LogicalPosition requested_;
};

class SizingError : public std::runtime_error {
public:
    explicit SizingError(const std::string& msg) : std::runtime_error(msg) {}
};

class ReconciliationMismatch : public std::runtime_error {
public:
    ReconciliationMismatch(const std::string& symbol, const std::string& msg)
        : std::runtime_error(symbol + ": " + msg), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

// Raised by BrokerClient implementations; transient errors are retried by OrderRouter
class BrokerError : public std::runtime_error {
public:
    BrokerError(const std::string& msg, bool transient)
        : std::runtime_error(msg), transient_(transient) {}

    bool transient() const { return transient_; }

private:
    bool transient_;
};

// Order submission/cancellation gave up; fatal for the affected position
class BrokerFailure : public std::runtime_error {
public:
    BrokerFailure(const std::string& symbol, const std::string& msg)
        : std::runtime_error(symbol + ": " + msg), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};
