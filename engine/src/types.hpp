#pragma once

#include <cstdint>
#include <optional>
#include <string>

using LogicalPosition = int64_t;

enum class Side {
    Long,
    Short
};

enum class SetupType {
    Momentum,
    Pullback,
    Bounce
};

struct Bar {
    int64_t open_time_ms;
    double open;
    double high;
    double low;
    double close;
    double volume;
};

// imbalance_pct is signed: positive = selling pressure, negative = buying pressure
struct OrderFlowSample {
    int64_t time_ms;
    double imbalance_pct;
    std::optional<double> price;  // trade price when the sample was cut, if the feed carries it
};

// One scanner candidate, read once per session
struct PivotSetup {
    std::string symbol;
    double pivot_price;
    Side side_bias;
    double score;
    double risk_reward;
    SetupType setup_type = SetupType::Momentum;
    std::optional<double> target_price;
};

std::string to_string(Side side);
std::string to_string(SetupType type);
Side side_from_string(const std::string& s);
SetupType setup_type_from_string(const std::string& s);

// +1 for LONG, -1 for SHORT; used to fold both sides into one comparison
inline double side_sign(Side side) {
    return side == Side::Long ? 1.0 : -1.0;
}

// True if price sits strictly beyond the pivot in the breakout direction
inline bool is_beyond_pivot(Side side, double price, double pivot) {
    return side == Side::Long ? price > pivot : price < pivot;
}

// Signed distance from pivot as a fraction, positive in the breakout direction
inline double pivot_clearance(Side side, double price, double pivot) {
    if (pivot <= 0) return 0.0;
    return side_sign(side) * (price - pivot) / pivot;
}
