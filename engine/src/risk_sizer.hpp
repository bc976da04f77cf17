#pragma once

#include "types.hpp"
#include "strategy_config.hpp"
#include <string>

struct SizingResult {
    int64_t shares;      // 0 when rejected
    double risk_cap;     // floor(account * risk / stop distance)
    double value_cap;    // floor(max_position_value / entry)
    double share_cap;
    std::string rationale;

    bool ok() const { return shares > 0; }
};

class RiskSizer {
public:
    // Minimum of the risk, value and absolute caps. Rejected (shares == 0) on a
    // zero stop distance or any cap <= 0.
    static SizingResult size(double account_size, double risk_fraction,
                             double entry_price, double stop_price,
                             double max_position_value, int max_shares);

    static SizingResult size(const AccountLimits& limits, double entry_price, double stop_price);

    // Same as size() but throws SizingError when rejected
    static int64_t size_or_throw(const AccountLimits& limits, double entry_price, double stop_price);

    // Rejects before submission if shares at the submit price would exceed
    // max_position_value * (1 + buffer). Throws SizingError.
    static void check_pre_trade(int64_t shares, double submit_price, const AccountLimits& limits);

    // Hard stop at the pivot, pushed away from it by stop_offset_pct
    static double initial_stop(Side side, double pivot, double stop_offset_pct);
};
