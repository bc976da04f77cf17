#include "risk_sizer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

SizingResult RiskSizer::size(double account_size, double risk_fraction,
                             double entry_price, double stop_price,
                             double max_position_value, int max_shares) {
    SizingResult res{0, 0.0, 0.0, static_cast<double>(max_shares), ""};

    if (!std::isfinite(entry_price) || entry_price <= 0) {
        res.rationale = "invalid entry price";
        return res;
    }

    double stop_distance = std::fabs(entry_price - stop_price);
    if (stop_distance == 0.0) {
        res.rationale = "zero stop distance";
        return res;
    }

    res.risk_cap = std::floor(account_size * risk_fraction / stop_distance);
    res.value_cap = std::floor(max_position_value / entry_price);

    if (res.risk_cap <= 0 || res.value_cap <= 0 || res.share_cap <= 0) {
        res.rationale = fmt::format("non-positive cap (risk {}, value {}, shares {})",
                                    res.risk_cap, res.value_cap, res.share_cap);
        return res;
    }

    double shares = std::min({res.risk_cap, res.value_cap, res.share_cap});
    res.shares = static_cast<int64_t>(shares);

    if (shares == res.value_cap) {
        res.rationale = "value cap";
    } else if (shares == res.risk_cap) {
        res.rationale = "risk cap";
    } else {
        res.rationale = "share cap";
    }
    return res;
}

SizingResult RiskSizer::size(const AccountLimits& limits, double entry_price, double stop_price) {
    return size(limits.account_size, limits.risk_fraction, entry_price, stop_price,
                limits.max_position_value, limits.max_shares);
}

int64_t RiskSizer::size_or_throw(const AccountLimits& limits, double entry_price, double stop_price) {
    auto res = size(limits, entry_price, stop_price);
    if (!res.ok()) {
        throw SizingError(fmt::format("entry {:.2f} stop {:.2f}: {}", entry_price, stop_price,
                                      res.rationale));
    }
    return res.shares;
}

void RiskSizer::check_pre_trade(int64_t shares, double submit_price, const AccountLimits& limits) {
    double value = static_cast<double>(shares) * submit_price;
    double ceiling = limits.max_position_value * (1.0 + limits.position_value_buffer_fraction);
    if (shares <= 0 || value > ceiling) {
        throw SizingError(fmt::format("{} shares at {:.2f} = {:.2f} exceeds {:.2f}",
                                      shares, submit_price, value, ceiling));
    }
}

double RiskSizer::initial_stop(Side side, double pivot, double stop_offset_pct) {
    return pivot * (1.0 - side_sign(side) * stop_offset_pct);
}
