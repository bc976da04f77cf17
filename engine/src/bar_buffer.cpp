#include "bar_buffer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

void validate_bar(const Bar& bar) {
    const double prices[] = {bar.open, bar.high, bar.low, bar.close};
    for (double p : prices) {
        if (!std::isfinite(p) || p <= 0) {
            throw DataError("Bar has non-positive or non-finite price");
        }
    }
    if (!std::isfinite(bar.volume) || bar.volume < 0) {
        throw DataError("Bar has negative or non-finite volume");
    }
    if (bar.high < std::max(bar.open, bar.close) || bar.low > std::min(bar.open, bar.close)) {
        throw DataError("Bar high/low do not bracket open/close");
    }
}

BarBuffer::BarBuffer(int64_t capacity, LogicalPosition first_position)
    : capacity_(capacity)
    , first_position_(first_position)
    , next_position_(first_position)
{
    if (capacity_ <= 0) {
        throw std::invalid_argument("BarBuffer capacity must be positive");
    }
    if (first_position_ < 0) {
        throw std::invalid_argument("BarBuffer first position must be non-negative");
    }
    slots_.resize(static_cast<size_t>(capacity_));
}

LogicalPosition BarBuffer::append(const Bar& bar) {
    validate_bar(bar);
    if (!empty() && bar.open_time_ms <= get(latest()).open_time_ms) {
        throw DataError("Out-of-order bar: open_time " + std::to_string(bar.open_time_ms) +
                        " not after " + std::to_string(get(latest()).open_time_ms));
    }

    LogicalPosition pos = next_position_;
    slots_[static_cast<size_t>(slot_index(pos))] = bar;
    next_position_++;
    return pos;
}

LogicalPosition BarBuffer::oldest_retained() const {
    return std::max(first_position_, next_position_ - capacity_);
}

const Bar& BarBuffer::get(LogicalPosition pos) const {
    if (pos >= next_position_) {
        throw std::out_of_range("Logical position " + std::to_string(pos) + " not yet appended");
    }
    if (pos < oldest_retained()) {
        throw EvictedRangeError(pos, latest(), capacity_);
    }
    return slots_[static_cast<size_t>(slot_index(pos))];
}

void BarBuffer::reset() {
    first_position_ = 0;
    next_position_ = 0;
}
