#pragma once

#include "types.hpp"
#include <vector>

// Bounded per-symbol bar store. Each appended bar gets the next LogicalPosition;
// its physical slot is LogicalPosition mod capacity. Positions older than
// capacity bars are evicted and reported as such, never approximated.
class BarBuffer {
public:
    // first_position > 0 resumes numbering after a restart within a session;
    // positions before it were never stored here and read as evicted.
    explicit BarBuffer(int64_t capacity, LogicalPosition first_position = 0);

    // Throws DataError on a malformed bar or a non-increasing open_time
    LogicalPosition append(const Bar& bar);

    // Throws EvictedRangeError outside the retained window, std::out_of_range
    // for positions not yet appended
    const Bar& get(LogicalPosition pos) const;

    // Position of the newest bar, -1 (or first_position - 1) while empty
    LogicalPosition latest() const { return next_position_ - 1; }
    LogicalPosition oldest_retained() const;

    bool empty() const { return next_position_ == first_position_; }
    int64_t capacity() const { return capacity_; }
    int64_t slot_index(LogicalPosition pos) const { return pos % capacity_; }

    // Session boundary: drop every bar and restart numbering at 0
    void reset();

private:
    int64_t capacity_;
    LogicalPosition first_position_;
    LogicalPosition next_position_;
    std::vector<Bar> slots_;
};

// Checks OHLCV sanity; throws DataError
void validate_bar(const Bar& bar);
