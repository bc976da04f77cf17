#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    int random_jitter(int min_ms, int max_ms);
    std::string redact_dsn(const std::string& dsn);

    // "HH:MM" -> seconds since midnight; throws std::invalid_argument
    int parse_hhmm(const std::string& hhmm);
    std::string format_hhmm(int seconds_of_day);

    // Exchange-local views of a bar timestamp
    int seconds_of_day(int64_t time_ms, int utc_offset_minutes);
    std::string session_date(int64_t time_ms, int utc_offset_minutes);
}
