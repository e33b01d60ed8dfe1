#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    std::vector<std::string> split(const std::string& str, char delim);
    int64_t current_timestamp_ms();
    std::string to_upper(std::string s);

    // Calendar helpers. Epoch values carry exchange-local wall clock time,
    // so all conversions are done as if in UTC.
    int64_t parse_date(const std::string& yyyy_mm_dd);
    int64_t parse_datetime(const std::string& text);
    std::string format_date(int64_t epoch_seconds);
    std::string format_datetime(int64_t epoch_seconds);
    std::string today();

    // Byte-order helpers for the store file format.
    void put_u32(std::string& out, uint32_t v);
    void put_u64(std::string& out, uint64_t v);
    uint32_t get_u32(const char* p);
    uint64_t get_u64(const char* p);
}
