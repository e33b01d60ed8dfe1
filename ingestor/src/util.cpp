#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <ctime>
#include <cctype>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&itt, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        // Trim whitespace
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static int64_t parse_with_format(const std::string& text, const char* fmt) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, fmt);
    if (ss.fail()) {
        throw std::invalid_argument("Unparseable time: " + text);
    }
    return static_cast<int64_t>(timegm(&tm));
}

int64_t parse_date(const std::string& yyyy_mm_dd) {
    return parse_with_format(yyyy_mm_dd, "%Y-%m-%d");
}

int64_t parse_datetime(const std::string& text) {
    // Accepts "2017-12-15T09:15:00", "2017-12-15 09:15:00" and a trailing
    // UTC offset, which is ignored.
    if (text.size() < 19) {
        throw std::invalid_argument("Unparseable time: " + text);
    }
    std::string head = text.substr(0, 19);
    head[10] = 'T';
    return parse_with_format(head, "%Y-%m-%dT%H:%M:%S");
}

static std::string format_with(int64_t epoch_seconds, const char* fmt) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, fmt);
    return ss.str();
}

std::string format_date(int64_t epoch_seconds) {
    return format_with(epoch_seconds, "%Y-%m-%d");
}

std::string format_datetime(int64_t epoch_seconds) {
    return format_with(epoch_seconds, "%Y-%m-%d %H:%M:%S");
}

std::string today() {
    return format_date(current_timestamp_ms() / 1000);
}

void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

void put_u64(std::string& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

uint32_t get_u32(const char* p) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) {
        v = (v << 8) | static_cast<unsigned char>(p[i]);
    }
    return v;
}

uint64_t get_u64(const char* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | static_cast<unsigned char>(p[i]);
    }
    return v;
}

} // namespace util
