#include "ilp.hpp"
#include <fmt/format.h>

namespace ilp {

std::string escape_tag(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ',' || c == ' ' || c == '=' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n' || c == '\r') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string format_line(const std::string& table, const MigrationRecord& r) {
    std::string line = fmt::format("{},exchange={},symbol={},interval={},segment={},data_source={} ",
                                   table, escape_tag(r.exchange), escape_tag(r.symbol),
                                   escape_tag(r.interval), escape_tag(r.segment),
                                   escape_tag(r.provenance));
    line += fmt::format("open={},high={},low={},close={},volume={}i",
                        r.open, r.high, r.low, r.close, r.volume);
    if (r.open_interest) {
        line += fmt::format(",oi={}i", *r.open_interest);
    }
    line += fmt::format(" {}\n", r.timestamp * 1000000000LL);
    return line;
}

std::string format_lines(const std::string& table, const std::vector<MigrationRecord>& records) {
    std::string out;
    for (const auto& r : records) {
        out += format_line(table, r);
    }
    return out;
}

} // namespace ilp
