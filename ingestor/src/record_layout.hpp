#pragma once

#include "bars.hpp"
#include "schema.hpp"
#include <string>
#include <vector>
#include <variant>
#include <cstddef>

// ts, open, high, low, close, volume
struct EquityLayout {
    static constexpr std::size_t kRecordSize = 48;
    void encode(const Bar& bar, std::string& out) const;
    Bar decode(const char* p) const;
};

// ts, open, high, low, close, volume, open interest
struct DerivativeLayout {
    static constexpr std::size_t kRecordSize = 56;
    void encode(const Bar& bar, std::string& out) const;
    Bar decode(const char* p) const;
};

using RecordLayout = std::variant<EquityLayout, DerivativeLayout>;

namespace layout {
    constexpr int kSchemaVersion = 1;

    RecordLayout for_segment(Segment segment);
    std::size_t record_size(const RecordLayout& layout);
    std::string encode(const RecordLayout& layout, const std::vector<Bar>& bars);
    std::vector<Bar> decode(const RecordLayout& layout, const std::string& bytes);
}
