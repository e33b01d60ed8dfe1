#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

enum class Segment {
    Equity,
    Derivatives,
    Commodity,
    Currency
};

enum class Interval {
    Minute,
    Minute3,
    Minute5,
    Minute10,
    Minute15,
    Minute30,
    Minute60,
    Day
};

struct IntervalTraits {
    int64_t unit_seconds;
    int max_span_days;     // upstream limit per historical request
    uint32_t block_rows;   // records per compressed block
};

struct SeriesKey {
    Segment segment;
    std::string exchange;
    std::string symbol;
    Interval interval;

    // "/data/NSE/RELIANCE/day"
    std::string dataset_path() const;
    std::string to_string() const;

    // Builds a key from exchange/symbol/interval, deriving the segment
    // from the exchange. Throws std::invalid_argument on unknown values.
    static SeriesKey make(const std::string& exchange, const std::string& symbol,
                          const std::string& interval);
    static SeriesKey from_dataset_path(Segment segment, const std::string& path);

    bool operator==(const SeriesKey& other) const;
    bool operator<(const SeriesKey& other) const;
};

// Validation bounds for one market segment.
struct SegmentRules {
    Segment segment;
    bool open_interest_expected;
    double min_price;
    double max_price;
    bool zero_price_allowed;
    int64_t max_volume;
    int64_t max_open_interest;
    double spike_threshold;
    double max_warn_ratio;

    static SegmentRules for_segment(Segment segment);
};

namespace schema {
    const IntervalTraits& traits(Interval interval);
    int64_t unit_seconds(Interval interval);

    std::string segment_name(Segment segment);
    std::optional<Segment> parse_segment(const std::string& name);
    std::optional<Segment> segment_for_exchange(const std::string& exchange);
    std::vector<Segment> all_segments();

    std::string interval_name(Interval interval);
    std::optional<Interval> parse_interval(const std::string& name);

    // Derivative-like segments carry open interest in their record layout.
    bool carries_open_interest(Segment segment);
}
