#include "schema.hpp"
#include "util.hpp"
#include <map>
#include <tuple>
#include <stdexcept>

namespace {

constexpr int64_t kMinute = 60;

const std::map<Interval, IntervalTraits>& traits_table() {
    static const std::map<Interval, IntervalTraits> table = {
        {Interval::Minute,   {kMinute,        60,   1024}},
        {Interval::Minute3,  {3 * kMinute,    100,  1024}},
        {Interval::Minute5,  {5 * kMinute,    100,  1024}},
        {Interval::Minute10, {10 * kMinute,   100,  2048}},
        {Interval::Minute15, {15 * kMinute,   200,  2048}},
        {Interval::Minute30, {30 * kMinute,   200,  2048}},
        {Interval::Minute60, {60 * kMinute,   400,  4096}},
        {Interval::Day,      {24 * 60 * kMinute, 2000, 8192}},
    };
    return table;
}

const std::map<std::string, Interval>& interval_names() {
    static const std::map<std::string, Interval> names = {
        {"minute", Interval::Minute},
        {"3minute", Interval::Minute3},
        {"5minute", Interval::Minute5},
        {"10minute", Interval::Minute10},
        {"15minute", Interval::Minute15},
        {"30minute", Interval::Minute30},
        {"60minute", Interval::Minute60},
        {"day", Interval::Day},
    };
    return names;
}

} // namespace

namespace schema {

const IntervalTraits& traits(Interval interval) {
    return traits_table().at(interval);
}

int64_t unit_seconds(Interval interval) {
    return traits(interval).unit_seconds;
}

std::string segment_name(Segment segment) {
    switch (segment) {
        case Segment::Equity: return "EQUITY";
        case Segment::Derivatives: return "DERIVATIVES";
        case Segment::Commodity: return "COMMODITY";
        case Segment::Currency: return "CURRENCY";
    }
    return "UNKNOWN";
}

std::optional<Segment> parse_segment(const std::string& name) {
    auto upper = util::to_upper(name);
    for (auto segment : all_segments()) {
        if (segment_name(segment) == upper) return segment;
    }
    return std::nullopt;
}

std::optional<Segment> segment_for_exchange(const std::string& exchange) {
    static const std::map<std::string, Segment> exchanges = {
        {"NSE", Segment::Equity},
        {"BSE", Segment::Equity},
        {"NFO", Segment::Derivatives},
        {"BFO", Segment::Derivatives},
        {"MCX", Segment::Commodity},
        {"CDS", Segment::Currency},
    };
    auto it = exchanges.find(util::to_upper(exchange));
    if (it == exchanges.end()) return std::nullopt;
    return it->second;
}

std::vector<Segment> all_segments() {
    return {Segment::Equity, Segment::Derivatives, Segment::Commodity, Segment::Currency};
}

std::string interval_name(Interval interval) {
    for (const auto& [name, value] : interval_names()) {
        if (value == interval) return name;
    }
    return "unknown";
}

std::optional<Interval> parse_interval(const std::string& name) {
    auto it = interval_names().find(name);
    if (it == interval_names().end()) return std::nullopt;
    return it->second;
}

bool carries_open_interest(Segment segment) {
    return segment != Segment::Equity;
}

} // namespace schema

std::string SeriesKey::dataset_path() const {
    return "/data/" + util::to_upper(exchange) + "/" + util::to_upper(symbol) + "/" +
           schema::interval_name(interval);
}

std::string SeriesKey::to_string() const {
    return util::to_upper(exchange) + ":" + util::to_upper(symbol) + ":" +
           schema::interval_name(interval);
}

SeriesKey SeriesKey::make(const std::string& exchange, const std::string& symbol,
                          const std::string& interval) {
    auto segment = schema::segment_for_exchange(exchange);
    if (!segment) {
        throw std::invalid_argument("Unknown exchange: " + exchange);
    }
    auto iv = schema::parse_interval(interval);
    if (!iv) {
        throw std::invalid_argument("Unknown interval: " + interval);
    }
    if (symbol.empty()) {
        throw std::invalid_argument("Empty symbol");
    }
    return SeriesKey{*segment, util::to_upper(exchange), util::to_upper(symbol), *iv};
}

SeriesKey SeriesKey::from_dataset_path(Segment segment, const std::string& path) {
    auto parts = util::split(path, '/');
    if (parts.size() != 4 || parts[0] != "data") {
        throw std::invalid_argument("Malformed dataset path: " + path);
    }
    auto iv = schema::parse_interval(parts[3]);
    if (!iv) {
        throw std::invalid_argument("Unknown interval in dataset path: " + path);
    }
    return SeriesKey{segment, parts[1], parts[2], *iv};
}

bool SeriesKey::operator==(const SeriesKey& other) const {
    return segment == other.segment && exchange == other.exchange &&
           symbol == other.symbol && interval == other.interval;
}

bool SeriesKey::operator<(const SeriesKey& other) const {
    return std::tie(segment, exchange, symbol, interval) <
           std::tie(other.segment, other.exchange, other.symbol, other.interval);
}

SegmentRules SegmentRules::for_segment(Segment segment) {
    SegmentRules rules;
    rules.segment = segment;
    rules.open_interest_expected = schema::carries_open_interest(segment);
    rules.max_volume = 10'000'000'000LL;
    rules.max_open_interest = 100'000'000LL;
    rules.spike_threshold = 0.25;
    rules.max_warn_ratio = 0.5;

    switch (segment) {
        case Segment::Equity:
            rules.min_price = 0.01;
            rules.max_price = 1'000'000.0;
            rules.zero_price_allowed = false;
            break;
        case Segment::Derivatives:
            // Options can expire worthless.
            rules.min_price = 0.0;
            rules.max_price = 100'000.0;
            rules.zero_price_allowed = true;
            break;
        case Segment::Commodity:
            rules.min_price = 0.01;
            rules.max_price = 10'000'000.0;
            rules.zero_price_allowed = false;
            break;
        case Segment::Currency:
            rules.min_price = 0.0001;
            rules.max_price = 10'000.0;
            rules.zero_price_allowed = false;
            break;
    }
    return rules;
}
