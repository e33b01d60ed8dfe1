#include <catch2/catch_test_macros.hpp>
#include "../src/schema.hpp"
#include "../src/record_layout.hpp"
#include "../src/errors.hpp"
#include "test_support.hpp"

TEST_CASE("Series keys", "[schema]") {
    auto key = SeriesKey::make("nse", "infy", "day");
    REQUIRE(key.segment == Segment::Equity);
    REQUIRE(key.exchange == "NSE");
    REQUIRE(key.symbol == "INFY");
    REQUIRE(key.dataset_path() == "/data/NSE/INFY/day");
    REQUIRE(key.to_string() == "NSE:INFY:day");
    REQUIRE(SeriesKey::from_dataset_path(Segment::Equity, key.dataset_path()) == key);

    REQUIRE(SeriesKey::make("MCX", "GOLD", "60minute").segment == Segment::Commodity);
    REQUIRE(SeriesKey::make("CDS", "USDINR", "minute").segment == Segment::Currency);
    REQUIRE(SeriesKey::make("BFO", "SENSEX", "3minute").segment == Segment::Derivatives);

    REQUIRE_THROWS_AS(SeriesKey::make("LSE", "VOD", "day"), std::invalid_argument);
    REQUIRE_THROWS_AS(SeriesKey::make("NSE", "INFY", "2minute"), std::invalid_argument);
    REQUIRE_THROWS_AS(SeriesKey::from_dataset_path(Segment::Equity, "/NSE/INFY"), std::invalid_argument);
}

TEST_CASE("Interval traits", "[schema]") {
    REQUIRE(schema::unit_seconds(Interval::Minute) == 60);
    REQUIRE(schema::unit_seconds(Interval::Day) == 86400);
    REQUIRE(schema::traits(Interval::Minute).max_span_days == 60);
    REQUIRE(schema::traits(Interval::Day).max_span_days == 2000);
    REQUIRE(schema::interval_name(Interval::Minute15) == "15minute");
    REQUIRE(schema::parse_interval("30minute") == Interval::Minute30);
}

TEST_CASE("Record layout is chosen by segment", "[schema][layout]") {
    auto bars = make_bars(day("2024-01-01"), 86400, 3);
    bars[1].open_interest = 4200;

    auto equity = layout::for_segment(Segment::Equity);
    auto derivatives = layout::for_segment(Segment::Derivatives);
    REQUIRE(layout::record_size(equity) == 48);
    REQUIRE(layout::record_size(derivatives) == 56);

    auto raw = layout::encode(derivatives, bars);
    REQUIRE(raw.size() == 3 * 56);
    REQUIRE(layout::decode(derivatives, raw)[1].open_interest == 4200);

    REQUIRE(layout::decode(equity, layout::encode(equity, bars))[1].open_interest == 0);
    REQUIRE_THROWS_AS(layout::decode(equity, raw.substr(0, 50)), StorageIntegrityError);
}
