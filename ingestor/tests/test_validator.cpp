#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/validator.hpp"
#include "test_support.hpp"
#include <cmath>
#include <limits>

using Catch::Matchers::ContainsSubstring;

namespace {

std::vector<RawBar> clean_rows(int64_t start, int count, bool with_oi = false) {
    std::vector<RawBar> rows;
    for (const auto& bar : make_bars(start, 86400, count)) {
        auto raw = to_raw(bar, with_oi);
        if (with_oi) raw.open_interest = 5000;
        rows.push_back(raw);
    }
    return rows;
}

} // namespace

TEST_CASE("Clean equity batch passes", "[validator]") {
    auto rules = SegmentRules::for_segment(Segment::Equity);
    auto report = Validator::validate(clean_rows(day("2024-01-01"), 10), rules);

    REQUIRE(report.verdict == Verdict::Pass);
    REQUIRE(report.storable());
    REQUIRE(report.bars.size() == 10);
    REQUIRE(report.stats.clean_rows == 10);
    REQUIRE(report.errors.empty());
    REQUIRE(report.warnings.empty());
}

TEST_CASE("OHLC violation fails the batch", "[validator]") {
    auto rules = SegmentRules::for_segment(Segment::Equity);
    auto rows = clean_rows(day("2024-01-11"), 5);
    rows[2].low = *rows[2].open + 5.0;

    auto report = Validator::validate(rows, rules);
    REQUIRE(report.verdict == Verdict::Fail);
    REQUIRE_FALSE(report.storable());
    REQUIRE(report.bars.empty());
    REQUIRE(report.stats.ohlc_violations == 1);
    REQUIRE(report.stats.failed_rows == 1);
    REQUIRE_THAT(report.errors[0], ContainsSubstring("OHLC violation"));
    REQUIRE_THAT(report.errors[0], ContainsSubstring("row 2"));
}

TEST_CASE("Row level failures", "[validator]") {
    auto rules = SegmentRules::for_segment(Segment::Equity);
    auto rows = clean_rows(day("2024-01-01"), 4);

    SECTION("Missing field") {
        rows[1].close.reset();
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Fail);
        REQUIRE(report.stats.missing_fields == 1);
        REQUIRE_THAT(report.errors[0], ContainsSubstring("missing close"));
    }

    SECTION("Zero price on an equity") {
        rows[0].open = 0.0;
        rows[0].low = 0.0;
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Fail);
        REQUIRE(report.stats.out_of_bounds >= 1);
    }

    SECTION("Non-finite price") {
        rows[3].high = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(Validator::validate(rows, rules).verdict == Verdict::Fail);
    }

    SECTION("Price above the segment ceiling") {
        rows[1].open = 2e6;
        rows[1].high = 2e6;
        REQUIRE(Validator::validate(rows, rules).verdict == Verdict::Fail);
    }

    SECTION("Negative volume") {
        rows[2].volume = -1;
        REQUIRE(Validator::validate(rows, rules).verdict == Verdict::Fail);
    }

    SECTION("Duplicate timestamp") {
        rows[2].timestamp = rows[1].timestamp;
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Fail);
        REQUIRE(report.stats.ordering_errors == 1);
        REQUIRE_THAT(report.errors[0], ContainsSubstring("duplicate timestamp"));
    }

    SECTION("Out of order timestamp") {
        std::swap(rows[1].timestamp, rows[2].timestamp);
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Fail);
        REQUIRE_THAT(report.errors[0], ContainsSubstring("out of order"));
    }
}

TEST_CASE("Warnings keep the batch storable", "[validator]") {
    auto rules = SegmentRules::for_segment(Segment::Equity);
    auto rows = clean_rows(day("2024-01-01"), 10);

    SECTION("Zero volume") {
        rows[4].volume = 0;
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Warn);
        REQUIRE(report.storable());
        REQUIRE(report.bars.size() == 10);
        REQUIRE(report.stats.zero_volume == 1);
    }

    SECTION("Price spike") {
        rows[6].open = 200.0;
        rows[6].high = 201.0;
        rows[6].low = 199.0;
        rows[6].close = 200.0;
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Warn);
        REQUIRE(report.stats.spikes >= 1);
        REQUIRE_THAT(report.warnings[0], ContainsSubstring("price spike"));
    }

    SECTION("Unexpected open interest is dropped") {
        rows[0].open_interest = 10;
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Warn);
        REQUIRE(report.bars[0].open_interest == 0);
    }
}

TEST_CASE("Warning ratio above the limit escalates to fail", "[validator]") {
    auto rules = SegmentRules::for_segment(Segment::Equity);
    auto rows = clean_rows(day("2024-01-01"), 10);
    for (int i = 0; i < 6; ++i) rows[i].volume = 0;

    auto report = Validator::validate(rows, rules);
    REQUIRE(report.verdict == Verdict::Fail);
    REQUIRE(report.bars.empty());
    REQUIRE_THAT(report.errors.back(), ContainsSubstring("6 of 10 rows carry warnings"));

    SECTION("Exactly at the limit still warns") {
        rows[5].volume = 1000;
        REQUIRE(Validator::validate(rows, rules).verdict == Verdict::Warn);
    }

    SECTION("A looser limit lets the batch through") {
        rules.max_warn_ratio = 0.8;
        REQUIRE(Validator::validate(rows, rules).verdict == Verdict::Warn);
    }
}

TEST_CASE("Derivative rules", "[validator]") {
    auto rules = SegmentRules::for_segment(Segment::Derivatives);
    REQUIRE(rules.open_interest_expected);
    REQUIRE(rules.zero_price_allowed);

    auto rows = clean_rows(day("2024-01-01"), 4, true);

    SECTION("Open interest is carried through") {
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Pass);
        REQUIRE(report.bars[3].open_interest == 5000);
    }

    SECTION("Missing open interest warns") {
        rows[1].open_interest.reset();
        auto report = Validator::validate(rows, rules);
        REQUIRE(report.verdict == Verdict::Warn);
        REQUIRE(report.stats.open_interest_issues == 1);
        REQUIRE(report.bars[1].open_interest == 0);
    }

    SECTION("Open interest out of range fails") {
        rows[2].open_interest = -5;
        REQUIRE(Validator::validate(rows, rules).verdict == Verdict::Fail);
    }
}

TEST_CASE("Empty batch warns", "[validator]") {
    auto report = Validator::validate({}, SegmentRules::for_segment(Segment::Currency));
    REQUIRE(report.verdict == Verdict::Warn);
    REQUIRE(report.storable());
    REQUIRE(report.warnings == std::vector<std::string>{"empty batch"});
}

TEST_CASE("Messages are capped per list", "[validator]") {
    auto rules = SegmentRules::for_segment(Segment::Equity);
    auto rows = clean_rows(day("2024-01-01"), 40);
    for (auto& row : rows) row.volume = -1;

    auto report = Validator::validate(rows, rules);
    REQUIRE(report.errors.size() == Validator::kMaxMessages + 1);
    REQUIRE_THAT(report.errors.back(), ContainsSubstring("20 more errors"));
    REQUIRE(report.to_json()["failed_rows"] == 40);
}
