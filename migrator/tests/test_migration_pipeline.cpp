#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/migration_pipeline.hpp"
#include "../src/checkpoint.hpp"
#include "memory_target.hpp"
#include "../../ingestor/tests/test_support.hpp"
#include <cmath>
#include <limits>

using Catch::Matchers::ContainsSubstring;

namespace {

const SeriesKey kInfy = SeriesKey::make("NSE", "INFY", "day");
const SeriesKey kTcs = SeriesKey::make("NSE", "TCS", "day");

std::string make_source(const TempDir& dir, const std::string& name, Segment segment,
                        const std::vector<std::pair<SeriesKey, std::vector<Bar>>>& datasets) {
    StoreOptions options;
    options.path = dir.file(name + "/" + StoreRegistry::file_name(segment));
    LocalStore store(options, segment);
    for (const auto& [key, bars] : datasets) {
        store.write(key, bars, WriteMode::Append);
    }
    return options.path;
}

MigrationConfig config_for(std::vector<std::string> sources) {
    MigrationConfig config;
    config.sources = std::move(sources);
    config.worker_count = 3;
    config.batch_size = 4;
    return config;
}

} // namespace

TEST_CASE("Rows shared by two source files land once", "[migration]") {
    TempDir dir;
    auto a = make_source(dir, "a", Segment::Equity, {{kInfy, make_bars(day("2024-01-01"), 86400, 10)}});
    auto b = make_source(dir, "b", Segment::Equity, {{kInfy, make_bars(day("2024-01-10"), 86400, 6)}});

    auto target = std::make_shared<MemoryTarget>();
    MigrationPipeline pipeline(target);
    auto summary = pipeline.migrate(config_for({a, b}));

    REQUIRE(summary.status() == MigrationStatus::Complete);
    REQUIRE(summary.datasets_total == 2);
    REQUIRE(summary.datasets_processed == 2);
    REQUIRE(summary.rows_read == 16);
    REQUIRE(target->count_rows(kInfy) == 15);

    REQUIRE(summary.verification.has_value());
    REQUIRE(summary.verification->mismatches() == 0);
    const auto& v = summary.verification->keys.at(0);
    REQUIRE(v.source_total == 16);
    REQUIRE(v.source_distinct == 15);
    REQUIRE_THAT(v.note, ContainsSubstring("1 duplicate source rows collapsed"));
    REQUIRE(summary.rows_skipped_duplicate == 1);
    REQUIRE(summary.to_json()["rows_skipped_duplicate"] == 1);

    SECTION("Running again changes nothing") {
        auto again = pipeline.migrate(config_for({a, b}));
        REQUIRE(again.status() == MigrationStatus::Complete);
        REQUIRE(target->count_rows(kInfy) == 15);
    }
}

TEST_CASE("Repeated keys inside a batch keep the last row", "[migration]") {
    std::vector<MigrationRecord> batch(3);
    for (auto& r : batch) {
        r.exchange = "NSE";
        r.symbol = "INFY";
        r.interval = "day";
    }
    batch[0].timestamp = 100;
    batch[0].close = 1.0;
    batch[1].timestamp = 200;
    batch[2].timestamp = 100;
    batch[2].close = 2.0;

    REQUIRE(migration::dedup_batch(batch) == 1);
    REQUIRE(batch.size() == 2);
    REQUIRE(batch[0].timestamp == 200);
    REQUIRE(batch[1].close == 2.0);
}

TEST_CASE("Bars convert into target records", "[migration]") {
    std::string error;

    SECTION("Equity rows carry no open interest") {
        auto r = migration::convert_bar(make_bar(day("2024-01-01"), 100.0, 10, 99), kInfy, "tag", error);
        REQUIRE(r.has_value());
        REQUIRE(r->segment == "EQUITY");
        REQUIRE(r->interval == "day");
        REQUIRE_FALSE(r->open_interest.has_value());
        REQUIRE(r->provenance == "tag");
    }

    SECTION("Derivative rows do") {
        auto key = SeriesKey::make("NFO", "BANKNIFTY24JANFUT", "15minute");
        auto r = migration::convert_bar(make_bar(day("2024-01-01"), 100.0, 10, 99), key, "tag", error);
        REQUIRE(r->open_interest == 99);
    }

    SECTION("Unrepresentable rows are refused") {
        auto bad = make_bar(day("2024-01-01"), 100.0);
        bad.high = std::numeric_limits<double>::infinity();
        REQUIRE_FALSE(migration::convert_bar(bad, kInfy, "tag", error).has_value());
        REQUIRE_THAT(error, ContainsSubstring("non-finite"));

        REQUIRE_FALSE(migration::convert_bar(make_bar(0, 100.0), kInfy, "tag", error).has_value());
        REQUIRE_FALSE(migration::convert_bar(make_bar(day("2024-01-01"), 100.0, -5), kInfy, "tag", error)
                          .has_value());
    }
}

TEST_CASE("Failures stay with their dataset", "[migration]") {
    TempDir dir;
    auto source = make_source(dir, "a", Segment::Equity, {
        {kInfy, make_bars(day("2024-01-01"), 86400, 10)},
        {kTcs, make_bars(day("2024-01-01"), 86400, 10)},
    });

    auto target = std::make_shared<MemoryTarget>();
    target->fail_symbol("TCS");
    MigrationPipeline pipeline(target);

    SECTION("Without verification the run is partial") {
        auto config = config_for({source});
        config.verify = false;
        auto summary = pipeline.migrate(config);

        REQUIRE(summary.status() == MigrationStatus::Partial);
        REQUIRE(summary.datasets_processed == 1);
        REQUIRE(summary.failures.size() == 1);
        REQUIRE_THAT(summary.failures[0].dataset, ContainsSubstring("/data/NSE/TCS/day"));
        REQUIRE(target->count_rows(kInfy) == 10);
        REQUIRE(target->count_rows(kTcs) == 0);
    }

    SECTION("Verification flags the missing rows") {
        auto summary = pipeline.migrate(config_for({source}));
        REQUIRE(summary.status() == MigrationStatus::Failed);
        REQUIRE(summary.verification->mismatches() == 1);
    }
}

TEST_CASE("Unreadable sources are reported", "[migration]") {
    TempDir dir;
    auto good = make_source(dir, "a", Segment::Equity, {{kInfy, make_bars(day("2024-01-01"), 86400, 3)}});
    auto target = std::make_shared<MemoryTarget>();
    MigrationPipeline pipeline(target);

    auto config = config_for({good, dir.file("missing/EQUITY.bvs")});
    auto summary = pipeline.migrate(config);

    REQUIRE(summary.failures.size() == 1);
    REQUIRE(summary.failures[0].dataset == dir.file("missing/EQUITY.bvs"));
    REQUIRE(summary.datasets_processed == 1);
    REQUIRE(summary.status() == MigrationStatus::Partial);
}

TEST_CASE("Bad rows are counted and sampled", "[migration]") {
    TempDir dir;
    auto bars = make_bars(day("2024-01-01"), 86400, 6);
    bars[2].close = std::nan("");
    auto source = make_source(dir, "a", Segment::Equity, {{kInfy, bars}});

    auto target = std::make_shared<MemoryTarget>();
    MigrationPipeline pipeline(target);
    auto config = config_for({source});
    config.verify = false;
    auto summary = pipeline.migrate(config);

    REQUIRE(summary.row_errors == 1);
    REQUIRE(summary.rows_written == 5);
    REQUIRE(summary.row_error_samples.size() == 1);
    REQUIRE(summary.status() == MigrationStatus::Partial);
    REQUIRE(target->count_rows(kInfy) == 5);
}

TEST_CASE("Checkpoints let an interrupted run resume", "[migration][checkpoint]") {
    TempDir dir;
    auto source = make_source(dir, "a", Segment::Equity, {
        {kInfy, make_bars(day("2024-01-01"), 86400, 10)},
        {kTcs, make_bars(day("2024-01-01"), 86400, 10)},
    });

    auto target = std::make_shared<MemoryTarget>();
    target->fail_symbol("TCS");
    MigrationPipeline pipeline(target);

    auto config = config_for({source});
    config.checkpoint_path = dir.file("checkpoint.json");
    config.verify = false;

    auto first = pipeline.migrate(config);
    REQUIRE(first.datasets_processed == 1);
    REQUIRE(MigrationCheckpoint(config.checkpoint_path).size() == 1);

    auto retry_target = std::make_shared<MemoryTarget>();
    MigrationPipeline retry(retry_target);
    auto second = retry.migrate(config);

    REQUIRE(second.datasets_resumed == 1);
    REQUIRE(second.datasets_processed == 1);
    REQUIRE(second.status() == MigrationStatus::Complete);
    REQUIRE(retry_target->count_rows(kInfy) == 0);
    REQUIRE(retry_target->count_rows(kTcs) == 10);
    REQUIRE(MigrationCheckpoint(config.checkpoint_path).size() == 2);
}

TEST_CASE("Checkpoint entries are pinned to the dataset checksum", "[checkpoint]") {
    TempDir dir;
    MigrationCheckpoint checkpoint(dir.file("cp.json"));
    checkpoint.mark_done("a|/data/NSE/INFY/day", "abc");

    MigrationCheckpoint reloaded(dir.file("cp.json"));
    REQUIRE(reloaded.is_done("a|/data/NSE/INFY/day", "abc"));
    REQUIRE_FALSE(reloaded.is_done("a|/data/NSE/INFY/day", "def"));
    REQUIRE_FALSE(reloaded.is_done("b|/data/NSE/INFY/day", "abc"));
}

TEST_CASE("Extra rows in the target fail verification", "[migration]") {
    TempDir dir;
    auto source = make_source(dir, "a", Segment::Equity, {{kInfy, make_bars(day("2024-01-01"), 86400, 3)}});

    auto target = std::make_shared<MemoryTarget>();
    std::string error;
    auto stray = migration::convert_bar(make_bar(day("2023-06-01"), 90.0), kInfy, "manual", error);
    target->commit({*stray});

    MigrationPipeline pipeline(target);
    auto summary = pipeline.migrate(config_for({source}));

    REQUIRE(summary.status() == MigrationStatus::Failed);
    REQUIRE(summary.verification->keys[0].target_count == 4);
    REQUIRE_THAT(summary.verification->keys[0].note, ContainsSubstring("more than the sources"));
    REQUIRE(summary.to_json()["status"] == "failed");
}

TEST_CASE("Dry runs touch nothing", "[migration]") {
    TempDir dir;
    auto source = make_source(dir, "a", Segment::Equity, {{kInfy, make_bars(day("2024-01-01"), 86400, 8)}});

    auto target = std::make_shared<MemoryTarget>();
    MigrationPipeline pipeline(target);
    auto config = config_for({source});
    config.dry_run = true;
    config.checkpoint_path = dir.file("checkpoint.json");
    auto summary = pipeline.migrate(config);

    REQUIRE(summary.status() == MigrationStatus::Complete);
    REQUIRE(summary.rows_written == 8);
    REQUIRE(target->size() == 0);
    REQUIRE(target->writers_opened() == 0);
    REQUIRE_FALSE(summary.verification.has_value());
    REQUIRE_FALSE(std::filesystem::exists(dir.file("checkpoint.json")));
}
