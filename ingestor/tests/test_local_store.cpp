#include <catch2/catch_test_macros.hpp>
#include "../src/local_store.hpp"
#include "../src/record_layout.hpp"
#include "../src/codec.hpp"
#include "../src/errors.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace {

StoreOptions options_for(const TempDir& dir, const std::string& name = "EQUITY.bvs") {
    StoreOptions options;
    options.path = dir.file(name);
    options.backup_dir = dir.file("backups");
    options.max_backups = 3;
    return options;
}

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void spit(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << bytes;
}

// Legacy layout: one zlib stream per dataset, no coverage list.
std::string build_v1_file(const SeriesKey& key, const std::vector<Bar>& bars,
                          const std::string& checksum_override = "") {
    auto raw = layout::encode(layout::for_segment(key.segment), bars);
    auto blob = codec::compress(raw, 6);

    nlohmann::json entry;
    entry["start_ts"] = bars.front().timestamp;
    entry["end_ts"] = bars.back().timestamp;
    entry["row_count"] = bars.size();
    entry["updated_at"] = "2023-06-01T00:00:00Z";
    entry["source"] = "kite_api";
    entry["checksum"] = checksum_override.empty() ? codec::sha256_hex(raw) : checksum_override;
    entry["blob_offset"] = 0;
    entry["blob_length"] = blob.size();

    nlohmann::json manifest;
    manifest["segment"] = schema::segment_name(key.segment);
    manifest["created_at"] = "2023-01-01T00:00:00Z";
    manifest["last_updated"] = "2023-06-01T00:00:00Z";
    manifest["datasets"][key.dataset_path()] = entry;

    std::string text = manifest.dump();
    std::string out("BVLT", 4);
    util::put_u32(out, 1);
    util::put_u32(out, codec::crc32(text));
    util::put_u64(out, text.size());
    return out + text + blob;
}

std::size_t count_backups(const TempDir& dir) {
    if (!fs::exists(dir.file("backups"))) return 0;
    std::size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir.file("backups"))) {
        if (entry.path().extension() == ".bak") ++n;
    }
    return n;
}

} // namespace

TEST_CASE("Local store round trip", "[store]") {
    TempDir dir;
    auto key = SeriesKey::make("NSE", "INFY", "day");
    auto bars = make_bars(day("2024-01-01"), 86400, 30);

    {
        LocalStore store(options_for(dir), Segment::Equity);
        REQUIRE(store.open_report().created);
        auto meta = store.write(key, bars, WriteMode::Append);
        REQUIRE(meta.row_count == 30);
        REQUIRE(meta.checksum.size() == 64);
    }

    LocalStore reopened(options_for(dir), Segment::Equity);
    auto dataset = reopened.read(key);
    REQUIRE(dataset.has_value());
    REQUIRE(dataset->bars.size() == 30);
    REQUIRE(dataset->bars.front().timestamp == day("2024-01-01"));
    REQUIRE(dataset->bars.back().close == bars.back().close);
    REQUIRE(dataset->meta.earliest == day("2024-01-01"));
    REQUIRE(dataset->meta.latest == bars.back().timestamp);
    REQUIRE(dataset->meta.schema_version == layout::kSchemaVersion);
    REQUIRE(dataset->meta.coverage.size() == 1);
    REQUIRE(reopened.list_datasets().size() == 1);
    REQUIRE_FALSE(reopened.read(SeriesKey::make("NSE", "TCS", "day")).has_value());
}

TEST_CASE("Record layout follows the segment", "[store]") {
    TempDir dir;

    SECTION("Derivative layout keeps open interest") {
        LocalStore store(options_for(dir, "DERIVATIVES.bvs"), Segment::Derivatives);
        auto key = SeriesKey::make("NFO", "NIFTY24JANFUT", "minute");
        std::vector<Bar> bars = {make_bar(day("2024-01-02") + 33300, 21700.0, 500, 120000)};
        store.write(key, bars, WriteMode::Append);
        REQUIRE(store.read(key)->bars[0].open_interest == 120000);
    }

    SECTION("Equity layout does not store open interest") {
        LocalStore store(options_for(dir), Segment::Equity);
        auto key = SeriesKey::make("BSE", "SBIN", "day");
        std::vector<Bar> bars = {make_bar(day("2024-01-02"), 600.0, 500, 777)};
        store.write(key, bars, WriteMode::Append);
        REQUIRE(store.read(key)->bars[0].open_interest == 0);
    }

    SECTION("Writes to another segment's store are refused") {
        LocalStore store(options_for(dir), Segment::Equity);
        auto key = SeriesKey::make("MCX", "GOLD", "day");
        REQUIRE_THROWS_AS(store.write(key, make_bars(day("2024-01-01"), 86400, 2), WriteMode::Append),
                          StoreWriteError);
    }
}

TEST_CASE("Local store append rules", "[store]") {
    TempDir dir;
    LocalStore store(options_for(dir), Segment::Equity);
    auto key = SeriesKey::make("NSE", "RELIANCE", "day");
    store.write(key, make_bars(day("2024-01-01"), 86400, 10), WriteMode::Append,
                CoverageRange{day("2024-01-01"), day("2024-01-10")});

    SECTION("Adjacent append extends coverage into one range") {
        store.write(key, make_bars(day("2024-01-11"), 86400, 5), WriteMode::Append,
                    CoverageRange{day("2024-01-11"), day("2024-01-15")});
        auto cov = store.coverage(key);
        REQUIRE(cov.size() == 1);
        REQUIRE(cov[0] == CoverageRange{day("2024-01-01"), day("2024-01-15")});
        REQUIRE(store.read(key)->bars.size() == 15);
    }

    SECTION("Earlier append is merged in timestamp order") {
        store.write(key, make_bars(day("2023-12-20"), 86400, 3), WriteMode::Append,
                    CoverageRange{day("2023-12-20"), day("2023-12-25")});
        auto bars = store.read(key)->bars;
        REQUIRE(bars.size() == 13);
        REQUIRE(bars.front().timestamp == day("2023-12-20"));
        REQUIRE(store.coverage(key).size() == 2);
    }

    SECTION("Overlapping append is rejected and leaves the dataset alone") {
        auto before = store.metadata(key);
        REQUIRE_THROWS_AS(store.write(key, make_bars(day("2024-01-08"), 86400, 5), WriteMode::Append),
                          StoreWriteError);
        auto after = store.metadata(key);
        REQUIRE(after->checksum == before->checksum);
        REQUIRE(after->row_count == 10);
    }

    SECTION("Unordered batch is rejected") {
        std::vector<Bar> bars = {make_bar(day("2024-02-02"), 10), make_bar(day("2024-02-01"), 10)};
        REQUIRE_THROWS_AS(store.write(key, bars, WriteMode::Append), StoreWriteError);
    }

    SECTION("Bars outside the declared coverage are rejected") {
        REQUIRE_THROWS_AS(store.write(key, make_bars(day("2024-02-01"), 86400, 5), WriteMode::Append,
                                      CoverageRange{day("2024-02-01"), day("2024-02-03")}),
                          StoreWriteError);
    }

    SECTION("Empty batch records coverage only") {
        store.write(key, {}, WriteMode::Append, CoverageRange{day("2024-01-11"), day("2024-01-14")});
        REQUIRE(store.read(key)->bars.size() == 10);
        REQUIRE(store.coverage(key)[0].end == day("2024-01-14"));
    }

    SECTION("Overwrite replaces bars and coverage") {
        store.write(key, make_bars(day("2024-03-01"), 86400, 2), WriteMode::Overwrite);
        auto dataset = store.read(key);
        REQUIRE(dataset->bars.size() == 2);
        REQUIRE(dataset->meta.coverage.size() == 1);
        REQUIRE(dataset->meta.coverage[0].start == day("2024-03-01"));
    }

    SECTION("Warn verdicts are kept as provenance") {
        WriteProvenance provenance;
        provenance.verdict = "warn";
        provenance.messages = {"row 0: zero volume"};
        store.write(key, make_bars(day("2024-01-11"), 86400, 1), WriteMode::Append,
                    CoverageRange{day("2024-01-11"), day("2024-01-11")}, provenance);
        auto meta = store.metadata(key);
        REQUIRE(meta->provenance.size() == 1);
        REQUIRE(meta->provenance[0].verdict == "warn");
        REQUIRE(meta->provenance[0].messages[0] == "row 0: zero volume");
    }

    SECTION("Removing a dataset drops it") {
        REQUIRE(store.remove(key));
        REQUIRE_FALSE(store.metadata(key).has_value());
        REQUIRE_FALSE(store.remove(key));
    }
}

TEST_CASE("Corrupt store files are quarantined on open", "[store][integrity]") {
    TempDir dir;
    auto key = SeriesKey::make("NSE", "HDFCBANK", "day");
    {
        LocalStore store(options_for(dir), Segment::Equity);
        store.write(key, make_bars(day("2024-01-01"), 86400, 50), WriteMode::Append);
    }

    SECTION("Flipped byte in the data section") {
        auto bytes = slurp(dir.file("EQUITY.bvs"));
        bytes[bytes.size() - 3] = static_cast<char>(bytes[bytes.size() - 3] ^ 0x5a);
        spit(dir.file("EQUITY.bvs"), bytes);

        LocalStore store(options_for(dir), Segment::Equity);
        REQUIRE_FALSE(store.open_report().quarantined_to.empty());
        REQUIRE(fs::exists(store.open_report().quarantined_to));
        REQUIRE(store.list_datasets().empty());
        REQUIRE_FALSE(store.read(key).has_value());
    }

    SECTION("Checksum in metadata no longer matches the data") {
        auto image = store_format::decode(slurp(dir.file("EQUITY.bvs")));
        image.datasets.begin()->second.meta.checksum = std::string(64, '0');
        spit(dir.file("EQUITY.bvs"), store_format::encode(image));

        LocalStore store(options_for(dir), Segment::Equity);
        REQUIRE_FALSE(store.open_report().quarantined_to.empty());
        REQUIRE(store.list_datasets().empty());
    }

    SECTION("Block length field claims gigabytes") {
        auto bytes = slurp(dir.file("EQUITY.bvs"));
        std::size_t blob_base = store_format::kHeaderSize + util::get_u64(bytes.data() + 12);
        bytes[blob_base + 7] = static_cast<char>(0xF0);
        spit(dir.file("EQUITY.bvs"), bytes);

        LocalStore store(options_for(dir), Segment::Equity);
        REQUIRE_FALSE(store.open_report().quarantined_to.empty());
        REQUIRE(fs::exists(store.open_report().quarantined_to));
        REQUIRE(store.list_datasets().empty());
    }

    SECTION("Manifest damage") {
        auto bytes = slurp(dir.file("EQUITY.bvs"));
        bytes[store_format::kHeaderSize + 2] = '#';
        spit(dir.file("EQUITY.bvs"), bytes);

        LocalStore store(options_for(dir), Segment::Equity);
        REQUIRE_FALSE(store.open_report().quarantined_to.empty());
    }

    SECTION("Read-only opens refuse instead of quarantining") {
        auto bytes = slurp(dir.file("EQUITY.bvs"));
        bytes[bytes.size() - 3] = static_cast<char>(bytes[bytes.size() - 3] ^ 0x5a);
        spit(dir.file("EQUITY.bvs"), bytes);

        REQUIRE_THROWS_AS(LocalStore::open_source(dir.file("EQUITY.bvs")), StorageIntegrityError);
        REQUIRE(fs::exists(dir.file("EQUITY.bvs")));
    }
}

TEST_CASE("Store versions and migrations", "[store][migration]") {
    TempDir dir;
    auto key = SeriesKey::make("NSE", "ITC", "day");
    auto bars = make_bars(day("2022-01-03"), 86400, 40);

    SECTION("Version 1 files are upgraded after a backup") {
        spit(dir.file("EQUITY.bvs"), build_v1_file(key, bars));

        LocalStore store(options_for(dir), Segment::Equity);
        REQUIRE(store.open_report().migrated_from == 1u);
        REQUIRE(fs::exists(store.open_report().backup_path));
        REQUIRE(store_format::peek_version(slurp(dir.file("EQUITY.bvs"))) == store_format::kCurrentVersion);

        auto dataset = store.read(key);
        REQUIRE(dataset->bars.size() == 40);
        REQUIRE(dataset->meta.coverage.size() == 1);
        REQUIRE(dataset->meta.coverage[0] == CoverageRange{bars.front().timestamp, bars.back().timestamp});
        REQUIRE(dataset->meta.block_rows == schema::traits(Interval::Day).block_rows);
    }

    SECTION("A failing step leaves the file untouched") {
        auto before = build_v1_file(key, bars, std::string(64, 'f'));
        spit(dir.file("EQUITY.bvs"), before);

        REQUIRE_THROWS_AS(LocalStore(options_for(dir), Segment::Equity), StoreMigrationError);
        REQUIRE(slurp(dir.file("EQUITY.bvs")) == before);
        REQUIRE(count_backups(dir) == 1);
    }

    SECTION("Read-only opens upgrade in memory only") {
        auto before = build_v1_file(key, bars);
        spit(dir.file("EQUITY.bvs"), before);

        auto store = LocalStore::open_source(dir.file("EQUITY.bvs"));
        REQUIRE(store->read(key)->bars.size() == 40);
        REQUIRE(slurp(dir.file("EQUITY.bvs")) == before);
        REQUIRE(count_backups(dir) == 0);
    }

    SECTION("Files from a newer version are refused") {
        {
            LocalStore store(options_for(dir), Segment::Equity);
            store.write(key, bars, WriteMode::Append);
        }
        auto bytes = slurp(dir.file("EQUITY.bvs"));
        std::string version;
        util::put_u32(version, store_format::kCurrentVersion + 1);
        bytes.replace(4, 4, version);
        spit(dir.file("EQUITY.bvs"), bytes);

        REQUIRE_THROWS_AS(LocalStore(options_for(dir), Segment::Equity), StoreVersionError);
    }

    SECTION("Old backups are pruned") {
        for (int i = 0; i < 5; ++i) {
            spit(dir.file("EQUITY.bvs"), build_v1_file(key, bars));
            LocalStore store(options_for(dir), Segment::Equity);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        REQUIRE(count_backups(dir) == 3);
    }

    SECTION("Missing steps are reported") {
        std::vector<StoreMigrationStep> none;
        REQUIRE_THROWS_AS(store_format::upgrade(build_v1_file(key, bars), none), StoreMigrationError);
    }
}

TEST_CASE("Readers see whole snapshots while a writer appends", "[store][concurrency]") {
    TempDir dir;
    LocalStore store(options_for(dir), Segment::Equity);
    auto key = SeriesKey::make("NSE", "WIPRO", "day");
    store.write(key, make_bars(day("2020-01-01"), 86400, 5), WriteMode::Append);

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};

    std::thread reader([&]() {
        while (!done) {
            auto dataset = store.read(key);
            if (!dataset || dataset->bars.size() != dataset->meta.row_count) {
                ++inconsistent;
            }
        }
    });

    for (int i = 1; i <= 20; ++i) {
        int64_t start = day("2020-01-01") + i * 5 * 86400;
        store.write(key, make_bars(start, 86400, 5), WriteMode::Append);
    }
    done = true;
    reader.join();

    REQUIRE(inconsistent == 0);
    REQUIRE(store.read(key)->bars.size() == 105);
}
