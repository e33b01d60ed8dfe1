#pragma once

#include "schema.hpp"
#include "coverage.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>

struct ProvenanceEntry {
    std::string committed_at;
    CoverageRange range;
    std::string verdict;
    std::vector<std::string> messages;
};

struct DatasetMeta {
    SeriesKey key;
    int64_t earliest = 0;
    int64_t latest = 0;
    uint64_t row_count = 0;
    std::string updated_at;
    int schema_version = 0;
    std::string checksum;
    std::string source;
    std::vector<CoverageRange> coverage;
    uint32_t block_rows = 0;
    std::vector<ProvenanceEntry> provenance;
};

struct DatasetEntry {
    DatasetMeta meta;
    std::shared_ptr<const std::string> blob;
};

// Immutable snapshot of one store file.
struct StoreImage {
    Segment segment = Segment::Equity;
    std::string created_at;
    std::string updated_at;
    std::map<std::string, DatasetEntry> datasets;  // keyed by dataset path
};

struct StoreMigrationStep {
    uint32_t from;
    uint32_t to;
    std::string name;
    std::function<std::string(const std::string&)> apply;
};

namespace store_format {
    constexpr char kMagic[4] = {'B', 'V', 'L', 'T'};
    constexpr uint32_t kCurrentVersion = 2;
    constexpr std::size_t kHeaderSize = 4 + 4 + 4 + 8;
    constexpr std::size_t kMaxProvenance = 64;

    // Reads only the version stamp. Throws StorageIntegrityError on a bad header.
    uint32_t peek_version(const std::string& bytes);
    // Segment named in the manifest; works for every known version.
    Segment peek_segment(const std::string& bytes);

    std::string encode(const StoreImage& image);

    // Parses a current-version file and verifies every dataset's checksum.
    StoreImage decode(const std::string& bytes);

    // Decompresses a dataset blob and checks it against the recorded checksum.
    std::string unpack_records(const DatasetEntry& entry);
    std::string pack_records(const std::string& raw, uint32_t record_size,
                             uint32_t block_rows, int level);

    // Ordered registry of version upgrade steps.
    const std::vector<StoreMigrationStep>& migration_steps();

    // Applies every step from the file's version up to kCurrentVersion.
    // Throws StoreMigrationError naming the failed step.
    std::string upgrade(const std::string& bytes,
                        const std::vector<StoreMigrationStep>& steps = migration_steps());

    nlohmann::json meta_to_json(const DatasetMeta& meta);
    DatasetMeta meta_from_json(Segment segment, const std::string& path, const nlohmann::json& j);
}
