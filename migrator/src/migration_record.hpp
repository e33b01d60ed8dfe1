#pragma once

#include "bars.hpp"
#include "schema.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>

struct MigrationRecord {
    int64_t timestamp = 0;
    std::string exchange;
    std::string symbol;
    std::string interval;
    std::string segment;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    int64_t volume = 0;
    std::optional<int64_t> open_interest;
    std::string provenance;
};

// Rows sharing this key are the same row in the target.
struct DedupKey {
    int64_t timestamp;
    std::string exchange;
    std::string symbol;
    std::string interval;

    bool operator==(const DedupKey& other) const {
        return timestamp == other.timestamp && exchange == other.exchange &&
               symbol == other.symbol && interval == other.interval;
    }
};

struct DedupKeyHash {
    std::size_t operator()(const DedupKey& k) const {
        std::size_t h = std::hash<int64_t>()(k.timestamp);
        h ^= std::hash<std::string>()(k.exchange) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>()(k.symbol) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>()(k.interval) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

namespace migration {
    DedupKey dedup_key(const MigrationRecord& record);

    // Returns nullopt and fills error when the bar cannot be represented.
    std::optional<MigrationRecord> convert_bar(const Bar& bar, const SeriesKey& key,
                                               const std::string& provenance,
                                               std::string& error);

    // Drops earlier occurrences of a repeated key, keeping the last one and
    // the original order otherwise. Returns the number of rows dropped.
    std::size_t dedup_batch(std::vector<MigrationRecord>& batch);
}
