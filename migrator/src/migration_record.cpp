#include "migration_record.hpp"
#include <fmt/format.h>
#include <cmath>
#include <unordered_map>

namespace migration {

DedupKey dedup_key(const MigrationRecord& record) {
    return DedupKey{record.timestamp, record.exchange, record.symbol, record.interval};
}

std::optional<MigrationRecord> convert_bar(const Bar& bar, const SeriesKey& key,
                                           const std::string& provenance,
                                           std::string& error) {
    if (bar.timestamp <= 0) {
        error = fmt::format("non-positive timestamp {}", bar.timestamp);
        return std::nullopt;
    }
    for (double v : {bar.open, bar.high, bar.low, bar.close}) {
        if (!std::isfinite(v)) {
            error = fmt::format("non-finite price at {}", bar.timestamp);
            return std::nullopt;
        }
    }
    if (bar.volume < 0) {
        error = fmt::format("negative volume at {}", bar.timestamp);
        return std::nullopt;
    }

    MigrationRecord record;
    record.timestamp = bar.timestamp;
    record.exchange = key.exchange;
    record.symbol = key.symbol;
    record.interval = schema::interval_name(key.interval);
    record.segment = schema::segment_name(key.segment);
    record.open = bar.open;
    record.high = bar.high;
    record.low = bar.low;
    record.close = bar.close;
    record.volume = bar.volume;
    if (schema::carries_open_interest(key.segment)) {
        record.open_interest = bar.open_interest;
    }
    record.provenance = provenance;
    return record;
}

std::size_t dedup_batch(std::vector<MigrationRecord>& batch) {
    std::unordered_map<DedupKey, std::size_t, DedupKeyHash> last_index;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        last_index[dedup_key(batch[i])] = i;
    }
    if (last_index.size() == batch.size()) return 0;

    std::vector<MigrationRecord> kept;
    kept.reserve(last_index.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
        if (last_index[dedup_key(batch[i])] == i) {
            kept.push_back(std::move(batch[i]));
        }
    }
    std::size_t dropped = batch.size() - kept.size();
    batch.swap(kept);
    return dropped;
}

} // namespace migration
