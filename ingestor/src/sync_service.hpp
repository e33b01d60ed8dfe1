#pragma once

#include "local_store.hpp"
#include "gap_planner.hpp"
#include "fetch_executor.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class SyncStatus {
    Complete,
    Partial,
    Failed
};

std::string sync_status_name(SyncStatus status);

// Inclusive calendar dates to grid-aligned epochs: from midnight of `from`
// up to the last sample of `to`.
CoverageRange date_range(const std::string& from, const std::string& to, Interval interval);

struct SyncResult {
    SeriesKey key;
    CoverageRange requested{0, 0};
    SyncStatus status = SyncStatus::Failed;
    std::vector<CoverageRange> planned;
    std::vector<CoverageRange> committed;
    std::vector<CoverageRange> remaining;
    std::size_t rows_written = 0;
    std::vector<std::string> messages;

    nlohmann::json to_json() const;
};

class SyncService {
public:
    SyncService(std::shared_ptr<StoreRegistry> stores,
                std::shared_ptr<FetchExecutor> executor,
                std::string source_tag = "kite_api");

    // Fetches and stores whatever part of [start, end] is not yet covered.
    SyncResult sync_series(const SeriesKey& key, int64_t start, int64_t end,
                           const CancelToken* cancel = nullptr);

    std::vector<CoverageRange> get_coverage(const SeriesKey& key);

private:
    std::shared_ptr<std::mutex> series_mutex(const SeriesKey& key);

    std::shared_ptr<StoreRegistry> stores_;
    std::shared_ptr<FetchExecutor> executor_;
    GapPlanner planner_;
    std::string source_tag_;

    std::mutex series_mutexes_guard_;
    std::map<std::string, std::shared_ptr<std::mutex>> series_mutexes_;
};
