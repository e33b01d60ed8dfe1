#include "sync_service.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

std::string sync_status_name(SyncStatus status) {
    switch (status) {
        case SyncStatus::Complete: return "complete";
        case SyncStatus::Partial: return "partial";
        case SyncStatus::Failed: return "failed";
    }
    return "unknown";
}

CoverageRange date_range(const std::string& from, const std::string& to, Interval interval) {
    const auto unit = schema::unit_seconds(interval);
    int64_t start = util::parse_date(from);
    int64_t end = util::parse_date(to) + 86400 - unit;
    return {start, std::max(start, end)};
}

nlohmann::json SyncResult::to_json() const {
    auto dates = [](const std::vector<CoverageRange>& ranges) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& r : ranges) {
            out.push_back({util::format_datetime(r.start), util::format_datetime(r.end)});
        }
        return out;
    };

    return {
        {"series", key.to_string()},
        {"segment", schema::segment_name(key.segment)},
        {"status", sync_status_name(status)},
        {"requested", dates({requested})},
        {"planned", dates(planned)},
        {"committed", dates(committed)},
        {"remaining", dates(remaining)},
        {"rows_written", rows_written},
        {"messages", messages}
    };
}

SyncService::SyncService(std::shared_ptr<StoreRegistry> stores,
                         std::shared_ptr<FetchExecutor> executor,
                         std::string source_tag)
    : stores_(stores), executor_(std::move(executor)), planner_(stores),
      source_tag_(std::move(source_tag)) {}

std::shared_ptr<std::mutex> SyncService::series_mutex(const SeriesKey& key) {
    std::lock_guard<std::mutex> lock(series_mutexes_guard_);
    auto& m = series_mutexes_[key.to_string()];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

std::vector<CoverageRange> SyncService::get_coverage(const SeriesKey& key) {
    return stores_->get(key)->coverage(key);
}

SyncResult SyncService::sync_series(const SeriesKey& key, int64_t start, int64_t end,
                                    const CancelToken* cancel) {
    auto guard_mutex = series_mutex(key);
    std::lock_guard<std::mutex> guard(*guard_mutex);

    SyncResult result;
    result.key = key;
    result.requested = {start, end};

    std::shared_ptr<LocalStore> store;
    try {
        store = stores_->get(key);
        result.planned = planner_.plan(key, start, end);
    } catch (const StorageIntegrityError& e) {
        spdlog::error("Cannot plan {}: {}", key.to_string(), e.what());
        result.messages.push_back(std::string("integrity: ") + e.what());
        return result;
    } catch (const std::invalid_argument& e) {
        result.messages.push_back(e.what());
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Cannot open store for {}: {}", key.to_string(), e.what());
        result.messages.push_back(std::string("store: ") + e.what());
        return result;
    }

    if (result.planned.empty()) {
        result.status = SyncStatus::Complete;
        result.messages.push_back("already covered");
        spdlog::info("{} already covered for requested range", key.to_string());
        return result;
    }

    auto commit = [&](const SeriesKey& k, const ChunkOutcome& outcome) {
        auto label = fmt::format("chunk {} {}", outcome.chunk.index, coverage::describe({outcome.chunk.range}));

        if (outcome.status != ChunkStatus::Fetched) {
            std::string why = outcome.error;
            if (outcome.status == ChunkStatus::ValidationFailed) {
                auto errors = outcome.validation.errors;
                why = errors.empty() ? "validation failed" : errors.front();
            }
            result.messages.push_back(fmt::format("{} {}: {}", label, chunk_status_name(outcome.status), why));
            return;
        }

        WriteProvenance provenance;
        provenance.source = source_tag_;
        provenance.verdict = verdict_name(outcome.validation.verdict);
        provenance.messages = outcome.validation.warnings;

        try {
            store->write(k, outcome.validation.bars, WriteMode::Append, outcome.chunk.range, provenance);
        } catch (const StoreWriteError& e) {
            spdlog::error("{} {} not committed: {}", k.to_string(), label, e.what());
            result.messages.push_back(fmt::format("{} not committed: {}", label, e.what()));
            return;
        } catch (const StorageIntegrityError&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::error("{} {} not persisted: {}", k.to_string(), label, e.what());
            result.messages.push_back(fmt::format("{} not persisted: {}", label, e.what()));
            return;
        }

        result.committed.push_back(outcome.chunk.range);
        result.rows_written += outcome.validation.bars.size();
        if (outcome.validation.verdict == Verdict::Warn) {
            result.messages.push_back(fmt::format("{} stored with {} warning(s)", label,
                                                  outcome.validation.warnings.size()));
        }
    };

    bool halted = false;
    try {
        executor_->execute(key, result.planned, cancel, commit);
    } catch (const StorageIntegrityError& e) {
        halted = true;
        result.messages.push_back(std::string("integrity: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Sync {} aborted: {}", key.to_string(), e.what());
        halted = true;
        result.messages.push_back(std::string("aborted: ") + e.what());
    }

    const auto unit = schema::unit_seconds(key.interval);
    for (const auto& range : result.planned) {
        auto left = coverage::subtract(range, result.committed, unit);
        result.remaining.insert(result.remaining.end(), left.begin(), left.end());
    }

    if (halted) {
        result.status = SyncStatus::Failed;
    } else if (result.remaining.empty()) {
        result.status = SyncStatus::Complete;
    } else if (!result.committed.empty()) {
        result.status = SyncStatus::Partial;
    } else {
        result.status = SyncStatus::Failed;
    }

    spdlog::info("Sync {} {}: {} rows, {} range(s) remaining", key.to_string(),
                 sync_status_name(result.status), result.rows_written, result.remaining.size());
    return result;
}
