#include "migration_pipeline.hpp"
#include "checkpoint.hpp"
#include "worker_pool.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <set>

namespace {

struct Source {
    std::string path;
    std::shared_ptr<LocalStore> store;
};

struct WorkItem {
    std::size_t source;
    DatasetMeta meta;
    std::string id;
};

struct Counters {
    std::atomic<std::size_t> processed{0};
    std::atomic<std::size_t> resumed{0};
    std::atomic<uint64_t> rows_read{0};
    std::atomic<uint64_t> rows_written{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> row_errors{0};

    std::mutex mutex;
    std::vector<std::string> row_error_samples;
    std::vector<DatasetFailure> failures;

    void fail(const std::string& dataset, const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex);
        failures.push_back({dataset, error});
    }

    void row_error(const std::string& sample) {
        ++row_errors;
        std::lock_guard<std::mutex> lock(mutex);
        if (row_error_samples.size() < MigrationPipeline::kMaxRowErrorSamples) {
            row_error_samples.push_back(sample);
        }
    }
};

std::vector<Source> open_sources(const std::vector<std::string>& paths,
                                 std::vector<DatasetFailure>& failures) {
    std::vector<Source> sources;
    for (const auto& path : paths) {
        try {
            sources.push_back({path, LocalStore::open_source(path)});
        } catch (const std::exception& e) {
            spdlog::error("Cannot open source {}: {}", path, e.what());
            failures.push_back({path, e.what()});
        }
    }
    return sources;
}

void migrate_dataset(const Source& source, const WorkItem& item, TargetWriter* writer,
                     const MigrationConfig& config, Counters& counters) {
    auto dataset = source.store->read(item.meta.key);
    if (!dataset) {
        throw std::runtime_error("dataset disappeared from source");
    }
    counters.rows_read += dataset->bars.size();

    const auto& bars = dataset->bars;
    std::size_t written = 0;
    for (std::size_t off = 0; off < bars.size(); off += config.batch_size) {
        std::size_t end = std::min(bars.size(), off + config.batch_size);

        std::vector<MigrationRecord> batch;
        batch.reserve(end - off);
        for (std::size_t i = off; i < end; ++i) {
            std::string error;
            auto record = migration::convert_bar(bars[i], item.meta.key, config.provenance_tag, error);
            if (!record) {
                counters.row_error(item.id + ": " + error);
                continue;
            }
            batch.push_back(std::move(*record));
        }

        counters.duplicates += migration::dedup_batch(batch);
        if (writer) {
            writer->write(batch);
        }
        written += batch.size();
    }

    if (writer) {
        writer->flush();
    }
    counters.rows_written += written;
    spdlog::info("Migrated {} ({} rows)", item.id, written);
}

} // namespace

std::string migration_status_name(MigrationStatus status) {
    switch (status) {
        case MigrationStatus::Complete: return "complete";
        case MigrationStatus::Partial: return "partial";
        case MigrationStatus::Failed: return "failed";
    }
    return "unknown";
}

std::size_t VerificationReport::mismatches() const {
    return static_cast<std::size_t>(std::count_if(keys.begin(), keys.end(),
        [](const KeyVerification& k) { return !k.ok; }));
}

nlohmann::json VerificationReport::to_json() const {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& k : keys) {
        rows.push_back({
            {"series", k.key.to_string()},
            {"source_total", k.source_total},
            {"source_distinct", k.source_distinct},
            {"target", k.target_count},
            {"ok", k.ok},
            {"note", k.note}
        });
    }
    return {{"mismatches", mismatches()}, {"series", rows}};
}

MigrationStatus MigrationSummary::status() const {
    bool verification_failed = verification && verification->mismatches() > 0;
    if (verification_failed) return MigrationStatus::Failed;
    if (!failures.empty() && datasets_processed == 0) return MigrationStatus::Failed;
    if (!failures.empty() || row_errors > 0) return MigrationStatus::Partial;
    return MigrationStatus::Complete;
}

nlohmann::json MigrationSummary::to_json() const {
    nlohmann::json failure_json = nlohmann::json::array();
    for (const auto& f : failures) {
        failure_json.push_back({{"dataset", f.dataset}, {"error", f.error}});
    }

    nlohmann::json j = {
        {"status", migration_status_name(status())},
        {"datasets_total", datasets_total},
        {"datasets_processed", datasets_processed},
        {"datasets_resumed", datasets_resumed},
        {"rows_read", rows_read},
        {"rows_written", rows_written},
        {"rows_skipped_duplicate", rows_skipped_duplicate},
        {"row_errors", row_errors},
        {"row_error_samples", row_error_samples},
        {"failures", failure_json},
        {"elapsed_seconds", elapsed_seconds}
    };
    if (verification) {
        j["verification"] = verification->to_json();
    }
    return j;
}

MigrationPipeline::MigrationPipeline(std::shared_ptr<TargetStore> target)
    : target_(std::move(target)) {}

MigrationSummary MigrationPipeline::migrate(const MigrationConfig& config) {
    if (config.batch_size == 0) {
        throw std::invalid_argument("batch size must be positive");
    }

    auto started = std::chrono::steady_clock::now();
    MigrationSummary summary;
    Counters counters;

    auto sources = open_sources(config.sources, counters.failures);

    std::vector<WorkItem> items;
    for (std::size_t s = 0; s < sources.size(); ++s) {
        for (const auto& meta : sources[s].store->list_datasets()) {
            items.push_back({s, meta, sources[s].path + "|" + meta.key.dataset_path()});
        }
    }
    summary.datasets_total = items.size();

    std::unique_ptr<MigrationCheckpoint> checkpoint;
    if (!config.checkpoint_path.empty() && !config.dry_run) {
        checkpoint = std::make_unique<MigrationCheckpoint>(config.checkpoint_path);
    }

    spdlog::info("Migrating {} datasets from {} source(s) with {} worker(s), batch size {}{}",
                 items.size(), sources.size(), config.worker_count, config.batch_size,
                 config.dry_run ? " (dry run)" : "");

    std::atomic<std::size_t> next{0};
    auto worker = [&](std::size_t worker_id) {
        std::unique_ptr<TargetWriter> writer;
        if (!config.dry_run) {
            writer = target_->open_writer();
        }

        for (;;) {
            std::size_t i = next++;
            if (i >= items.size()) break;
            const auto& item = items[i];

            if (checkpoint && checkpoint->is_done(item.id, item.meta.checksum)) {
                ++counters.resumed;
                spdlog::debug("Worker {} skipping completed {}", worker_id, item.id);
                continue;
            }

            try {
                migrate_dataset(sources[item.source], item, writer.get(), config, counters);
                ++counters.processed;
                if (checkpoint) {
                    checkpoint->mark_done(item.id, item.meta.checksum);
                }
            } catch (const std::exception& e) {
                spdlog::error("Worker {} failed on {}: {}", worker_id, item.id, e.what());
                counters.fail(item.id, e.what());
            }
        }
    };

    std::size_t workers = std::max<std::size_t>(1, std::min(config.worker_count, std::max<std::size_t>(1, items.size())));
    {
        WorkerPool pool(workers);
        std::vector<std::future<void>> running;
        for (std::size_t w = 0; w < workers; ++w) {
            running.push_back(pool.submit([&worker, w]() { worker(w); }));
        }

        std::exception_ptr first_error;
        for (auto& f : running) {
            try {
                f.get();
            } catch (const std::exception& e) {
                spdlog::error("Migration worker aborted: {}", e.what());
                if (!first_error) first_error = std::current_exception();
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

    summary.datasets_processed = counters.processed;
    summary.datasets_resumed = counters.resumed;
    summary.rows_read = counters.rows_read;
    summary.rows_written = counters.rows_written;
    summary.rows_skipped_duplicate = counters.duplicates;
    summary.row_errors = counters.row_errors;
    summary.row_error_samples = counters.row_error_samples;
    summary.failures = counters.failures;

    if (config.verify && !config.dry_run) {
        summary.verification = verify(config.sources);
        // Rows repeated across sources collapse in the target by key.
        uint64_t collapsed = 0;
        for (const auto& k : summary.verification->keys) {
            if (k.source_total > k.source_distinct) {
                collapsed += k.source_total - k.source_distinct;
            }
        }
        summary.rows_skipped_duplicate = std::max(summary.rows_skipped_duplicate, collapsed);
    }

    summary.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();

    spdlog::info("Migration {}: {}/{} datasets, {} rows written, {} duplicates skipped, "
                 "{} row errors, {} failures in {:.1f}s",
                 migration_status_name(summary.status()), summary.datasets_processed,
                 summary.datasets_total, summary.rows_written, summary.rows_skipped_duplicate,
                 summary.row_errors, summary.failures.size(), summary.elapsed_seconds);
    return summary;
}

VerificationReport MigrationPipeline::verify(const std::vector<std::string>& sources) {
    std::vector<DatasetFailure> unopened;
    auto opened = open_sources(sources, unopened);

    std::map<SeriesKey, std::pair<uint64_t, std::set<int64_t>>> per_key;
    for (const auto& source : opened) {
        for (const auto& meta : source.store->list_datasets()) {
            auto& entry = per_key[meta.key];
            entry.first += meta.row_count;
            try {
                auto dataset = source.store->read(meta.key);
                if (dataset) {
                    for (const auto& bar : dataset->bars) {
                        entry.second.insert(bar.timestamp);
                    }
                }
            } catch (const StorageIntegrityError& e) {
                spdlog::error("Verification cannot read {} in {}: {}", meta.key.to_string(),
                              source.path, e.what());
            }
        }
    }

    VerificationReport report;
    for (const auto& [key, counts] : per_key) {
        KeyVerification v;
        v.key = key;
        v.source_total = counts.first;
        v.source_distinct = counts.second.size();
        v.target_count = target_->count_rows(key);

        if (v.target_count < static_cast<int64_t>(v.source_distinct)) {
            v.ok = false;
            v.note = fmt::format("target missing {} rows", v.source_distinct - v.target_count);
        } else if (v.target_count > static_cast<int64_t>(v.source_total)) {
            v.ok = false;
            v.note = fmt::format("target holds {} rows more than the sources", v.target_count - v.source_total);
        } else if (v.source_total > v.source_distinct) {
            v.note = fmt::format("{} duplicate source rows collapsed", v.source_total - v.source_distinct);
        }

        if (!v.ok) {
            spdlog::warn("Verification mismatch for {}: {}", key.to_string(), v.note);
        }
        report.keys.push_back(v);
    }

    spdlog::info("Verification: {} series, {} mismatches", report.keys.size(), report.mismatches());
    return report;
}
