#pragma once

#include "target_store.hpp"
#include "local_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

struct MigrationConfig {
    std::vector<std::string> sources;
    std::size_t worker_count = 1;
    std::size_t batch_size = 25000;
    std::string checkpoint_path;
    bool verify = true;
    bool dry_run = false;
    std::string provenance_tag = "local_store_migration";
};

struct DatasetFailure {
    std::string dataset;
    std::string error;
};

struct KeyVerification {
    SeriesKey key;
    uint64_t source_total = 0;
    uint64_t source_distinct = 0;
    int64_t target_count = 0;
    bool ok = true;
    std::string note;
};

struct VerificationReport {
    std::vector<KeyVerification> keys;

    std::size_t mismatches() const;
    nlohmann::json to_json() const;
};

enum class MigrationStatus {
    Complete,
    Partial,
    Failed
};

std::string migration_status_name(MigrationStatus status);

struct MigrationSummary {
    std::size_t datasets_total = 0;
    std::size_t datasets_processed = 0;
    std::size_t datasets_resumed = 0;
    uint64_t rows_read = 0;
    uint64_t rows_written = 0;
    uint64_t rows_skipped_duplicate = 0;
    uint64_t row_errors = 0;
    std::vector<std::string> row_error_samples;
    std::vector<DatasetFailure> failures;
    std::optional<VerificationReport> verification;
    double elapsed_seconds = 0.0;

    MigrationStatus status() const;
    nlohmann::json to_json() const;
};

class MigrationPipeline {
public:
    static constexpr std::size_t kMaxRowErrorSamples = 50;

    explicit MigrationPipeline(std::shared_ptr<TargetStore> target);

    MigrationSummary migrate(const MigrationConfig& config);

    // Compares per-series row counts between source files and the target.
    VerificationReport verify(const std::vector<std::string>& sources);

private:
    std::shared_ptr<TargetStore> target_;
};
