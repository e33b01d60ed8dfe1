#pragma once

#include "store_format.hpp"
#include "bars.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>

enum class WriteMode {
    Append,
    Overwrite
};

struct StoreOptions {
    std::string path;
    std::string backup_dir;
    int max_backups = 3;
    int compression_level = 6;
    bool read_only = false;
};

struct Dataset {
    DatasetMeta meta;
    std::vector<Bar> bars;
};

// What happened to the file when it was opened.
struct OpenReport {
    bool created = false;
    std::optional<uint32_t> migrated_from;
    std::string backup_path;
    std::string quarantined_to;
};

struct WriteProvenance {
    std::string source = "kite_api";
    std::string verdict = "pass";
    std::vector<std::string> messages;
};

// One container file holding every dataset of a segment.
class LocalStore {
public:
    explicit LocalStore(StoreOptions options, Segment segment);

    // Read-only view of an existing store file, segment taken from its manifest.
    static std::shared_ptr<LocalStore> open_source(const std::string& path);

    std::optional<Dataset> read(const SeriesKey& key);
    std::optional<DatasetMeta> metadata(const SeriesKey& key) const;
    std::vector<CoverageRange> coverage(const SeriesKey& key) const;
    std::vector<DatasetMeta> list_datasets() const;

    // Appends (or replaces) bars and records covered as fetched. covered
    // defaults to [first bar, last bar]. Throws StoreWriteError when the batch
    // breaks ordering or overlaps existing coverage in append mode.
    DatasetMeta write(const SeriesKey& key, const std::vector<Bar>& bars, WriteMode mode,
                      std::optional<CoverageRange> covered = std::nullopt,
                      const WriteProvenance& provenance = {});

    // Drops a dataset and clears any integrity block on it.
    bool remove(const SeriesKey& key);

    bool is_blocked(const SeriesKey& key) const;
    const OpenReport& open_report() const { return open_report_; }
    const std::string& path() const { return options_.path; }
    Segment segment() const { return segment_; }

private:
    void open();
    void quarantine(const std::string& reason);
    void backup_file();
    void prune_backups();
    void publish(std::shared_ptr<const StoreImage> image);
    std::shared_ptr<const StoreImage> snapshot() const;
    void block(const SeriesKey& key, const std::string& reason);

    StoreOptions options_;
    Segment segment_;
    OpenReport open_report_;

    mutable std::shared_mutex image_mutex_;
    std::shared_ptr<const StoreImage> image_;

    std::mutex write_mutex_;

    mutable std::mutex blocked_mutex_;
    std::set<std::string> blocked_;
};

// Owns one LocalStore per segment under a data directory.
class StoreRegistry {
public:
    StoreRegistry(const std::string& data_dir, const std::string& backup_dir,
                  int max_backups, int compression_level);

    std::shared_ptr<LocalStore> get(Segment segment);
    std::shared_ptr<LocalStore> get(const SeriesKey& key) { return get(key.segment); }
    std::map<Segment, std::shared_ptr<LocalStore>> opened() const;

    static std::string file_name(Segment segment);

private:
    std::string data_dir_;
    std::string backup_dir_;
    int max_backups_;
    int compression_level_;

    mutable std::mutex mutex_;
    std::map<Segment, std::shared_ptr<LocalStore>> stores_;
};
