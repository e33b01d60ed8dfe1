#include "local_store.hpp"
#include "record_layout.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open store file " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void fsync_dir(const std::string& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0 || ::fsync(fd) != 0) {
        spdlog::warn("Could not fsync directory {}", dir);
    }
    if (fd >= 0) ::close(fd);
}

// Writes to a temp file, fsyncs it, then renames over the target.
void write_atomic(const std::string& path, const std::string& bytes) {
    std::string tmp = path + ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot create " + tmp);
    }
    std::size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            ::close(fd);
            throw std::runtime_error("Write failed for " + tmp);
        }
        written += static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        throw std::runtime_error("fsync failed for " + tmp);
    }
    ::close(fd);

    fs::rename(tmp, path);

    auto dir = fs::path(path).parent_path();
    fsync_dir(dir.empty() ? "." : dir.string());
}

std::shared_ptr<StoreImage> empty_image(Segment segment) {
    auto image = std::make_shared<StoreImage>();
    image->segment = segment;
    image->created_at = util::current_iso8601();
    image->updated_at = image->created_at;
    return image;
}

} // namespace

LocalStore::LocalStore(StoreOptions options, Segment segment)
    : options_(std::move(options)), segment_(segment) {
    open();
}

std::shared_ptr<LocalStore> LocalStore::open_source(const std::string& path) {
    StoreOptions options;
    options.path = path;
    options.read_only = true;
    auto segment = store_format::peek_segment(read_file(path));
    return std::make_shared<LocalStore>(options, segment);
}

void LocalStore::open() {
    const auto& path = options_.path;

    if (!fs::exists(path)) {
        if (options_.read_only) {
            throw std::runtime_error("Store file not found: " + path);
        }
        auto dir = fs::path(path).parent_path();
        if (!dir.empty()) fs::create_directories(dir);
        publish(empty_image(segment_));
        open_report_.created = true;
        spdlog::info("Created store {}", path);
        return;
    }

    std::string bytes = read_file(path);

    uint32_t version = 0;
    try {
        version = store_format::peek_version(bytes);
    } catch (const StorageIntegrityError& e) {
        if (options_.read_only) throw;
        quarantine(e.what());
        return;
    }

    if (version > store_format::kCurrentVersion) {
        throw StoreVersionError("Store " + path + " has version " + std::to_string(version) +
                                ", newest supported is " + std::to_string(store_format::kCurrentVersion));
    }

    bool migrated = false;
    if (version < store_format::kCurrentVersion) {
        if (!options_.read_only) {
            backup_file();
        }
        bytes = store_format::upgrade(bytes);
        open_report_.migrated_from = version;
        migrated = true;
    }

    StoreImage image;
    try {
        image = store_format::decode(bytes);
        if (image.segment != segment_) {
            throw StorageIntegrityError("Store holds segment " + schema::segment_name(image.segment) +
                                        ", expected " + schema::segment_name(segment_));
        }
    } catch (const StorageIntegrityError& e) {
        if (options_.read_only) throw;
        quarantine(e.what());
        return;
    }

    if (migrated && !options_.read_only) {
        write_atomic(path, bytes);
        spdlog::info("Upgraded store {} from v{} to v{}", path, version, store_format::kCurrentVersion);
    }

    std::unique_lock<std::shared_mutex> lock(image_mutex_);
    image_ = std::make_shared<const StoreImage>(std::move(image));
    spdlog::info("Opened store {} with {} datasets", path, image_->datasets.size());
}

void LocalStore::quarantine(const std::string& reason) {
    std::string target = options_.path + ".corrupt-" + std::to_string(util::current_timestamp_ms());
    spdlog::error("Store {} failed verification ({}), moving it to {}", options_.path, reason, target);
    fs::rename(options_.path, target);
    open_report_.quarantined_to = target;
    publish(empty_image(segment_));
}

void LocalStore::backup_file() {
    fs::path backup_dir = options_.backup_dir.empty()
        ? fs::path(options_.path).parent_path() / "backups"
        : fs::path(options_.backup_dir);
    fs::create_directories(backup_dir);

    auto name = fs::path(options_.path).filename().string();
    auto target = backup_dir / (name + "." + std::to_string(util::current_timestamp_ms()) + ".bak");
    fs::copy_file(options_.path, target, fs::copy_options::overwrite_existing);
    open_report_.backup_path = target.string();
    spdlog::info("Backed up {} to {}", options_.path, target.string());

    prune_backups();
}

void LocalStore::prune_backups() {
    fs::path backup_dir = fs::path(open_report_.backup_path).parent_path();
    auto prefix = fs::path(options_.path).filename().string() + ".";

    std::vector<fs::path> backups;
    for (const auto& entry : fs::directory_iterator(backup_dir)) {
        auto name = entry.path().filename().string();
        if (name.rfind(prefix, 0) == 0 && entry.path().extension() == ".bak") {
            backups.push_back(entry.path());
        }
    }

    if (static_cast<int>(backups.size()) <= options_.max_backups) return;

    // Names embed the creation time in ms, so lexical order is age order
    // for timestamps of equal width.
    std::sort(backups.begin(), backups.end());
    std::size_t excess = backups.size() - static_cast<std::size_t>(options_.max_backups);
    for (std::size_t i = 0; i < excess; ++i) {
        spdlog::info("Removing old backup {}", backups[i].string());
        fs::remove(backups[i]);
    }
}

void LocalStore::publish(std::shared_ptr<const StoreImage> image) {
    std::string bytes = store_format::encode(*image);
    // Re-read what we are about to persist; a bad encode never reaches disk.
    store_format::decode(bytes);
    write_atomic(options_.path, bytes);

    std::unique_lock<std::shared_mutex> lock(image_mutex_);
    image_ = std::move(image);
}

std::shared_ptr<const StoreImage> LocalStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(image_mutex_);
    return image_;
}

void LocalStore::block(const SeriesKey& key, const std::string& reason) {
    spdlog::error("Blocking writes to {}: {}", key.dataset_path(), reason);
    std::lock_guard<std::mutex> lock(blocked_mutex_);
    blocked_.insert(key.dataset_path());
}

bool LocalStore::is_blocked(const SeriesKey& key) const {
    std::lock_guard<std::mutex> lock(blocked_mutex_);
    return blocked_.count(key.dataset_path()) > 0;
}

std::optional<Dataset> LocalStore::read(const SeriesKey& key) {
    auto snap = snapshot();
    auto it = snap->datasets.find(key.dataset_path());
    if (it == snap->datasets.end()) {
        return std::nullopt;
    }

    std::string raw;
    try {
        raw = store_format::unpack_records(it->second);
    } catch (const StorageIntegrityError& e) {
        block(key, e.what());
        throw;
    }

    Dataset dataset;
    dataset.meta = it->second.meta;
    dataset.bars = layout::decode(layout::for_segment(segment_), raw);
    return dataset;
}

std::optional<DatasetMeta> LocalStore::metadata(const SeriesKey& key) const {
    auto snap = snapshot();
    auto it = snap->datasets.find(key.dataset_path());
    if (it == snap->datasets.end()) {
        return std::nullopt;
    }
    return it->second.meta;
}

std::vector<CoverageRange> LocalStore::coverage(const SeriesKey& key) const {
    auto meta = metadata(key);
    if (!meta) return {};
    return meta->coverage;
}

std::vector<DatasetMeta> LocalStore::list_datasets() const {
    auto snap = snapshot();
    std::vector<DatasetMeta> out;
    for (const auto& [_, entry] : snap->datasets) {
        out.push_back(entry.meta);
    }
    return out;
}

DatasetMeta LocalStore::write(const SeriesKey& key, const std::vector<Bar>& bars, WriteMode mode,
                              std::optional<CoverageRange> covered,
                              const WriteProvenance& provenance) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    const auto path = key.dataset_path();
    if (options_.read_only) {
        throw StoreWriteError("Store " + options_.path + " is read-only");
    }
    if (key.segment != segment_) {
        throw StoreWriteError(key.to_string() + " does not belong to segment " +
                              schema::segment_name(segment_));
    }
    if (is_blocked(key)) {
        throw StorageIntegrityError("Dataset " + path + " is blocked after an integrity failure");
    }

    for (std::size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) {
            throw StoreWriteError("Bars for " + path + " are not strictly increasing at " +
                                  util::format_datetime(bars[i].timestamp));
        }
    }

    if (!covered) {
        if (bars.empty()) {
            throw StoreWriteError("Empty write to " + path + " without a coverage range");
        }
        covered = CoverageRange{bars.front().timestamp, bars.back().timestamp};
    }
    if (covered->start > covered->end) {
        throw StoreWriteError("Inverted coverage range for " + path);
    }
    if (!bars.empty() && (bars.front().timestamp < covered->start || bars.back().timestamp > covered->end)) {
        throw StoreWriteError("Bars for " + path + " fall outside " + coverage::describe({*covered}));
    }

    const auto record_layout = layout::for_segment(segment_);
    const auto unit = schema::unit_seconds(key.interval);
    auto snap = snapshot();
    auto existing = snap->datasets.find(path);

    std::vector<Bar> merged;
    std::vector<CoverageRange> ranges;
    std::vector<ProvenanceEntry> history;

    if (mode == WriteMode::Append && existing != snap->datasets.end()) {
        std::vector<Bar> current;
        try {
            coverage::check_consistent(existing->second.meta.coverage);
            current = layout::decode(record_layout, store_format::unpack_records(existing->second));
        } catch (const StorageIntegrityError& e) {
            block(key, e.what());
            throw;
        }

        for (const auto& r : existing->second.meta.coverage) {
            if (coverage::overlaps(r, *covered)) {
                throw StoreWriteError("Append to " + path + " overlaps existing coverage " +
                                      coverage::describe({r}));
            }
        }

        merged.reserve(current.size() + bars.size());
        std::merge(current.begin(), current.end(), bars.begin(), bars.end(),
                   std::back_inserter(merged),
                   [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });
        for (std::size_t i = 1; i < merged.size(); ++i) {
            if (merged[i].timestamp == merged[i - 1].timestamp) {
                throw StoreWriteError("Duplicate timestamp " + util::format_datetime(merged[i].timestamp) +
                                      " in " + path);
            }
        }

        ranges = coverage::add(existing->second.meta.coverage, *covered, unit);
        history = existing->second.meta.provenance;
    } else {
        merged = bars;
        ranges = {*covered};
    }

    if (provenance.verdict != "pass" || !provenance.messages.empty()) {
        history.push_back({util::current_iso8601(), *covered, provenance.verdict, provenance.messages});
        if (history.size() > store_format::kMaxProvenance) {
            history.erase(history.begin(),
                          history.begin() + (history.size() - store_format::kMaxProvenance));
        }
    }

    std::string raw = layout::encode(record_layout, merged);

    DatasetMeta meta;
    meta.key = key;
    meta.earliest = merged.empty() ? 0 : merged.front().timestamp;
    meta.latest = merged.empty() ? 0 : merged.back().timestamp;
    meta.row_count = merged.size();
    meta.updated_at = util::current_iso8601();
    meta.schema_version = layout::kSchemaVersion;
    meta.checksum = codec::sha256_hex(raw);
    meta.source = provenance.source;
    meta.coverage = ranges;
    meta.block_rows = schema::traits(key.interval).block_rows;
    meta.provenance = std::move(history);

    DatasetEntry entry;
    entry.meta = meta;
    entry.blob = std::make_shared<const std::string>(store_format::pack_records(
        raw, static_cast<uint32_t>(layout::record_size(record_layout)), meta.block_rows,
        options_.compression_level));

    auto next = std::make_shared<StoreImage>(*snap);
    next->datasets[path] = std::move(entry);
    next->updated_at = meta.updated_at;
    publish(std::move(next));

    spdlog::debug("Wrote {} rows to {} (total {}, coverage {})",
                  bars.size(), path, meta.row_count, coverage::describe(meta.coverage));
    return meta;
}

bool LocalStore::remove(const SeriesKey& key) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (options_.read_only) {
        throw StoreWriteError("Store " + options_.path + " is read-only");
    }

    auto snap = snapshot();
    bool existed = snap->datasets.count(key.dataset_path()) > 0;
    if (existed) {
        auto next = std::make_shared<StoreImage>(*snap);
        next->datasets.erase(key.dataset_path());
        next->updated_at = util::current_iso8601();
        publish(std::move(next));
        spdlog::warn("Removed dataset {} from {}", key.dataset_path(), options_.path);
    }

    std::lock_guard<std::mutex> block_lock(blocked_mutex_);
    blocked_.erase(key.dataset_path());
    return existed;
}

StoreRegistry::StoreRegistry(const std::string& data_dir, const std::string& backup_dir,
                             int max_backups, int compression_level)
    : data_dir_(data_dir), backup_dir_(backup_dir),
      max_backups_(max_backups), compression_level_(compression_level) {}

std::string StoreRegistry::file_name(Segment segment) {
    return schema::segment_name(segment) + ".bvs";
}

std::shared_ptr<LocalStore> StoreRegistry::get(Segment segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(segment);
    if (it != stores_.end()) {
        return it->second;
    }

    StoreOptions options;
    options.path = (fs::path(data_dir_) / file_name(segment)).string();
    options.backup_dir = backup_dir_;
    options.max_backups = max_backups_;
    options.compression_level = compression_level_;

    auto store = std::make_shared<LocalStore>(options, segment);
    stores_[segment] = store;
    return store;
}

std::map<Segment, std::shared_ptr<LocalStore>> StoreRegistry::opened() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_;
}
