#include "store_format.hpp"
#include "record_layout.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <cctype>

namespace store_format {

namespace {

struct Header {
    uint32_t version;
    uint32_t manifest_crc;
    uint64_t manifest_len;
};

Header read_header(const std::string& bytes) {
    if (bytes.size() < kHeaderSize) {
        throw StorageIntegrityError("File shorter than header (" + std::to_string(bytes.size()) + " bytes)");
    }
    if (std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
        throw StorageIntegrityError("Bad magic");
    }
    Header h;
    h.version = util::get_u32(bytes.data() + 4);
    h.manifest_crc = util::get_u32(bytes.data() + 8);
    h.manifest_len = util::get_u64(bytes.data() + 12);
    if (kHeaderSize + h.manifest_len > bytes.size()) {
        throw StorageIntegrityError("Manifest length exceeds file size");
    }
    return h;
}

nlohmann::json read_manifest(const std::string& bytes, const Header& h) {
    std::string manifest = bytes.substr(kHeaderSize, h.manifest_len);
    if (codec::crc32(manifest) != h.manifest_crc) {
        throw StorageIntegrityError("Manifest CRC mismatch");
    }
    try {
        return nlohmann::json::parse(manifest);
    } catch (const nlohmann::json::exception& e) {
        throw StorageIntegrityError(std::string("Unparsable manifest: ") + e.what());
    }
}

std::string write_file(uint32_t version, const nlohmann::json& manifest, const std::string& blobs) {
    std::string text = manifest.dump();
    std::string out(kMagic, sizeof(kMagic));
    util::put_u32(out, version);
    util::put_u32(out, codec::crc32(text));
    util::put_u64(out, text.size());
    out += text;
    out += blobs;
    return out;
}

std::shared_ptr<const std::string> slice_blob(const std::string& bytes, uint64_t blob_base,
                                              const nlohmann::json& entry, const std::string& path) {
    uint64_t offset = entry.at("blob_offset").get<uint64_t>();
    uint64_t length = entry.at("blob_length").get<uint64_t>();
    if (blob_base + offset + length > bytes.size()) {
        throw StorageIntegrityError("Blob for " + path + " out of bounds");
    }
    return std::make_shared<const std::string>(bytes.substr(blob_base + offset, length));
}

// v1 files keep each dataset as one zlib stream and carry no coverage list,
// block size or provenance. Coverage is taken to be [start_ts, end_ts].
std::string upgrade_v1_to_v2(const std::string& bytes) {
    auto h = read_header(bytes);
    auto manifest = read_manifest(bytes, h);

    auto segment = schema::parse_segment(manifest.at("segment").get<std::string>());
    if (!segment) {
        throw StoreMigrationError("Unknown segment in v1 manifest");
    }

    StoreImage image;
    image.segment = *segment;
    image.created_at = manifest.value("created_at", util::current_iso8601());
    image.updated_at = manifest.value("last_updated", image.created_at);

    auto record_size = static_cast<uint32_t>(layout::record_size(layout::for_segment(*segment)));
    uint64_t blob_base = kHeaderSize + h.manifest_len;

    for (const auto& [path, entry] : manifest.at("datasets").items()) {
        auto blob = slice_blob(bytes, blob_base, entry, path);
        std::string raw = codec::inflate_stream(*blob);

        DatasetMeta meta;
        meta.key = SeriesKey::from_dataset_path(*segment, path);
        meta.earliest = entry.at("start_ts").get<int64_t>();
        meta.latest = entry.at("end_ts").get<int64_t>();
        meta.row_count = entry.at("row_count").get<uint64_t>();
        meta.updated_at = entry.value("updated_at", image.updated_at);
        meta.schema_version = layout::kSchemaVersion;
        meta.checksum = entry.at("checksum").get<std::string>();
        meta.source = entry.value("source", "unknown");
        meta.block_rows = schema::traits(meta.key.interval).block_rows;
        if (meta.row_count > 0) {
            meta.coverage.push_back({meta.earliest, meta.latest});
        }

        if (raw.size() != meta.row_count * record_size) {
            throw StoreMigrationError("Row count mismatch in v1 dataset " + path);
        }
        if (codec::sha256_hex(raw) != meta.checksum) {
            throw StoreMigrationError("Checksum mismatch in v1 dataset " + path);
        }

        DatasetEntry de;
        de.meta = meta;
        de.blob = std::make_shared<const std::string>(
            pack_records(raw, record_size, meta.block_rows, 6));
        image.datasets.emplace(path, std::move(de));
    }

    return encode(image);
}

} // namespace

uint32_t peek_version(const std::string& bytes) {
    return read_header(bytes).version;
}

Segment peek_segment(const std::string& bytes) {
    auto h = read_header(bytes);
    auto manifest = read_manifest(bytes, h);
    auto segment = schema::parse_segment(manifest.value("segment", ""));
    if (!segment) {
        throw StorageIntegrityError("Manifest names no known segment");
    }
    return *segment;
}

nlohmann::json meta_to_json(const DatasetMeta& meta) {
    nlohmann::json provenance = nlohmann::json::array();
    for (const auto& p : meta.provenance) {
        provenance.push_back({
            {"committed_at", p.committed_at},
            {"range", p.range},
            {"verdict", p.verdict},
            {"messages", p.messages}
        });
    }

    return {
        {"earliest", meta.earliest},
        {"latest", meta.latest},
        {"row_count", meta.row_count},
        {"updated_at", meta.updated_at},
        {"schema_version", meta.schema_version},
        {"checksum", meta.checksum},
        {"source", meta.source},
        {"coverage", meta.coverage},
        {"block_rows", meta.block_rows},
        {"provenance", provenance}
    };
}

DatasetMeta meta_from_json(Segment segment, const std::string& path, const nlohmann::json& j) {
    DatasetMeta meta;
    meta.key = SeriesKey::from_dataset_path(segment, path);
    meta.earliest = j.at("earliest").get<int64_t>();
    meta.latest = j.at("latest").get<int64_t>();
    meta.row_count = j.at("row_count").get<uint64_t>();
    meta.updated_at = j.at("updated_at").get<std::string>();
    meta.schema_version = j.at("schema_version").get<int>();
    meta.checksum = j.at("checksum").get<std::string>();
    meta.source = j.at("source").get<std::string>();
    meta.coverage = j.at("coverage").get<std::vector<CoverageRange>>();
    meta.block_rows = j.at("block_rows").get<uint32_t>();
    for (const auto& p : j.at("provenance")) {
        ProvenanceEntry entry;
        entry.committed_at = p.at("committed_at").get<std::string>();
        entry.range = p.at("range").get<CoverageRange>();
        entry.verdict = p.at("verdict").get<std::string>();
        entry.messages = p.at("messages").get<std::vector<std::string>>();
        meta.provenance.push_back(std::move(entry));
    }
    return meta;
}

std::string pack_records(const std::string& raw, uint32_t record_size,
                         uint32_t block_rows, int level) {
    return codec::encode_blocks(raw, static_cast<std::size_t>(record_size) * block_rows, level);
}

std::string unpack_records(const DatasetEntry& entry) {
    const auto& meta = entry.meta;
    if (!entry.blob) {
        throw StorageIntegrityError("Dataset " + meta.key.dataset_path() + " has no data");
    }
    auto record_size = layout::record_size(layout::for_segment(meta.key.segment));
    if (meta.block_rows == 0) {
        throw StorageIntegrityError("Dataset " + meta.key.dataset_path() + " has zero block size");
    }
    std::string raw = codec::decode_blocks(*entry.blob, record_size * meta.block_rows,
                                           meta.row_count * record_size);
    if (raw.size() != meta.row_count * record_size) {
        throw StorageIntegrityError("Dataset " + meta.key.dataset_path() + " holds " +
                                    std::to_string(raw.size() / record_size) + " rows, metadata says " +
                                    std::to_string(meta.row_count));
    }
    if (codec::sha256_hex(raw) != meta.checksum) {
        throw StorageIntegrityError("Checksum mismatch for " + meta.key.dataset_path());
    }
    return raw;
}

std::string encode(const StoreImage& image) {
    nlohmann::json datasets = nlohmann::json::object();
    std::string blobs;

    for (const auto& [path, entry] : image.datasets) {
        auto j = meta_to_json(entry.meta);
        j["blob_offset"] = blobs.size();
        j["blob_length"] = entry.blob ? entry.blob->size() : 0;
        if (entry.blob) blobs += *entry.blob;
        datasets[path] = j;
    }

    auto seg = schema::segment_name(image.segment);
    std::string lower = seg;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    nlohmann::json manifest = {
        {"format", "barvault_" + lower + "_v" + std::to_string(kCurrentVersion)},
        {"segment", seg},
        {"created_at", image.created_at},
        {"updated_at", image.updated_at},
        {"datasets", datasets}
    };

    return write_file(kCurrentVersion, manifest, blobs);
}

StoreImage decode(const std::string& bytes) {
    auto h = read_header(bytes);
    if (h.version != kCurrentVersion) {
        throw StoreVersionError("Expected store version " + std::to_string(kCurrentVersion) +
                                ", found " + std::to_string(h.version));
    }
    auto manifest = read_manifest(bytes, h);
    uint64_t blob_base = kHeaderSize + h.manifest_len;

    StoreImage image;
    try {
        auto segment = schema::parse_segment(manifest.at("segment").get<std::string>());
        if (!segment) {
            throw StorageIntegrityError("Unknown segment in manifest");
        }
        image.segment = *segment;
        image.created_at = manifest.at("created_at").get<std::string>();
        image.updated_at = manifest.at("updated_at").get<std::string>();

        for (const auto& [path, j] : manifest.at("datasets").items()) {
            DatasetEntry entry;
            entry.meta = meta_from_json(image.segment, path, j);
            entry.blob = slice_blob(bytes, blob_base, j, path);
            coverage::check_consistent(entry.meta.coverage);
            unpack_records(entry);
            image.datasets.emplace(path, std::move(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw StorageIntegrityError(std::string("Malformed manifest: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw StorageIntegrityError(std::string("Malformed manifest: ") + e.what());
    }

    return image;
}

const std::vector<StoreMigrationStep>& migration_steps() {
    static const std::vector<StoreMigrationStep> steps = {
        {1, 2, "single-stream blobs to blocked blobs with coverage", upgrade_v1_to_v2},
    };
    return steps;
}

std::string upgrade(const std::string& bytes, const std::vector<StoreMigrationStep>& steps) {
    uint32_t version = peek_version(bytes);
    if (version > kCurrentVersion) {
        throw StoreVersionError("Store version " + std::to_string(version) +
                                " is newer than supported version " + std::to_string(kCurrentVersion));
    }

    std::string current = bytes;
    while (version < kCurrentVersion) {
        auto it = std::find_if(steps.begin(), steps.end(),
                               [version](const StoreMigrationStep& s) { return s.from == version; });
        if (it == steps.end()) {
            throw StoreMigrationError("No migration step from version " + std::to_string(version));
        }

        spdlog::info("Applying store migration v{} -> v{}: {}", it->from, it->to, it->name);
        try {
            current = it->apply(current);
        } catch (const StoreMigrationError&) {
            throw;
        } catch (const std::exception& e) {
            throw StoreMigrationError("Migration v" + std::to_string(it->from) + " -> v" +
                                      std::to_string(it->to) + " failed: " + e.what());
        }

        uint32_t stamped = peek_version(current);
        if (stamped != it->to) {
            throw StoreMigrationError("Migration v" + std::to_string(it->from) + " produced version " +
                                      std::to_string(stamped));
        }
        version = stamped;
    }
    return current;
}

} // namespace store_format
