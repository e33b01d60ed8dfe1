#include "checkpoint.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

MigrationCheckpoint::MigrationCheckpoint(std::string path) : path_(std::move(path)) {
    load();
}

void MigrationCheckpoint::load() {
    if (!fs::exists(path_)) {
        return;
    }

    std::ifstream in(path_);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
        completed_ = j.at("completed").get<std::map<std::string, std::string>>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring unreadable checkpoint {}: {}", path_, e.what());
        completed_.clear();
        return;
    }
    spdlog::info("Loaded checkpoint {} with {} completed datasets", path_, completed_.size());
}

void MigrationCheckpoint::save() const {
    nlohmann::json j = {
        {"updated_at", util::current_iso8601()},
        {"completed", completed_}
    };

    auto dir = fs::path(path_).parent_path();
    if (!dir.empty()) fs::create_directories(dir);

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << j.dump(2);
        if (!out) {
            throw std::runtime_error("Failed to write checkpoint " + tmp);
        }
    }
    fs::rename(tmp, path_);
}

bool MigrationCheckpoint::is_done(const std::string& dataset_id, const std::string& checksum) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = completed_.find(dataset_id);
    return it != completed_.end() && it->second == checksum;
}

void MigrationCheckpoint::mark_done(const std::string& dataset_id, const std::string& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    completed_[dataset_id] = checksum;
    save();
}

std::size_t MigrationCheckpoint::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.size();
}
