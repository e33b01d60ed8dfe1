#pragma once

#include <map>
#include <mutex>
#include <string>

// Remembers which datasets a migration already delivered, keyed by
// "<source file>|<dataset path>" and pinned to the dataset checksum.
class MigrationCheckpoint {
public:
    explicit MigrationCheckpoint(std::string path);

    bool is_done(const std::string& dataset_id, const std::string& checksum) const;
    void mark_done(const std::string& dataset_id, const std::string& checksum);
    std::size_t size() const;

private:
    void load();
    void save() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> completed_;
};
