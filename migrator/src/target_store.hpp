#pragma once

#include "migration_record.hpp"
#include "schema.hpp"
#include <memory>
#include <vector>

// A writer belongs to one migration worker for its whole lifetime.
class TargetWriter {
public:
    virtual ~TargetWriter() = default;
    virtual void write(const std::vector<MigrationRecord>& records) = 0;
    virtual void flush() = 0;
};

class TargetStore {
public:
    virtual ~TargetStore() = default;
    virtual void ensure_schema() = 0;
    virtual std::unique_ptr<TargetWriter> open_writer() = 0;
    virtual int64_t count_rows(const SeriesKey& key) = 0;
    virtual bool ping() = 0;
};
