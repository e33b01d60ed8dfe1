#pragma once

#include "target_store.hpp"
#include "retry.hpp"
#include <pqxx/pqxx>
#include <curl/curl.h>
#include <string>

// Buffers ILP lines and posts them to QuestDB's /write endpoint.
class IlpHttpWriter : public TargetWriter {
public:
    IlpHttpWriter(const std::string& http_url, const std::string& table, int timeout_ms,
                  RetryPolicy retry, std::size_t max_buffer_bytes = 4 * 1024 * 1024);
    ~IlpHttpWriter() override;

    IlpHttpWriter(const IlpHttpWriter&) = delete;
    IlpHttpWriter& operator=(const IlpHttpWriter&) = delete;

    void write(const std::vector<MigrationRecord>& records) override;
    void flush() override;

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    // Returns the HTTP status; throws TargetWriteError on transport failure.
    long post(const std::string& body, std::string& response);

    std::string url_;
    std::string table_;
    RetryPolicy retry_;
    std::size_t max_buffer_bytes_;
    std::string buffer_;
    CURL* curl_;
};

class QuestDbTarget : public TargetStore {
public:
    QuestDbTarget(const std::string& pg_dsn, const std::string& http_url,
                  const std::string& table, int timeout_ms, RetryPolicy retry);

    void ensure_schema() override;
    std::unique_ptr<TargetWriter> open_writer() override;
    int64_t count_rows(const SeriesKey& key) override;
    bool ping() override;

    static std::string create_table_sql(const std::string& table);

private:
    pqxx::connection make_connection();

    std::string pg_dsn_;
    std::string http_url_;
    std::string table_;
    int timeout_ms_;
    RetryPolicy retry_;
};
