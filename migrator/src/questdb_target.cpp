#include "questdb_target.hpp"
#include "ilp.hpp"
#include "clock.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

IlpHttpWriter::IlpHttpWriter(const std::string& http_url, const std::string& table, int timeout_ms,
                             RetryPolicy retry, std::size_t max_buffer_bytes)
    : url_(http_url + "/write"), table_(table), retry_(retry),
      max_buffer_bytes_(max_buffer_bytes), curl_(curl_easy_init()) {
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
}

IlpHttpWriter::~IlpHttpWriter() {
    if (!buffer_.empty()) {
        spdlog::warn("ILP writer dropped {} unflushed bytes", buffer_.size());
    }
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t IlpHttpWriter::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

void IlpHttpWriter::write(const std::vector<MigrationRecord>& records) {
    buffer_ += ilp::format_lines(table_, records);
    if (buffer_.size() >= max_buffer_bytes_) {
        flush();
    }
}

long IlpHttpWriter::post(const std::string& body, std::string& response) {
    response.clear();
    curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        throw TargetWriteError(std::string("ILP request failed: ") + curl_easy_strerror(res));
    }
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    return status;
}

void IlpHttpWriter::flush() {
    if (buffer_.empty()) return;

    SteadyClock clock;
    RetryMachine machine(retry_);
    std::string response;

    while (!machine.finished()) {
        if (machine.state() == RetryState::Waiting) {
            spdlog::warn("ILP write attempt {} failed: {} (retrying in {} ms)",
                         machine.attempts(), machine.last_error(), machine.pending_delay().count());
            clock.sleep_for(machine.pending_delay());
            machine.resume();
            continue;
        }

        machine.begin_attempt();
        try {
            long status = post(buffer_, response);
            if (status == 200 || status == 204) {
                machine.on_success();
            } else if (status >= 500 || status == 429) {
                machine.on_transient_failure(fmt::format("HTTP {} {}", status, response.substr(0, 200)));
            } else {
                machine.on_permanent_failure(fmt::format("HTTP {} {}", status, response.substr(0, 200)));
            }
        } catch (const TargetWriteError& e) {
            machine.on_transient_failure(e.what());
        }
    }

    if (machine.state() != RetryState::Succeeded) {
        buffer_.clear();
        throw TargetWriteError("ILP write to " + table_ + " failed after " +
                               std::to_string(machine.attempts()) + " attempt(s): " + machine.last_error());
    }

    spdlog::debug("Flushed {} bytes of ILP to {}", buffer_.size(), table_);
    buffer_.clear();
}

QuestDbTarget::QuestDbTarget(const std::string& pg_dsn, const std::string& http_url,
                             const std::string& table, int timeout_ms, RetryPolicy retry)
    : pg_dsn_(pg_dsn), http_url_(http_url), table_(table),
      timeout_ms_(timeout_ms), retry_(retry) {
    bool valid = !table_.empty() && std::all_of(table_.begin(), table_.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
    if (!valid) {
        throw std::invalid_argument("Invalid QuestDB table name: " + table_);
    }
}

pqxx::connection QuestDbTarget::make_connection() {
    return pqxx::connection(pg_dsn_);
}

std::string QuestDbTarget::create_table_sql(const std::string& table) {
    return fmt::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "timestamp TIMESTAMP, "
        "exchange SYMBOL, "
        "symbol SYMBOL, "
        "\"interval\" SYMBOL, "
        "segment SYMBOL, "
        "data_source SYMBOL, "
        "open DOUBLE, high DOUBLE, low DOUBLE, close DOUBLE, "
        "volume LONG, "
        "oi LONG"
        ") TIMESTAMP(timestamp) PARTITION BY MONTH WAL "
        "DEDUP UPSERT KEYS(timestamp, exchange, symbol, \"interval\")",
        table);
}

void QuestDbTarget::ensure_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec(create_table_sql(table_));
        txn.commit();
        spdlog::info("QuestDB table {} ready", table_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create QuestDB table {}: {}", table_, e.what());
        throw;
    }
}

std::unique_ptr<TargetWriter> QuestDbTarget::open_writer() {
    return std::make_unique<IlpHttpWriter>(http_url_, table_, timeout_ms_, retry_);
}

int64_t QuestDbTarget::count_rows(const SeriesKey& key) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            fmt::format("SELECT count() FROM {} WHERE exchange = $1 AND symbol = $2 AND \"interval\" = $3",
                        table_),
            key.exchange, key.symbol, schema::interval_name(key.interval));
        txn.commit();
        return result.empty() ? 0 : result[0][0].as<int64_t>();
    } catch (const std::exception& e) {
        spdlog::error("Failed to count rows for {}: {}", key.to_string(), e.what());
        throw;
    }
}

bool QuestDbTarget::ping() {
    try {
        auto conn = make_connection();
        pqxx::nontransaction txn(conn);
        txn.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("QuestDB ping failed: {}", e.what());
        return false;
    }
}
