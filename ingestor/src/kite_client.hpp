#pragma once

#include "bar_source.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// "NSE:RELIANCE" -> instrument token, loaded from a JSON object file.
class InstrumentDirectory {
public:
    InstrumentDirectory() = default;
    explicit InstrumentDirectory(std::map<std::string, int64_t> tokens);

    static std::shared_ptr<InstrumentDirectory> load(const std::string& path);

    std::optional<int64_t> lookup(const std::string& exchange, const std::string& symbol) const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> tokens_;
};

class KiteClient : public BarSource {
public:
    KiteClient(const std::string& base_url, const std::string& api_key,
               const std::string& access_token,
               std::shared_ptr<InstrumentDirectory> instruments,
               int timeout_ms);

    std::vector<RawBar> fetch_bars(const SeriesKey& key, int64_t start, int64_t end) override;

    static std::vector<RawBar> parse_candles(const nlohmann::json& body);
    // Throws the matching fetch error for a non-200 response.
    static void raise_for_status(long http_status, const std::string& body);
    static std::string build_path(int64_t token, Interval interval, int64_t start, int64_t end,
                                  bool with_oi);

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    std::string perform(const std::string& url);

    std::string base_url_;
    std::string api_key_;
    std::string access_token_;
    std::shared_ptr<InstrumentDirectory> instruments_;
    int timeout_ms_;
};
