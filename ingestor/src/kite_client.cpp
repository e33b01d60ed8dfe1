#include "kite_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <memory>

InstrumentDirectory::InstrumentDirectory(std::map<std::string, int64_t> tokens)
    : tokens_(std::move(tokens)) {}

std::shared_ptr<InstrumentDirectory> InstrumentDirectory::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open instruments file " + path);
    }
    nlohmann::json j = nlohmann::json::parse(in);

    std::map<std::string, int64_t> tokens;
    for (const auto& [name, token] : j.items()) {
        tokens[util::to_upper(name)] = token.get<int64_t>();
    }
    spdlog::info("Loaded {} instruments from {}", tokens.size(), path);
    return std::make_shared<InstrumentDirectory>(std::move(tokens));
}

std::optional<int64_t> InstrumentDirectory::lookup(const std::string& exchange,
                                                   const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(util::to_upper(exchange) + ":" + util::to_upper(symbol));
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

std::size_t InstrumentDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

KiteClient::KiteClient(const std::string& base_url, const std::string& api_key,
                       const std::string& access_token,
                       std::shared_ptr<InstrumentDirectory> instruments,
                       int timeout_ms)
    : base_url_(base_url), api_key_(api_key), access_token_(access_token),
      instruments_(std::move(instruments)), timeout_ms_(timeout_ms) {}

size_t KiteClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string KiteClient::build_path(int64_t token, Interval interval, int64_t start, int64_t end,
                                   bool with_oi) {
    // Kite wants "yyyy-mm-dd hh:mm:ss" in the query.
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    auto encode = [&curl](const std::string& s) {
        char* escaped = curl_easy_escape(curl.get(), s.c_str(), static_cast<int>(s.length()));
        if (!escaped) {
            throw std::runtime_error("curl_easy_escape failed");
        }
        std::string out(escaped);
        curl_free(escaped);
        return out;
    };
    return "/instruments/historical/" + std::to_string(token) + "/" +
           schema::interval_name(interval) +
           "?from=" + encode(util::format_datetime(start)) +
           "&to=" + encode(util::format_datetime(end)) +
           (with_oi ? "&oi=1" : "");
}

void KiteClient::raise_for_status(long http_status, const std::string& body) {
    if (http_status == 200) return;

    std::string message = body.substr(0, 200);
    try {
        auto j = nlohmann::json::parse(body);
        message = j.value("error_type", "") + ": " + j.value("message", "");
    } catch (const nlohmann::json::exception&) {
        // Non-JSON error pages keep the raw prefix.
    }

    std::string text = "HTTP " + std::to_string(http_status) + " " + message;
    if (http_status == 429 || http_status >= 500) {
        throw TransientFetchError(text);
    }
    throw PermanentFetchError(text);
}

std::vector<RawBar> KiteClient::parse_candles(const nlohmann::json& body) {
    if (body.value("status", "") != "success") {
        throw TransientFetchError("Unexpected response status: " + body.value("status", "missing"));
    }

    const auto& candles = body.at("data").at("candles");
    std::vector<RawBar> rows;
    rows.reserve(candles.size());

    auto number = [](const nlohmann::json& row, std::size_t i) -> std::optional<double> {
        if (row.size() <= i || !row[i].is_number()) return std::nullopt;
        return row[i].get<double>();
    };
    auto integer = [](const nlohmann::json& row, std::size_t i) -> std::optional<int64_t> {
        if (row.size() <= i || !row[i].is_number()) return std::nullopt;
        return static_cast<int64_t>(row[i].get<double>());
    };

    for (const auto& row : candles) {
        RawBar bar;
        if (!row.empty() && row[0].is_string()) {
            try {
                bar.timestamp = util::parse_datetime(row[0].get<std::string>());
            } catch (const std::invalid_argument& e) {
                spdlog::warn("Skipping candle timestamp: {}", e.what());
            }
        }
        bar.open = number(row, 1);
        bar.high = number(row, 2);
        bar.low = number(row, 3);
        bar.close = number(row, 4);
        bar.volume = integer(row, 5);
        bar.open_interest = integer(row, 6);
        rows.push_back(bar);
    }
    return rows;
}

std::string KiteClient::perform(const std::string& url) {
    // One easy handle per request; fetches run on several workers.
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw TransientFetchError("Failed to initialize CURL");
    }

    std::string response;
    std::string auth = "Authorization: token " + api_key_ + ":" + access_token_;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "X-Kite-Version: 3");
    headers = curl_slist_append(headers, auth.c_str());

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw TransientFetchError(std::string("Kite request failed: ") + curl_easy_strerror(res));
    }
    raise_for_status(http_status, response);
    return response;
}

std::vector<RawBar> KiteClient::fetch_bars(const SeriesKey& key, int64_t start, int64_t end) {
    auto token = instruments_->lookup(key.exchange, key.symbol);
    if (!token) {
        throw PermanentFetchError("Unknown instrument " + key.exchange + ":" + key.symbol);
    }

    std::string url = base_url_ + build_path(*token, key.interval, start, end,
                                             schema::carries_open_interest(key.segment));
    spdlog::debug("GET {}", url);

    std::string body = perform(url);
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw TransientFetchError(std::string("Unparsable Kite response: ") + e.what());
    }

    try {
        return parse_candles(parsed);
    } catch (const nlohmann::json::exception& e) {
        throw TransientFetchError(std::string("Malformed Kite candles: ") + e.what());
    }
}
