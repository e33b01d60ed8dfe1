#include "config.hpp"
#include "local_store.hpp"
#include "kite_client.hpp"
#include "fetch_executor.hpp"
#include "sync_service.hpp"
#include "rate_limiter.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("barvault", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void publish_result(const std::shared_ptr<RedisBus>& redis, const Config& config,
                    const SyncResult& result) {
    if (redis) {
        redis->publish_event(config.event_stream, "sync", result.to_json());
    }
}

// Keeps the configured series up to date, once or every sync_interval_seconds.
void sync_loop(std::shared_ptr<Config> config,
               std::shared_ptr<SyncService> sync,
               std::shared_ptr<RedisBus> redis,
               std::shared_ptr<HealthCheck> health,
               std::shared_ptr<CancelToken> cancel) {

    spdlog::info("Starting sync loop for {} series", config->sync_series.size());

    while (!cancel->is_cancelled()) {
        auto pass_start = util::current_timestamp_ms();
        std::string to = config->sync_to.empty() ? util::today() : config->sync_to;

        for (const auto& entry : config->sync_series) {
            if (cancel->is_cancelled()) break;
            try {
                auto parts = util::split(entry, ':');
                if (parts.size() != 3) {
                    spdlog::error("Bad SYNC_SERIES entry '{}', expected EXCHANGE:SYMBOL:INTERVAL", entry);
                    continue;
                }
                auto key = SeriesKey::make(parts[0], parts[1], parts[2]);
                auto range = date_range(config->sync_from, to, key.interval);
                auto result = sync->sync_series(key, range.start, range.end, cancel.get());
                health->record_sync(key.to_string(), sync_status_name(result.status));
                publish_result(redis, *config, result);
            } catch (const std::exception& e) {
                spdlog::error("Sync of {} failed: {}", entry, e.what());
            }
        }

        if (config->sync_interval_seconds <= 0) break;

        auto elapsed = util::current_timestamp_ms() - pass_start;
        auto sleep_ms = config->sync_interval_seconds * 1000LL - elapsed;
        while (sleep_ms > 0 && !cancel->is_cancelled()) {
            auto step = std::min<int64_t>(sleep_ms, 1000);
            std::this_thread::sleep_for(std::chrono::milliseconds(step));
            sleep_ms -= step;
        }
    }

    spdlog::info("Sync loop stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env("ingestor"));
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("barvault Ingestor v1.0");
        spdlog::info("==============================================");

        config->validate();
        config->validate_upstream();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto stores = std::make_shared<StoreRegistry>(config->data_dir, config->backup_dir,
                                                      config->max_backups, config->compression_level);
        for (auto segment : schema::all_segments()) {
            stores->get(segment);
        }

        auto clock = std::make_shared<SteadyClock>();
        auto limiter = TokenBucketLimiter::per_minute(clock, config->rate_limit_rpm,
                                                      config->rate_limit_safety_rpm,
                                                      config->rate_limit_burst);
        auto instruments = InstrumentDirectory::load(config->instruments_file);
        auto kite = std::make_shared<KiteClient>(config->kite_base_url, config->kite_api_key,
                                                 config->kite_access_token, instruments,
                                                 config->request_timeout_ms);

        FetchSettings settings;
        settings.workers = static_cast<std::size_t>(config->fetch_workers);
        settings.retry.max_attempts = config->max_retries;
        settings.retry.base_delay = std::chrono::milliseconds(config->retry_base_delay_ms);
        settings.retry.multiplier = config->retry_multiplier;
        settings.retry.max_delay = std::chrono::milliseconds(config->retry_max_delay_ms);
        settings.max_warn_ratio = config->max_warn_ratio;

        auto executor = std::make_shared<FetchExecutor>(kite, limiter, clock, settings);
        auto sync = std::make_shared<SyncService>(stores, executor);

        std::shared_ptr<RedisBus> redis;
        if (!config->redis_url.empty()) {
            redis = std::make_shared<RedisBus>(config->redis_url);
        }
        auto health = std::make_shared<HealthCheck>(stores, limiter, redis);

        auto cancel = std::make_shared<CancelToken>();
        std::thread sync_thread;
        if (!config->sync_series.empty()) {
            sync_thread = std::thread(sync_loop, config, sync, redis, health, cancel);
        }

        // HTTP API
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = health->is_healthy() ? 200 : 503;
        });

        server.Get("/coverage", [sync](const httplib::Request& req, httplib::Response& res) {
            try {
                auto key = SeriesKey::make(req.get_param_value("exchange"),
                                           req.get_param_value("symbol"),
                                           req.get_param_value("interval"));
                nlohmann::json ranges = nlohmann::json::array();
                for (const auto& r : sync->get_coverage(key)) {
                    ranges.push_back({util::format_datetime(r.start), util::format_datetime(r.end)});
                }
                nlohmann::json body = {{"series", key.to_string()}, {"coverage", ranges}};
                res.set_content(body.dump(), "application/json");
            } catch (const std::invalid_argument& e) {
                res.status = 400;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("Coverage request failed: {}", e.what());
                res.status = 500;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            }
        });

        server.Post("/sync", [sync, redis, health, config, cancel](const httplib::Request& req,
                                                                  httplib::Response& res) {
            try {
                auto body = nlohmann::json::parse(req.body);
                auto key = SeriesKey::make(body.at("exchange").get<std::string>(),
                                           body.at("symbol").get<std::string>(),
                                           body.at("interval").get<std::string>());
                auto to = body.value("end", util::today());
                auto range = date_range(body.at("start").get<std::string>(), to, key.interval);

                auto result = sync->sync_series(key, range.start, range.end, cancel.get());
                health->record_sync(key.to_string(), sync_status_name(result.status));
                publish_result(redis, *config, result);

                res.set_content(result.to_json().dump(), "application/json");
                res.status = result.status == SyncStatus::Failed ? 502 : 200;
            } catch (const nlohmann::json::exception& e) {
                res.status = 400;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            } catch (const std::invalid_argument& e) {
                res.status = 400;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("Sync request failed: {}", e.what());
                res.status = 500;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            }
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Ingestor started");

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        cancel->cancel();
        server.stop();

        if (sync_thread.joinable()) sync_thread.join();
        if (http_thread.joinable()) http_thread.join();

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
