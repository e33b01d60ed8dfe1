#include "config.hpp"
#include "migration_pipeline.hpp"
#include "questdb_target.hpp"
#include "local_store.hpp"
#include "redis_bus.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <algorithm>

namespace fs = std::filesystem;

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

std::vector<std::string> discover_sources(const Config& config) {
    if (!config.migration_sources.empty()) {
        return config.migration_sources;
    }

    std::vector<std::string> sources;
    if (!fs::exists(config.data_dir)) {
        return sources;
    }
    for (const auto& entry : fs::directory_iterator(config.data_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".bvs") {
            sources.push_back(entry.path().string());
        }
    }
    std::sort(sources.begin(), sources.end());
    return sources;
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env("migrator");
        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("barvault Migrator v1.0");
        spdlog::info("==============================================");

        config.validate();
        curl_global_init(CURL_GLOBAL_DEFAULT);

        RetryPolicy retry;
        retry.max_attempts = config.max_retries;
        retry.base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
        retry.multiplier = config.retry_multiplier;
        retry.max_delay = std::chrono::milliseconds(config.retry_max_delay_ms);

        auto target = std::make_shared<QuestDbTarget>(config.questdb_pg_dsn, config.questdb_http_url,
                                                      config.questdb_table, config.request_timeout_ms,
                                                      retry);

        MigrationConfig migration;
        migration.sources = discover_sources(config);
        migration.worker_count = static_cast<std::size_t>(config.migration_workers);
        migration.batch_size = static_cast<std::size_t>(config.migration_batch_size);
        migration.checkpoint_path = config.migration_checkpoint;
        migration.verify = config.migration_verify;
        migration.dry_run = config.migration_dry_run;

        if (migration.sources.empty()) {
            spdlog::warn("No store files found in {}", config.data_dir);
        }
        for (const auto& source : migration.sources) {
            spdlog::info("  Source: {}", source);
        }

        if (!migration.dry_run) {
            target->ensure_schema();
        }

        MigrationPipeline pipeline(target);
        auto summary = pipeline.migrate(migration);

        if (!config.redis_url.empty()) {
            RedisBus redis(config.redis_url);
            redis.publish_event(config.event_stream, "migration", summary.to_json());
        }

        curl_global_cleanup();

        switch (summary.status()) {
            case MigrationStatus::Complete: return 0;
            case MigrationStatus::Partial: return 2;
            case MigrationStatus::Failed: return 1;
        }
        return 1;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
