#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string s(val);
    return s == "1" || s == "true" || s == "yes";
}

Config Config::from_env(const std::string& default_service) {
    Config cfg;

    cfg.data_dir = get_env("DATA_DIR", "data");
    cfg.backup_dir = get_env("BACKUP_DIR", cfg.data_dir + "/backups");
    cfg.max_backups = get_env_int("MAX_BACKUPS", 3);
    cfg.compression_level = get_env_int("COMPRESSION_LEVEL", 6);

    cfg.kite_base_url = get_env("KITE_BASE_URL", "https://api.kite.trade");
    cfg.kite_api_key = get_env("KITE_API_KEY");
    cfg.kite_access_token = get_env("KITE_ACCESS_TOKEN");
    cfg.instruments_file = get_env("INSTRUMENTS_FILE", cfg.data_dir + "/instruments.json");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 60000);

    // Kite allows 3 req/s on historical data
    cfg.rate_limit_rpm = get_env_int("RATE_LIMIT_RPM", 180);
    cfg.rate_limit_safety_rpm = get_env_int("RATE_LIMIT_SAFETY_RPM", 10);
    cfg.rate_limit_burst = get_env_int("RATE_LIMIT_BURST", 3);
    cfg.max_retries = get_env_int("MAX_RETRIES", 7);
    cfg.retry_base_delay_ms = get_env_int("RETRY_BASE_DELAY_MS", 2000);
    cfg.retry_multiplier = get_env_double("RETRY_MULTIPLIER", 1.3);
    cfg.retry_max_delay_ms = get_env_int("RETRY_MAX_DELAY_MS", 60000);
    cfg.fetch_workers = get_env_int("FETCH_WORKERS", 3);

    cfg.max_warn_ratio = get_env_double("MAX_WARN_RATIO", 0.5);

    cfg.sync_series = util::split(get_env("SYNC_SERIES"), ',');
    cfg.sync_from = get_env("SYNC_FROM", "2015-01-01");
    cfg.sync_to = get_env("SYNC_TO");
    cfg.sync_interval_seconds = get_env_int("SYNC_INTERVAL_SECONDS", 0);

    cfg.questdb_http_url = get_env("QUESTDB_HTTP_URL", "http://localhost:9000");
    cfg.questdb_pg_dsn = get_env("QUESTDB_PG_DSN",
                                 "host=localhost port=8812 user=admin password=quest dbname=qdb");
    cfg.questdb_table = get_env("QUESTDB_TABLE", "ohlcv");

    cfg.migration_sources = util::split(get_env("MIGRATION_SOURCES"), ',');
    cfg.migration_workers = get_env_int("MIGRATION_WORKERS", 4);
    cfg.migration_batch_size = get_env_int("MIGRATION_BATCH_SIZE", 25000);
    cfg.migration_checkpoint = get_env("MIGRATION_CHECKPOINT", cfg.data_dir + "/migration_checkpoint.json");
    cfg.migration_verify = get_env_bool("MIGRATION_VERIFY", true);
    cfg.migration_dry_run = get_env_bool("MIGRATION_DRY_RUN", false);

    cfg.redis_url = get_env("REDIS_URL");
    cfg.event_stream = get_env("EVENT_STREAM", "barvault.events");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", default_service);
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (data_dir.empty()) {
        throw std::runtime_error("DATA_DIR is required");
    }
    if (max_backups < 1) {
        throw std::runtime_error("MAX_BACKUPS must be at least 1");
    }
    if (compression_level < 0 || compression_level > 9) {
        throw std::runtime_error("COMPRESSION_LEVEL must be between 0 and 9");
    }
    if (rate_limit_rpm - rate_limit_safety_rpm <= 0) {
        throw std::runtime_error("RATE_LIMIT_SAFETY_RPM must be below RATE_LIMIT_RPM");
    }
    if (max_retries < 1 || retry_base_delay_ms < 0 || retry_multiplier < 1.0) {
        throw std::runtime_error("Invalid retry settings");
    }
    if (fetch_workers < 1 || migration_workers < 1) {
        throw std::runtime_error("Worker counts must be positive");
    }
    if (migration_batch_size < 1) {
        throw std::runtime_error("MIGRATION_BATCH_SIZE must be positive");
    }
    if (max_warn_ratio < 0.0 || max_warn_ratio > 1.0) {
        throw std::runtime_error("MAX_WARN_RATIO must be within [0, 1]");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Data dir: {} (backups: {}, keep {})", data_dir, backup_dir, max_backups);
    spdlog::info("  Rate limit: {} rpm - {} safety, burst {}",
                 rate_limit_rpm, rate_limit_safety_rpm, rate_limit_burst);
    spdlog::info("  Retries: {} attempts, base {}ms x{}", max_retries, retry_base_delay_ms,
                 retry_multiplier);
    spdlog::info("  Workers: fetch={}, migration={}", fetch_workers, migration_workers);
}

void Config::validate_upstream() const {
    if (kite_api_key.empty() || kite_access_token.empty()) {
        throw std::runtime_error("KITE_API_KEY and KITE_ACCESS_TOKEN are required");
    }
}
