#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Local store
    std::string data_dir;
    std::string backup_dir;
    int max_backups;
    int compression_level;

    // Upstream (Kite)
    std::string kite_base_url;
    std::string kite_api_key;
    std::string kite_access_token;
    std::string instruments_file;
    int request_timeout_ms;

    // Rate limiting and retries
    int rate_limit_rpm;
    int rate_limit_safety_rpm;
    int rate_limit_burst;
    int max_retries;
    int retry_base_delay_ms;
    double retry_multiplier;
    int retry_max_delay_ms;
    int fetch_workers;

    // Validation
    double max_warn_ratio;

    // Scheduled sync: "NSE:RELIANCE:day,NFO:NIFTY24JANFUT:minute"
    std::vector<std::string> sync_series;
    std::string sync_from;
    std::string sync_to;
    int sync_interval_seconds;

    // QuestDB
    std::string questdb_http_url;
    std::string questdb_pg_dsn;
    std::string questdb_table;

    // Migration
    std::vector<std::string> migration_sources;
    int migration_workers;
    int migration_batch_size;
    std::string migration_checkpoint;
    bool migration_verify;
    bool migration_dry_run;

    // Redis
    std::string redis_url;
    std::string event_stream;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env(const std::string& default_service = "ingestor");
    void validate() const;
    void validate_upstream() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
