#include "health.hpp"

HealthCheck::HealthCheck(std::shared_ptr<StoreRegistry> stores,
                         std::shared_ptr<TokenBucketLimiter> limiter,
                         std::shared_ptr<RedisBus> redis)
    : stores_(stores), limiter_(limiter), redis_(redis) {}

void HealthCheck::record_sync(const std::string& series, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_sync_[series] = status;
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = !redis_ || redis_->ping();

    nlohmann::json stores_json = nlohmann::json::object();
    bool stores_ok = true;
    for (const auto& [segment, store] : stores_->opened()) {
        const auto& report = store->open_report();
        nlohmann::json entry = {
            {"path", store->path()},
            {"datasets", store->list_datasets().size()}
        };
        if (!report.quarantined_to.empty()) {
            entry["quarantined_to"] = report.quarantined_to;
            stores_ok = false;
        }
        if (report.migrated_from) {
            entry["migrated_from"] = *report.migrated_from;
        }
        stores_json[schema::segment_name(segment)] = entry;
    }

    nlohmann::json sync_json = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [series, status] : last_sync_) {
            sync_json[series] = status;
        }
    }

    nlohmann::json status = {
        {"ok", redis_ok},
        {"redis", redis_ ? (redis_ok ? "up" : "down") : "disabled"},
        {"stores", stores_json},
        {"stores_clean", stores_ok},
        {"rate_limiter", {
            {"available", limiter_->available()},
            {"granted", limiter_->granted()},
            {"rate_per_second", limiter_->rate_per_second()}
        }},
        {"last_sync", sync_json}
    };

    return status;
}

bool HealthCheck::is_healthy() {
    return !redis_ || redis_->ping();
}
