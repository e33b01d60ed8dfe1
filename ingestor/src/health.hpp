#pragma once

#include "redis_bus.hpp"
#include "local_store.hpp"
#include "rate_limiter.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <map>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<StoreRegistry> stores,
                std::shared_ptr<TokenBucketLimiter> limiter,
                std::shared_ptr<RedisBus> redis);

    nlohmann::json get_status();
    bool is_healthy();

    void record_sync(const std::string& series, const std::string& status);

private:
    std::shared_ptr<StoreRegistry> stores_;
    std::shared_ptr<TokenBucketLimiter> limiter_;
    std::shared_ptr<RedisBus> redis_;

    std::mutex mutex_;
    std::map<std::string, std::string> last_sync_;
};
