#pragma once

#include "clock.hpp"
#include <memory>
#include <mutex>
#include <cstdint>

class RateLimiter {
public:
    virtual ~RateLimiter() = default;
    // Blocks until a request may be sent.
    virtual void acquire() = 0;
    // Hands back a token that was acquired but not spent.
    virtual void release() = 0;
};

class NoopLimiter : public RateLimiter {
public:
    void acquire() override {}
    void release() override {}
};

// Refills at rate_per_second up to capacity. Waiting callers sleep through
// the injected clock.
class TokenBucketLimiter : public RateLimiter {
public:
    TokenBucketLimiter(std::shared_ptr<Clock> clock, double rate_per_second, double capacity);

    // Effective rate is (ceiling_rpm - safety_rpm) / 60 per second.
    static std::shared_ptr<TokenBucketLimiter> per_minute(std::shared_ptr<Clock> clock,
                                                          int ceiling_rpm, int safety_rpm,
                                                          int burst);

    void acquire() override;
    void release() override;

    double available();
    uint64_t granted() const;
    double rate_per_second() const { return rate_; }
    double capacity() const { return capacity_; }

private:
    void refill();

    std::shared_ptr<Clock> clock_;
    double rate_;
    double capacity_;

    mutable std::mutex mutex_;
    double tokens_;
    std::chrono::steady_clock::time_point last_refill_;
    uint64_t granted_ = 0;
};
