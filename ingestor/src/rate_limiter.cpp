#include "rate_limiter.hpp"
#include <algorithm>
#include <stdexcept>
#include <cmath>

TokenBucketLimiter::TokenBucketLimiter(std::shared_ptr<Clock> clock, double rate_per_second,
                                       double capacity)
    : clock_(std::move(clock)), rate_(rate_per_second), capacity_(capacity),
      tokens_(capacity) {
    if (rate_ <= 0.0 || capacity_ < 1.0) {
        throw std::invalid_argument("Token bucket needs a positive rate and capacity >= 1");
    }
    last_refill_ = clock_->now();
}

std::shared_ptr<TokenBucketLimiter> TokenBucketLimiter::per_minute(std::shared_ptr<Clock> clock,
                                                                   int ceiling_rpm, int safety_rpm,
                                                                   int burst) {
    int effective = ceiling_rpm - safety_rpm;
    if (effective <= 0) {
        throw std::invalid_argument("Rate limit safety margin consumes the whole ceiling");
    }
    return std::make_shared<TokenBucketLimiter>(std::move(clock), effective / 60.0,
                                                static_cast<double>(std::max(1, burst)));
}

void TokenBucketLimiter::refill() {
    auto now = clock_->now();
    std::chrono::duration<double> elapsed = now - last_refill_;
    if (elapsed.count() > 0) {
        tokens_ = std::min(capacity_, tokens_ + elapsed.count() * rate_);
        last_refill_ = now;
    }
}

void TokenBucketLimiter::acquire() {
    for (;;) {
        std::chrono::nanoseconds wait;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refill();
            if (tokens_ >= 1.0) {
                tokens_ -= 1.0;
                ++granted_;
                return;
            }
            double seconds = (1.0 - tokens_) / rate_;
            wait = std::chrono::nanoseconds(static_cast<int64_t>(std::ceil(seconds * 1e9)));
        }
        clock_->sleep_for(wait);
    }
}

void TokenBucketLimiter::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = std::min(capacity_, tokens_ + 1.0);
}

double TokenBucketLimiter::available() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    return tokens_;
}

uint64_t TokenBucketLimiter::granted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return granted_;
}
