#include "retry.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>

std::string retry_state_name(RetryState state) {
    switch (state) {
        case RetryState::Attempting: return "attempting";
        case RetryState::Waiting: return "waiting";
        case RetryState::Succeeded: return "succeeded";
        case RetryState::PermanentFailure: return "permanent_failure";
        case RetryState::Exhausted: return "exhausted";
    }
    return "unknown";
}

RetryMachine::RetryMachine(RetryPolicy policy) : policy_(policy) {
    if (policy_.max_attempts < 1) {
        throw std::invalid_argument("Retry policy needs at least one attempt");
    }
}

bool RetryMachine::finished() const {
    return state_ == RetryState::Succeeded ||
           state_ == RetryState::PermanentFailure ||
           state_ == RetryState::Exhausted;
}

void RetryMachine::expect(RetryState expected, const char* event) const {
    if (state_ != expected) {
        throw std::logic_error(std::string("Retry event '") + event + "' invalid in state " +
                               retry_state_name(state_));
    }
}

void RetryMachine::begin_attempt() {
    expect(RetryState::Attempting, "begin_attempt");
    if (in_flight_) {
        throw std::logic_error("Retry attempt already in flight");
    }
    ++attempts_;
    in_flight_ = true;
}

void RetryMachine::on_success() {
    expect(RetryState::Attempting, "success");
    in_flight_ = false;
    state_ = RetryState::Succeeded;
}

void RetryMachine::on_transient_failure(const std::string& error) {
    expect(RetryState::Attempting, "transient_failure");
    in_flight_ = false;
    last_error_ = error;
    if (attempts_ >= policy_.max_attempts) {
        state_ = RetryState::Exhausted;
        pending_delay_ = std::chrono::milliseconds(0);
        return;
    }
    pending_delay_ = backoff_for(attempts_);
    state_ = RetryState::Waiting;
}

void RetryMachine::on_permanent_failure(const std::string& error) {
    expect(RetryState::Attempting, "permanent_failure");
    in_flight_ = false;
    last_error_ = error;
    state_ = RetryState::PermanentFailure;
}

void RetryMachine::resume() {
    expect(RetryState::Waiting, "resume");
    pending_delay_ = std::chrono::milliseconds(0);
    state_ = RetryState::Attempting;
}

std::chrono::milliseconds RetryMachine::backoff_for(int attempt) const {
    double factor = std::pow(policy_.multiplier, std::max(0, attempt - 1));
    double delay = static_cast<double>(policy_.base_delay.count()) * factor;
    delay = std::min(delay, static_cast<double>(policy_.max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}
