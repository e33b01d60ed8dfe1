#pragma once

#include <chrono>
#include <string>

struct RetryPolicy {
    int max_attempts = 7;
    std::chrono::milliseconds base_delay{2000};
    double multiplier = 1.3;
    std::chrono::milliseconds max_delay{60000};
};

enum class RetryState {
    Attempting,
    Waiting,
    Succeeded,
    PermanentFailure,
    Exhausted
};

std::string retry_state_name(RetryState state);

// Drives one unit of work through attempts. The caller performs the attempt
// and the waiting; the machine only decides what comes next.
class RetryMachine {
public:
    explicit RetryMachine(RetryPolicy policy);

    RetryState state() const { return state_; }
    int attempts() const { return attempts_; }
    bool finished() const;
    std::chrono::milliseconds pending_delay() const { return pending_delay_; }
    const std::string& last_error() const { return last_error_; }

    void begin_attempt();
    void on_success();
    void on_transient_failure(const std::string& error);
    void on_permanent_failure(const std::string& error);
    void resume();

    std::chrono::milliseconds backoff_for(int attempt) const;

private:
    void expect(RetryState expected, const char* event) const;

    RetryPolicy policy_;
    RetryState state_ = RetryState::Attempting;
    int attempts_ = 0;
    bool in_flight_ = false;
    std::chrono::milliseconds pending_delay_{0};
    std::string last_error_;
};
