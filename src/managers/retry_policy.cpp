#include "retry_policy.hpp"
#include "job_log.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

RetryPolicy::RetryPolicy(int max_retries, int backoff_base_secs, Sleeper sleeper)
    : max_retries_(max_retries), base_(backoff_base_secs), sleeper_(std::move(sleeper)) {
    if (max_retries < 0) throw std::invalid_argument("retries must be >= 0");
    if (backoff_base_secs < 0) throw std::invalid_argument("retry backoff must be >= 0");
    if (!sleeper_) {
        sleeper_ = [](long long seconds) {
            std::this_thread::sleep_for(std::chrono::seconds(seconds));
        };
    }
}

long long RetryPolicy::delay_for(int attempt, int base_secs) {
    if (attempt < 1) attempt = 1;
    int shift = std::min(attempt - 1, 30);
    return static_cast<long long>(base_secs) << shift;
}

void RetryPolicy::backoff(const RetryState& state, const std::string& what,
                          const std::string& error) {
    long long delay = delay_for(state.attempt, state.base_backoff_secs);
    remora_log(fmt::format("{} failed (attempt {}/{}): {}; retrying in {}s",
                           what, state.attempt, state.max_attempts, error, delay));
    if (status_cb_) {
        status_cb_(fmt::format("{} failed (attempt {}/{}), retrying in {}s: {}",
                               what, state.attempt, state.max_attempts, delay, error));
    }
    sleeper_(delay);
}
