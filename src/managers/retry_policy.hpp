#pragma once

#include <functional>
#include <string>
#include <system_error>
#include <core/types.hpp>

// Blocks the calling task for the given number of seconds.
using Sleeper = std::function<void(long long seconds)>;

struct RetryState {
    int attempt = 1;            // 1-based
    int max_attempts = 1;
    int base_backoff_secs = 0;
};

// Exponential backoff without jitter: attempt k (1-based) that fails with
// attempts left is followed by a sleep of base * 2^(k-1) seconds. Only
// TransferError and I/O errors (std::system_error, which includes
// std::filesystem::filesystem_error) are retried; anything else propagates
// immediately. The final failure is rethrown unchanged.
class RetryPolicy {
public:
    RetryPolicy(int max_retries, int backoff_base_secs, Sleeper sleeper = nullptr);

    static long long delay_for(int attempt, int base_secs);

    int max_attempts() const { return max_retries_ + 1; }
    int base_backoff_secs() const { return base_; }

    void set_status_callback(StatusCallback cb) { status_cb_ = std::move(cb); }

    template <typename F>
    auto run(F&& fn, const std::string& what) -> decltype(fn()) {
        RetryState state{1, max_attempts(), base_};
        for (;; ++state.attempt) {
            try {
                return fn();
            } catch (const TransferError& e) {
                if (state.attempt >= state.max_attempts) throw;
                backoff(state, what, e.what());
            } catch (const std::system_error& e) {
                if (state.attempt >= state.max_attempts) throw;
                backoff(state, what, e.what());
            }
        }
    }

private:
    int max_retries_;
    int base_;
    Sleeper sleeper_;
    StatusCallback status_cb_;

    void backoff(const RetryState& state, const std::string& what, const std::string& error);
};
