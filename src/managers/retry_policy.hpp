#pragma once

#include <string>
#include <functional>
#include <exception>
#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>

// 408 Request Timeout, 425 Too Early, 429 Too Many Requests, any 5xx
bool is_retryable_status(int status);

// True for RemoteError/TransportError flagged retryable.
bool is_retryable_error(const std::exception& e);

// Linear backoff: wait base_delay_ms * (attempt + 1) before retry number attempt+1,
// capped at MAX_RETRY_DELAY_MS.
class RetryPolicy {
public:
    using SleepFn = std::function<void(int ms)>;

    RetryPolicy(int max_retries, int base_delay_ms, SleepFn sleep = nullptr);

    int max_retries() const { return max_retries_; }
    int delay_for(int attempt) const {
        int64_t wait = static_cast<int64_t>(base_delay_ms_) * (static_cast<int64_t>(attempt) + 1);
        return static_cast<int>(std::min<int64_t>(wait, MAX_RETRY_DELAY_MS));
    }

    // Run op, retrying retryable failures. The last error propagates once
    // retries are exhausted; anything non-retryable propagates immediately.
    template <typename F>
    auto run(const std::string& label, F&& op) const -> decltype(op()) {
        for (int attempt = 0;; ++attempt) {
            try {
                return op();
            } catch (const std::exception& e) {
                if (!is_retryable_error(e) || attempt >= max_retries_) throw;
                int wait = delay_for(attempt);
                davsync_log(fmt::format("{}: attempt {} failed ({}), retrying in {} ms",
                                        label, attempt + 1, e.what(), wait));
                sleep_(wait);
            }
        }
    }

private:
    int max_retries_;
    int base_delay_ms_;
    SleepFn sleep_;
};
