#include "retry_policy.hpp"
#include <platform/platform.hpp>
#include <algorithm>

bool is_retryable_status(int status) {
    return status == 408 || status == 425 || status == 429 ||
           (status >= 500 && status <= 599);
}

bool is_retryable_error(const std::exception& e) {
    if (const auto* remote = dynamic_cast<const RemoteError*>(&e)) {
        return remote->retryable();
    }
    if (const auto* transport = dynamic_cast<const TransportError*>(&e)) {
        return transport->retryable();
    }
    return false;
}

RetryPolicy::RetryPolicy(int max_retries, int base_delay_ms, SleepFn sleep)
    : max_retries_(std::max(0, max_retries)),
      base_delay_ms_(std::max(0, base_delay_ms)),
      sleep_(sleep ? std::move(sleep) : SleepFn(platform::sleep_ms)) {
}
