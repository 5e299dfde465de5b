#pragma once

#include <chrono>
#include <functional>

namespace HealthUploader {

// Geometric delay: min(initial * multiplier^attempt, cap).
struct BackoffSchedule {
    std::chrono::milliseconds initial;
    double multiplier;
    std::chrono::milliseconds cap;

    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const;
};

struct RetryPolicy {
    // Total attempts including the first one.
    int maxAttempts;
    BackoffSchedule backoff;
    // Statuses for which retrying is pointless.
    std::function<bool(long httpStatus)> nonRetryable;

    [[nodiscard]] bool isNonRetryable(long httpStatus) const {
        return nonRetryable && nonRetryable(httpStatus);
    }

    // 1s doubling up to 10s, 413/401/403 fail immediately.
    static RetryPolicy forChunks(int maxRetries = 3);
    // 60 checks, 2s growing by 1.5 up to 30s.
    static RetryPolicy forJobPolling();
};

}  // namespace HealthUploader
