#include <algorithm>
#include <cmath>
#include <upload/RetryPolicy.hpp>

namespace HealthUploader {

std::chrono::milliseconds BackoffSchedule::delayFor(int attempt) const {
    const double raw = static_cast<double>(initial.count()) *
                       std::pow(multiplier, std::max(attempt, 0));
    const auto capped = std::min(raw, static_cast<double>(cap.count()));
    return std::chrono::milliseconds(std::llround(capped));
}

RetryPolicy RetryPolicy::forChunks(int maxRetries) {
    return {
        .maxAttempts = std::max(maxRetries, 0) + 1,
        .backoff = {.initial = std::chrono::milliseconds(1000),
                    .multiplier = 2.0,
                    .cap = std::chrono::milliseconds(10000)},
        .nonRetryable =
            [](long status) {
                return status == 413 || status == 401 || status == 403;
            },
    };
}

RetryPolicy RetryPolicy::forJobPolling() {
    return {
        .maxAttempts = 60,
        .backoff = {.initial = std::chrono::milliseconds(2000),
                    .multiplier = 1.5,
                    .cap = std::chrono::milliseconds(30000)},
        .nonRetryable = nullptr,
    };
}

}  // namespace HealthUploader
