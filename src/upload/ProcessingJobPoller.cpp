#include <absl/status/status.h>

#include <upload/ProcessingJobPoller.hpp>
#include <utility>

namespace HealthUploader {

absl::StatusOr<ProcessingResult> ProcessingJobPoller::run(
    const StartTrigger& start, const StatusFetcher& fetch,
    const StatusUpdate& onStatus, std::stop_token stop) {
    const auto update = [&onStatus](std::string_view message) {
        if (onStatus) {
            onStatus(message);
        }
    };

    auto processingId = start();
    if (!processingId.ok()) {
        return processingId.status();
    }
    ProcessingResult result{.processingId = *processingId,
                            .state = JobState::Started};
    update(kStartedMessage);

    result.state = JobState::Polling;
    for (int attempt = 0; attempt < policy_.maxAttempts; ++attempt) {
        if (!sleeper_.sleepFor(policy_.backoff.delayFor(attempt), stop)) {
            return absl::CancelledError("Processing poll cancelled");
        }
        ++result.checks;

        auto status = fetch(result.processingId);
        if (!status.ok()) {
            if (absl::IsCancelled(status.status())) {
                return status.status();
            }
            observer_.onStatusFetchFailed(result.processingId, result.checks,
                                          status.status());
            continue;
        }
        if (status->completed) {
            result.state = JobState::Completed;
            result.message = status->message.empty()
                                 ? std::string(kCompletedMessage)
                                 : std::move(status->message);
            result.results = std::move(status->results);
            update(result.message);
            observer_.onJobFinished(result);
            return result;
        }
        if (status->error) {
            result.state = JobState::Failed;
            result.message = *status->error;
            observer_.onJobFinished(result);
            return absl::AbortedError(*status->error);
        }
        const std::string message =
            status->progress.value_or(std::string(kWaitingMessage));
        result.lastProgressMessage = message;
        observer_.onPollCheck(result.processingId, result.checks, message);
        update(message);
    }

    result.state = JobState::TimedOut;
    result.message = std::string(kTimedOutMessage);
    update(result.message);
    observer_.onJobFinished(result);
    return result;
}

}  // namespace HealthUploader
