#pragma once

#include <absl/status/statusor.h>

#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "RetryPolicy.hpp"
#include "Sleeper.hpp"
#include "UploadObserver.hpp"
#include "UploadTypes.hpp"

namespace HealthUploader {

// Starts a server side processing job and waits for it to settle.
class ProcessingJobPoller {
   public:
    using StartTrigger = std::function<absl::StatusOr<std::string>()>;
    using StatusFetcher =
        std::function<absl::StatusOr<JobStatus>(std::string_view)>;
    using StatusUpdate = std::function<void(std::string_view)>;

    static constexpr std::string_view kStartedMessage =
        "Processing started. Waiting for results...";
    static constexpr std::string_view kWaitingMessage =
        "Waiting for processing progress...";
    static constexpr std::string_view kCompletedMessage =
        "Processing completed";
    static constexpr std::string_view kTimedOutMessage =
        "Processing is taking longer than expected and may still be "
        "running. Check back later.";

    ProcessingJobPoller(Sleeper& sleeper, UploadObserver& observer,
                        RetryPolicy policy = RetryPolicy::forJobPolling())
        : sleeper_(sleeper), observer_(observer), policy_(std::move(policy)) {}

    /**
     * @brief Triggers a job and polls its status.
     *
     * Before check n (0 based) the poller waits policy.backoff.delayFor(n).
     * A failed status check is logged and polling goes on. At most
     * policy.maxAttempts checks are made.
     *
     * @return Completed or TimedOut result. A job reporting an error yields
     * an Aborted status carrying the server's text verbatim, a failing
     * trigger returns its own status, a stop request returns Cancelled.
     */
    absl::StatusOr<ProcessingResult> run(const StartTrigger& start,
                                         const StatusFetcher& fetch,
                                         const StatusUpdate& onStatus,
                                         std::stop_token stop);

   private:
    Sleeper& sleeper_;
    UploadObserver& observer_;
    RetryPolicy policy_;
};

}  // namespace HealthUploader
