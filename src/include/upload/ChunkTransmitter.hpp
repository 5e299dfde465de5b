#pragma once

#include <chrono>
#include <functional>
#include <stop_token>
#include <string_view>

#include "RetryPolicy.hpp"
#include "Sleeper.hpp"
#include "UploadObserver.hpp"
#include "UploadTypes.hpp"
#include "net/UploadEndpoints.hpp"

namespace HealthUploader {

// Delivers a single chunk, retrying transient failures with backoff.
class ChunkTransmitter {
   public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

    using AckCallback = std::function<void(const ChunkDescriptor&)>;

    ChunkTransmitter(Net::UploadEndpoints& endpoints, Sleeper& sleeper,
                     UploadObserver& observer,
                     std::chrono::milliseconds timeout = kDefaultTimeout)
        : endpoints_(endpoints),
          sleeper_(sleeper),
          observer_(observer),
          timeout_(timeout) {}

    /**
     * @brief Sends chunk until it is acknowledged or the policy gives up.
     *
     * At most policy.maxAttempts requests are made. 413, 401 and 403 stop
     * immediately with FileTooLarge, Unauthorized and Forbidden. Other
     * failures wait policy.backoff.delayFor(attempt) and try again, ending
     * in UploadFailed once attempts run out. A stop request ends the loop
     * with Cancelled. onAcked runs once, after the acknowledgement.
     *
     * A checksum echoed by the server that differs from ours is reported to
     * the observer but does not fail the chunk.
     */
    SendResult send(const ChunkDescriptor& chunk, std::string_view checksum,
                    std::string_view fileName, const RetryPolicy& policy,
                    std::stop_token stop, const AckCallback& onAcked = {});

   private:
    Net::UploadEndpoints& endpoints_;
    Sleeper& sleeper_;
    UploadObserver& observer_;
    std::chrono::milliseconds timeout_;
};

}  // namespace HealthUploader
