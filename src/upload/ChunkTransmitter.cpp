#include <absl/status/status.h>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <upload/ChunkTransmitter.hpp>
#include <utility>

namespace HealthUploader {

SendResult ChunkTransmitter::send(const ChunkDescriptor& chunk,
                                  std::string_view checksum,
                                  std::string_view fileName,
                                  const RetryPolicy& policy,
                                  std::stop_token stop,
                                  const AckCallback& onAcked) {
    std::string lastReason;
    std::optional<long> lastStatus;

    for (int attempt = 0; attempt < policy.maxAttempts; ++attempt) {
        if (stop.stop_requested()) {
            return TransmitError::cancelled();
        }
        auto response =
            endpoints_.uploadChunk(chunk, fileName, checksum, timeout_, stop);

        if (response.ok() && response->httpStatus >= 200 &&
            response->httpStatus < 300) {
            if (!checksum.empty() && response->checksum &&
                *response->checksum != checksum) {
                observer_.onChecksumMismatch(chunk.chunkNumber, checksum,
                                             *response->checksum);
            }
            if (onAcked) {
                onAcked(chunk);
            }
            observer_.onChunkAcked(chunk.chunkNumber, chunk.totalChunks);
            return *std::move(response);
        }

        if (response.ok()) {
            lastStatus = response->httpStatus;
            lastReason = response->message;
            if (policy.isNonRetryable(response->httpStatus)) {
                return TransmitError{
                    .code = TransmitError::codeForHttpStatus(
                        response->httpStatus),
                    .message = std::move(response->message),
                    .details = {.chunkNumber = chunk.chunkNumber,
                                .attempt = attempt + 1,
                                .httpStatus = response->httpStatus},
                };
            }
        } else if (absl::IsCancelled(response.status())) {
            return TransmitError::cancelled();
        } else {
            lastStatus.reset();
            lastReason = std::string(response.status().message());
        }

        if (attempt + 1 >= policy.maxAttempts) {
            break;
        }
        const auto delay = policy.backoff.delayFor(attempt);
        observer_.onChunkRetry(chunk.chunkNumber, attempt + 1, lastReason,
                               delay);
        if (!sleeper_.sleepFor(delay, stop)) {
            return TransmitError::cancelled();
        }
    }

    return TransmitError{
        .code = TransmitError::Code::UploadFailed,
        .message = fmt::format("Failed to upload chunk {} after {} attempts: {}",
                               chunk.chunkNumber, policy.maxAttempts,
                               lastReason),
        .details = {.chunkNumber = chunk.chunkNumber,
                    .attempt = policy.maxAttempts,
                    .httpStatus = lastStatus},
    };
}

}  // namespace HealthUploader
