#include <fmt/format.h>

#include <LogCompat.hpp>
#include <upload/UploadObserver.hpp>
#include <variant>

namespace HealthUploader {

void LoggingUploadObserver::onValidationFailed(std::string_view fileName,
                                               const absl::Status& status) {
    LOG(ERROR) << "Rejected " << fileName << ": " << status.message();
}

void LoggingUploadObserver::onPlanned(std::string_view fileName,
                                      std::uint64_t totalBytes,
                                      std::uint64_t chunkSize,
                                      std::uint64_t totalChunks) {
    LOG(INFO) << fmt::format("Uploading {} ({} bytes) as {} chunks of {} bytes",
                             fileName, totalBytes, totalChunks, chunkSize);
}

void LoggingUploadObserver::onChunkRetry(std::uint64_t chunkNumber,
                                         int attempt, std::string_view reason,
                                         std::chrono::milliseconds delay) {
    LOG(WARNING) << fmt::format(
        "Chunk {} attempt {} failed: {}. Retrying in {}ms", chunkNumber,
        attempt, reason, delay.count());
}

void LoggingUploadObserver::onChunkAcked(std::uint64_t chunkNumber,
                                         std::uint64_t totalChunks) {
    DLOG(INFO) << fmt::format("Chunk {}/{} acknowledged", chunkNumber + 1,
                              totalChunks);
}

void LoggingUploadObserver::onChecksumMismatch(std::uint64_t chunkNumber,
                                               std::string_view expected,
                                               std::string_view actual) {
    LOG(WARNING) << fmt::format(
        "Checksum mismatch on chunk {}: sent {}, server has {}", chunkNumber,
        expected, actual);
}

void LoggingUploadObserver::onUploadFinished(std::string_view fileName,
                                             const UploadResult& result) {
    if (const auto* ack = std::get_if<FinalAck>(&result); ack != nullptr) {
        LOG(INFO) << fmt::format("Uploaded {}: {}", fileName, ack->message());
    } else {
        LOG(ERROR) << fmt::format("Upload of {} failed: {}", fileName,
                                  std::get<TransmitError>(result));
    }
}

void LoggingUploadObserver::onPollCheck(std::string_view processingId,
                                        int attempt,
                                        std::string_view message) {
    LOG(INFO) << fmt::format("[{}] check {}: {}", processingId, attempt,
                             message);
}

void LoggingUploadObserver::onStatusFetchFailed(std::string_view processingId,
                                                int attempt,
                                                const absl::Status& status) {
    LOG(WARNING) << fmt::format("[{}] status check {} failed: {}",
                                processingId, attempt, status.ToString());
}

void LoggingUploadObserver::onJobFinished(const ProcessingResult& result) {
    if (result.state == JobState::Completed) {
        LOG(INFO) << fmt::format("[{}] {} after {} checks: {}",
                                 result.processingId, result.state,
                                 result.checks, result.message);
    } else {
        LOG(WARNING) << fmt::format("[{}] {} after {} checks: {}",
                                    result.processingId, result.state,
                                    result.checks, result.message);
    }
}

}  // namespace HealthUploader
