#pragma once

#include <absl/status/status.h>

#include <chrono>
#include <cstdint>
#include <string_view>

#include "UploadTypes.hpp"

namespace HealthUploader {

// Receives upload and processing events. Methods may be called from
// several worker threads at once.
class UploadObserver {
   public:
    virtual ~UploadObserver() = default;

    virtual void onValidationFailed(std::string_view /*fileName*/,
                                    const absl::Status& /*status*/) {}
    virtual void onPlanned(std::string_view /*fileName*/,
                           std::uint64_t /*totalBytes*/,
                           std::uint64_t /*chunkSize*/,
                           std::uint64_t /*totalChunks*/) {}
    virtual void onChunkRetry(std::uint64_t /*chunkNumber*/, int /*attempt*/,
                              std::string_view /*reason*/,
                              std::chrono::milliseconds /*delay*/) {}
    virtual void onChunkAcked(std::uint64_t /*chunkNumber*/,
                              std::uint64_t /*totalChunks*/) {}
    virtual void onChecksumMismatch(std::uint64_t /*chunkNumber*/,
                                    std::string_view /*expected*/,
                                    std::string_view /*actual*/) {}
    virtual void onUploadFinished(std::string_view /*fileName*/,
                                  const UploadResult& /*result*/) {}
    virtual void onPollCheck(std::string_view /*processingId*/,
                             int /*attempt*/, std::string_view /*message*/) {}
    virtual void onStatusFetchFailed(std::string_view /*processingId*/,
                                     int /*attempt*/,
                                     const absl::Status& /*status*/) {}
    virtual void onJobFinished(const ProcessingResult& /*result*/) {}
};

// Writes every event through LOG().
class LoggingUploadObserver : public UploadObserver {
   public:
    void onValidationFailed(std::string_view fileName,
                            const absl::Status& status) override;
    void onPlanned(std::string_view fileName, std::uint64_t totalBytes,
                   std::uint64_t chunkSize,
                   std::uint64_t totalChunks) override;
    void onChunkRetry(std::uint64_t chunkNumber, int attempt,
                      std::string_view reason,
                      std::chrono::milliseconds delay) override;
    void onChunkAcked(std::uint64_t chunkNumber,
                      std::uint64_t totalChunks) override;
    void onChecksumMismatch(std::uint64_t chunkNumber,
                            std::string_view expected,
                            std::string_view actual) override;
    void onUploadFinished(std::string_view fileName,
                          const UploadResult& result) override;
    void onPollCheck(std::string_view processingId, int attempt,
                     std::string_view message) override;
    void onStatusFetchFailed(std::string_view processingId, int attempt,
                             const absl::Status& status) override;
    void onJobFinished(const ProcessingResult& result) override;
};

}  // namespace HealthUploader
