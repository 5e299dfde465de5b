#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "ChunkTransmitter.hpp"
#include "FileSource.hpp"
#include "ProcessingJobPoller.hpp"
#include "RetryPolicy.hpp"
#include "Sleeper.hpp"
#include "UploadCoordinator.hpp"
#include "UploadObserver.hpp"
#include "UploadTypes.hpp"
#include "net/UploadEndpoints.hpp"

namespace HealthUploader {

enum class Transport { Chunked, Presigned };

struct SessionOptions {
    UploadOptions upload;
    Transport transport = Transport::Chunked;
    // Start and poll a processing job after the upload.
    bool process = true;
    RetryPolicy polling = RetryPolicy::forJobPolling();
    std::function<void(const FinalAck&)> onUploaded;
    ProcessingJobPoller::StatusUpdate onStatus;
};

struct SessionResult {
    FinalAck upload;
    std::optional<ProcessingResult> processing;
};

// Upload then process, for one file. Keeps no state between calls.
class UploadSession {
   public:
    UploadSession(Net::UploadEndpoints& endpoints, Sleeper& sleeper,
                  UploadObserver& observer,
                  std::chrono::milliseconds chunkTimeout =
                      ChunkTransmitter::kDefaultTimeout)
        : endpoints_(endpoints),
          sleeper_(sleeper),
          observer_(observer),
          chunkTimeout_(chunkTimeout) {}

    /**
     * @brief Runs the pipeline for one file.
     *
     * Upload failures come back as TransmitError::toStatus(), processing
     * failures as returned by ProcessingJobPoller::run.
     */
    absl::StatusOr<SessionResult> run(std::shared_ptr<const FileSource> file,
                                      const SessionOptions& options);

   private:
    Net::UploadEndpoints& endpoints_;
    Sleeper& sleeper_;
    UploadObserver& observer_;
    std::chrono::milliseconds chunkTimeout_;
};

}  // namespace HealthUploader
