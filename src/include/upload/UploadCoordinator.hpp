#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

#include "ChunkTransmitter.hpp"
#include "FileSource.hpp"
#include "FileValidator.hpp"
#include "UploadObserver.hpp"
#include "UploadTypes.hpp"

namespace HealthUploader {

struct UploadOptions {
    // Overrides ChunkPlanner::chooseChunkSize when set.
    std::optional<std::uint64_t> chunkSize;
    int maxRetries = 3;
    // Chunks in flight per group.
    std::size_t parallelism = 3;
    ValidatorOptions validation;
    std::function<void(const UploadProgress&)> onProgress;
    std::function<void(const TransmitError&)> onError;
    std::stop_token stop;
};

/**
 * @brief Uploads a whole file as chunks.
 *
 * Chunks are sent in consecutive groups of options.parallelism, all chunks
 * of a group concurrently, and a group starts only after the previous one
 * settled. The first failing chunk stops its siblings and the upload; the
 * error with the lowest chunk number is reported.
 */
class UploadCoordinator {
   public:
    UploadCoordinator(ChunkTransmitter& transmitter, UploadObserver& observer)
        : transmitter_(transmitter), observer_(observer) {}

    UploadResult upload(std::shared_ptr<const FileSource> file,
                        const UploadOptions& options);

   private:
    UploadResult finish(std::string_view fileName, UploadResult result,
                        const UploadOptions& options);

    ChunkTransmitter& transmitter_;
    UploadObserver& observer_;
};

}  // namespace HealthUploader
