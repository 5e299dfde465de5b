#include <absl/status/status.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <future>
#include <mutex>
#include <upload/ChecksumGenerator.hpp>
#include <upload/ChunkPlanner.hpp>
#include <upload/RetryPolicy.hpp>
#include <upload/UploadCoordinator.hpp>
#include <utility>
#include <vector>

namespace HealthUploader {

UploadResult UploadCoordinator::finish(std::string_view fileName,
                                       UploadResult result,
                                       const UploadOptions& options) {
    if (const auto* error = std::get_if<TransmitError>(&result);
        error != nullptr && options.onError) {
        options.onError(*error);
    }
    observer_.onUploadFinished(fileName, result);
    return result;
}

UploadResult UploadCoordinator::upload(std::shared_ptr<const FileSource> file,
                                       const UploadOptions& options) {
    const std::string fileName = file ? file->name() : std::string();

    const FileValidator validator(options.validation);
    if (auto status = validator.validate(file.get()); !status.ok()) {
        observer_.onValidationFailed(fileName, status);
        return finish(fileName, FileValidator::toTransmitError(status),
                      options);
    }

    auto plan = ChunkPlanner::plan(file, options.chunkSize);
    if (!plan.ok()) {
        return finish(fileName,
                      TransmitError{
                          .code = TransmitError::Code::InvalidFile,
                          .message = std::string(plan.status().message()),
                      },
                      options);
    }
    const ChunkPlan& chunks = *plan;
    observer_.onPlanned(fileName, chunks.totalBytes(), chunks.chunkSize(),
                        chunks.totalChunks());

    const RetryPolicy policy = RetryPolicy::forChunks(options.maxRetries);
    const std::uint64_t groupSize =
        std::max<std::uint64_t>(options.parallelism, 1);

    // Stopped either by the caller or by the first failing chunk.
    std::stop_source stopAll;
    std::stop_callback forwardCancel(options.stop,
                                     [&stopAll] { stopAll.request_stop(); });

    std::mutex progressLock;
    std::uint64_t loaded = 0;
    const auto onAcked = [&](const ChunkDescriptor& chunk) {
        const std::lock_guard<std::mutex> lock(progressLock);
        loaded += chunk.size;
        if (options.onProgress) {
            options.onProgress(UploadProgress::of(loaded, chunks.totalBytes()));
        }
    };

    const auto sendOne = [&](std::uint64_t index) -> SendResult {
        auto chunk = chunks.at(index);
        if (!chunk.ok()) {
            return TransmitError{
                .code = TransmitError::Code::UploadFailed,
                .message = std::string(chunk.status().message()),
                .details = {.chunkNumber = index},
            };
        }
        auto checksum = ChecksumGenerator::digest(chunk->bytes);
        if (!checksum) {
            LOG(WARNING) << "Sending chunk " << index << " without checksum";
        }
        return transmitter_.send(*chunk, checksum.value_or(""), fileName,
                                 policy, stopAll.get_token(), onAcked);
    };

    std::optional<ServerAck> lastAck;
    std::optional<std::pair<std::uint64_t, TransmitError>> failure;
    // Set once any chunk was abandoned, the last ack alone is not enough then.
    bool cancelled = false;

    for (std::uint64_t start = 0; start < chunks.totalChunks();
         start += groupSize) {
        if (stopAll.stop_requested()) {
            cancelled = true;
            break;
        }
        const std::uint64_t end =
            std::min(start + groupSize, chunks.totalChunks());

        std::vector<std::future<SendResult>> inFlight;
        inFlight.reserve(end - start);
        for (std::uint64_t index = start; index < end; ++index) {
            inFlight.emplace_back(
                std::async(std::launch::async, [&, index] {
                    auto result = sendOne(index);
                    if (const auto* error = std::get_if<TransmitError>(&result);
                        error != nullptr &&
                        error->code != TransmitError::Code::Cancelled) {
                        stopAll.request_stop();
                    }
                    return result;
                }));
        }

        for (std::uint64_t index = start; index < end; ++index) {
            auto result = inFlight[index - start].get();
            if (auto* ack = std::get_if<ServerAck>(&result); ack != nullptr) {
                if (index + 1 == chunks.totalChunks()) {
                    lastAck = std::move(*ack);
                }
                continue;
            }
            auto& error = std::get<TransmitError>(result);
            if (error.code == TransmitError::Code::Cancelled) {
                cancelled = true;
                continue;
            }
            if (!failure || index < failure->first) {
                failure.emplace(index, std::move(error));
            }
        }
    }

    if (failure) {
        return finish(fileName, std::move(failure->second), options);
    }
    if (cancelled || !lastAck) {
        return finish(fileName, TransmitError::cancelled(), options);
    }
    return finish(fileName,
                  FinalAck{
                      .ack = std::move(*lastAck),
                      .fileName = fileName,
                      .totalBytes = chunks.totalBytes(),
                      .totalChunks = chunks.totalChunks(),
                  },
                  options);
}

}  // namespace HealthUploader
