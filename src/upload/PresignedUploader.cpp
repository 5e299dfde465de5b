#include <absl/status/status.h>
#include <fmt/format.h>

#include <mutex>
#include <upload/FileValidator.hpp>
#include <upload/PresignedUploader.hpp>
#include <utility>

namespace HealthUploader {

namespace {

TransmitError fromStatus(const absl::Status& status) {
    if (absl::IsCancelled(status)) {
        return TransmitError::cancelled();
    }
    return {.code = TransmitError::Code::UploadFailed,
            .message = std::string(status.message())};
}

}  // namespace

UploadResult PresignedUploader::upload(std::shared_ptr<const FileSource> file,
                                       const UploadOptions& options) {
    const std::string fileName = file ? file->name() : std::string();
    const auto finish = [&](UploadResult result) {
        if (const auto* error = std::get_if<TransmitError>(&result);
            error != nullptr && options.onError) {
            options.onError(*error);
        }
        observer_.onUploadFinished(fileName, result);
        return result;
    };

    const FileValidator validator(options.validation);
    if (auto status = validator.validate(file.get()); !status.ok()) {
        observer_.onValidationFailed(fileName, status);
        return finish(FileValidator::toTransmitError(status));
    }
    if (options.stop.stop_requested()) {
        return finish(TransmitError::cancelled());
    }

    const auto contentType = file->contentType();
    auto target =
        endpoints_.requestUploadUrl(fileName, contentType, options.stop);
    if (!target.ok()) {
        return finish(fromStatus(target.status()));
    }
    auto body = file->read(0, file->size());
    if (!body) {
        return finish(TransmitError{
            .code = TransmitError::Code::UploadFailed,
            .message = fmt::format("Failed to read '{}'", fileName),
        });
    }
    observer_.onPlanned(fileName, file->size(), file->size(), 1);

    std::mutex progressLock;
    std::uint64_t reported = 0;
    const Net::TransferProgress progress = [&](std::uint64_t sent,
                                               std::uint64_t total) {
        const std::lock_guard<std::mutex> lock(progressLock);
        if (sent <= reported || !options.onProgress) {
            return;
        }
        reported = sent;
        options.onProgress(UploadProgress::of(sent, total));
    };

    auto response = endpoints_.putObject(*target, *body, contentType, progress,
                                         options.stop);
    if (!response.ok()) {
        return finish(fromStatus(response.status()));
    }
    if (!response->ok()) {
        return finish(TransmitError{
            .code = TransmitError::codeForHttpStatus(response->status),
            .message = fmt::format("Failed to upload to storage (HTTP {})",
                                   response->status),
            .details = {.httpStatus = response->status},
        });
    }
    if (reported < file->size() && options.onProgress) {
        options.onProgress(UploadProgress::of(file->size(), file->size()));
    }
    observer_.onChunkAcked(0, 1);

    return finish(FinalAck{
        .ack = {.httpStatus = response->status,
                .message = "File upload completed",
                .isComplete = true,
                .url = target->url},
        .fileName = fileName,
        .totalBytes = file->size(),
        .totalChunks = 1,
        .objectKey = target->key,
    });
}

}  // namespace HealthUploader
