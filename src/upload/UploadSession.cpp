#include <upload/PresignedUploader.hpp>
#include <upload/UploadSession.hpp>
#include <utility>
#include <variant>

namespace HealthUploader {

absl::StatusOr<SessionResult> UploadSession::run(
    std::shared_ptr<const FileSource> file, const SessionOptions& options) {
    UploadResult uploaded;
    if (options.transport == Transport::Presigned) {
        PresignedUploader uploader(endpoints_, observer_);
        uploaded = uploader.upload(std::move(file), options.upload);
    } else {
        ChunkTransmitter transmitter(endpoints_, sleeper_, observer_,
                                     chunkTimeout_);
        UploadCoordinator coordinator(transmitter, observer_);
        uploaded = coordinator.upload(std::move(file), options.upload);
    }
    if (const auto* error = std::get_if<TransmitError>(&uploaded);
        error != nullptr) {
        return error->toStatus();
    }

    SessionResult result{.upload = std::get<FinalAck>(std::move(uploaded))};
    if (options.onUploaded) {
        options.onUploaded(result.upload);
    }
    if (!options.process) {
        return result;
    }

    const auto stop = options.upload.stop;
    ProcessingJobPoller poller(sleeper_, observer_, options.polling);
    auto processed = poller.run(
        [&] {
            return endpoints_.startProcessing(result.upload.fileName,
                                              result.upload.objectKey, stop);
        },
        [&](std::string_view processingId) {
            return endpoints_.fetchStatus(processingId, stop);
        },
        options.onStatus, stop);
    if (!processed.ok()) {
        return processed.status();
    }
    result.processing = *std::move(processed);
    return result;
}

}  // namespace HealthUploader
