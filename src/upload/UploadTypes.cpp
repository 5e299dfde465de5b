#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <upload/UploadTypes.hpp>

namespace HealthUploader {

UploadProgress UploadProgress::of(std::uint64_t loaded, std::uint64_t total) {
    UploadProgress progress{.loaded = loaded, .total = total};
    if (total == 0) {
        return progress;
    }
    if (loaded >= total) {
        progress.loaded = total;
        progress.percentage = 100;
        return progress;
    }
    auto rounded = static_cast<int>(std::lround(
        static_cast<double>(loaded) * 100.0 / static_cast<double>(total)));
    progress.percentage = std::min(rounded, 99);
    return progress;
}

absl::Status TransmitError::toStatus() const {
    std::string text = fmt::format("{}", *this);
    switch (code) {
        case Code::InvalidFile:
            return absl::InvalidArgumentError(text);
        case Code::FileTooLarge:
            return absl::ResourceExhaustedError(text);
        case Code::Unauthorized:
            return absl::UnauthenticatedError(text);
        case Code::Forbidden:
            return absl::PermissionDeniedError(text);
        case Code::UploadFailed:
            return absl::UnavailableError(text);
        case Code::Cancelled:
            return absl::CancelledError(text);
    }
    return absl::UnknownError(text);
}

TransmitError TransmitError::cancelled(std::string message) {
    return {.code = Code::Cancelled, .message = std::move(message)};
}

TransmitError::Code TransmitError::codeForHttpStatus(long httpStatus) {
    switch (httpStatus) {
        case 413:
            return Code::FileTooLarge;
        case 401:
            return Code::Unauthorized;
        case 403:
            return Code::Forbidden;
        default:
            return Code::UploadFailed;
    }
}

}  // namespace HealthUploader
