#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_join.h>
#include <fmt/format.h>

#include <algorithm>
#include <upload/FileValidator.hpp>

namespace HealthUploader {

namespace {

std::string humanSize(std::uint64_t bytes) {
    constexpr std::uint64_t kMiB = 1024 * 1024;
    if (bytes >= kMiB && bytes % kMiB == 0) {
        return fmt::format("{} MB", bytes / kMiB);
    }
    if (bytes >= kMiB) {
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / kMiB);
    }
    return fmt::format("{} bytes", bytes);
}

}  // namespace

bool FileValidator::typeAllowed(std::string_view contentType) const {
    const auto type = absl::AsciiStrToLower(
        absl::string_view(contentType.data(), contentType.size()));
    return std::ranges::any_of(
        options_.allowedTypes, [&type](const std::string& allowed) {
            if (allowed == "*/*") {
                return true;
            }
            const auto pattern = absl::AsciiStrToLower(allowed);
            if (absl::EndsWith(pattern, "/*")) {
                return absl::StartsWith(
                    type, pattern.substr(0, pattern.size() - 1));
            }
            return pattern == type;
        });
}

TransmitError FileValidator::toTransmitError(const absl::Status& status) {
    return {
        .code = absl::IsResourceExhausted(status)
                    ? TransmitError::Code::FileTooLarge
                    : TransmitError::Code::InvalidFile,
        .message = std::string(status.message()),
    };
}

absl::Status FileValidator::validate(const FileSource* file) const {
    if (file == nullptr) {
        return absl::InvalidArgumentError("No file provided");
    }
    if (file->size() == 0) {
        return absl::InvalidArgumentError(
            fmt::format("File '{}' is empty", file->name()));
    }
    if (file->size() > options_.maxFileSize) {
        return absl::ResourceExhaustedError(fmt::format(
            "File '{}' is {}, larger than the maximum of {}", file->name(),
            humanSize(file->size()), humanSize(options_.maxFileSize)));
    }
    if (const auto type = file->contentType(); !typeAllowed(type)) {
        return absl::InvalidArgumentError(fmt::format(
            "File type '{}' of '{}' is not allowed. Allowed types: {}", type,
            file->name(), absl::StrJoin(options_.allowedTypes, ", ")));
    }
    return absl::OkStatus();
}

}  // namespace HealthUploader
