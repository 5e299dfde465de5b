#pragma once

#include <absl/status/status.h>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace HealthUploader {

// One contiguous slice of a file, numbered from 0.
struct ChunkDescriptor {
    std::vector<uint8_t> bytes;
    std::uint64_t chunkNumber{};
    std::uint64_t totalChunks{};
    std::uint64_t offset{};
    std::uint64_t size{};
    bool isLastChunk{};
};

struct UploadProgress {
    std::uint64_t loaded{};
    std::uint64_t total{};
    int percentage{};

    // Rounded to the nearest integer, 100 only once everything is loaded.
    static UploadProgress of(std::uint64_t loaded, std::uint64_t total);
};

struct TransmitError {
    enum class Code {
        InvalidFile,
        FileTooLarge,
        Unauthorized,
        Forbidden,
        UploadFailed,
        Cancelled,
    } code{};
    std::string message;
    struct Details {
        std::optional<std::uint64_t> chunkNumber;
        std::optional<int> attempt;
        std::optional<long> httpStatus;
    } details;

    [[nodiscard]] absl::Status toStatus() const;
    static TransmitError cancelled(std::string message = "Upload cancelled");
    // 413, 401 and 403 have their own codes, everything else is UploadFailed.
    static Code codeForHttpStatus(long httpStatus);
};

// Server acknowledgement of a single chunk (or of the whole object).
struct ServerAck {
    long httpStatus{};
    std::optional<std::string> checksum;
    std::string message;
    bool isComplete{};
    std::optional<std::string> url;
};

// Result of a fully transmitted file.
struct FinalAck {
    ServerAck ack;
    std::string fileName;
    std::uint64_t totalBytes{};
    std::uint64_t totalChunks{};
    // Set when the object went through a pre-signed PUT.
    std::optional<std::string> objectKey;

    [[nodiscard]] bool isComplete() const { return ack.isComplete; }
    [[nodiscard]] const std::string& message() const { return ack.message; }
    [[nodiscard]] const std::optional<std::string>& url() const {
        return ack.url;
    }
};

using SendResult = std::variant<ServerAck, TransmitError>;
using UploadResult = std::variant<FinalAck, TransmitError>;

enum class JobState { Started, Polling, Completed, Failed, TimedOut };

// One observation of the server side processing job.
struct JobStatus {
    bool completed{};
    std::optional<std::string> error;
    std::optional<std::string> progress;
    std::string message;
    // results[].message in server order.
    std::vector<std::string> results;
};

// Lifetime record of a processing job, terminal once Completed, Failed or
// TimedOut.
struct ProcessingResult {
    std::string processingId;
    JobState state{};
    std::string message;
    std::string lastProgressMessage;
    std::vector<std::string> results;
    int checks{};
};

}  // namespace HealthUploader

template <>
struct fmt::formatter<HealthUploader::TransmitError::Code>
    : formatter<string_view> {
    auto format(const HealthUploader::TransmitError::Code& c,
                format_context& ctx) const -> format_context::iterator {
        using Code = HealthUploader::TransmitError::Code;
        std::string_view name = "unknown";
        switch (c) {
            case Code::InvalidFile:
                name = "InvalidFile";
                break;
            case Code::FileTooLarge:
                name = "FileTooLarge";
                break;
            case Code::Unauthorized:
                name = "Unauthorized";
                break;
            case Code::Forbidden:
                name = "Forbidden";
                break;
            case Code::UploadFailed:
                name = "UploadFailed";
                break;
            case Code::Cancelled:
                name = "Cancelled";
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<HealthUploader::JobState> : formatter<string_view> {
    auto format(const HealthUploader::JobState& s,
                format_context& ctx) const -> format_context::iterator {
        using HealthUploader::JobState;
        std::string_view name = "unknown";
        switch (s) {
            case JobState::Started:
                name = "Started";
                break;
            case JobState::Polling:
                name = "Polling";
                break;
            case JobState::Completed:
                name = "Completed";
                break;
            case JobState::Failed:
                name = "Failed";
                break;
            case JobState::TimedOut:
                name = "TimedOut";
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<HealthUploader::TransmitError> {
    static constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    static auto format(const HealthUploader::TransmitError& error,
                       fmt::format_context& ctx) {
        auto out = fmt::format_to(ctx.out(), "{}: {}", error.code,
                                  error.message);
        if (error.details.chunkNumber) {
            out = fmt::format_to(out, " (chunk {}",
                                 *error.details.chunkNumber);
            if (error.details.attempt) {
                out = fmt::format_to(out, ", attempt {}",
                                     *error.details.attempt);
            }
            if (error.details.httpStatus) {
                out = fmt::format_to(out, ", HTTP {}",
                                     *error.details.httpStatus);
            }
            out = fmt::format_to(out, ")");
        }
        return out;
    }
};
