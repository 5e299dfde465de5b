#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

#include "HttpClient.hpp"
#include "upload/UploadTypes.hpp"

namespace HealthUploader::Net {

// Target of a pre-signed PUT.
struct PresignedTarget {
    std::string url;
    std::string key;
};

/**
 * @brief Wire format of the upload server.
 *
 * POST {base}/api/upload-chunk       multipart chunk upload
 * POST {base}/api/process            starts a processing job
 * GET  {base}/api/process/status?id= job status
 * POST {base}/api/upload-url         pre-signed PUT target
 */
class UploadEndpoints {
   public:
    static constexpr std::string_view kUploadChunkPath = "/api/upload-chunk";
    static constexpr std::string_view kProcessPath = "/api/process";
    static constexpr std::string_view kStatusPath = "/api/process/status";
    static constexpr std::string_view kUploadUrlPath = "/api/upload-url";

    UploadEndpoints(HttpClient& client, std::string baseUrl);

    /**
     * @brief Sends one chunk.
     *
     * Any HTTP answer becomes a ServerAck, with httpStatus set and, for
     * non-2xx answers, message holding the server's error text. Only
     * transport failures are returned as a status.
     */
    absl::StatusOr<ServerAck> uploadChunk(const ChunkDescriptor& chunk,
                                          std::string_view fileName,
                                          std::string_view checksum,
                                          std::chrono::milliseconds timeout,
                                          std::stop_token stop);

    // Returns the processingId of the new job.
    absl::StatusOr<std::string> startProcessing(
        std::string_view fileName, const std::optional<std::string>& objectKey,
        std::stop_token stop);

    absl::StatusOr<JobStatus> fetchStatus(std::string_view processingId,
                                          std::stop_token stop);

    absl::StatusOr<PresignedTarget> requestUploadUrl(std::string_view fileName,
                                                     std::string_view contentType,
                                                     std::stop_token stop);

    absl::StatusOr<HttpResponse> putObject(const PresignedTarget& target,
                                           std::span<const uint8_t> body,
                                           std::string_view contentType,
                                           const TransferProgress& progress,
                                           std::stop_token stop);

    [[nodiscard]] const std::string& baseUrl() const { return baseUrl_; }

    // Parses a chunk response body. Missing or malformed fields are left
    // at their defaults.
    static ServerAck parseChunkAck(const HttpResponse& response);
    // Text of {"error": ..., "details": ...}, or fallback.
    static std::string errorText(std::string_view body,
                                 std::string_view fallback);

   private:
    std::string url(std::string_view path) const;

    HttpClient& client_;
    std::string baseUrl_;
};

}  // namespace HealthUploader::Net
