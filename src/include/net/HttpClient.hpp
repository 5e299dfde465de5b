#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace HealthUploader::Net {

struct HttpResponse {
    long status{};
    std::string body;

    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

// A form field. Parts with a fileName carry raw bytes in data, the others
// carry text in value.
struct MultipartField {
    std::string name;
    std::string value;
    std::span<const uint8_t> data;
    std::optional<std::string> fileName;
    std::string contentType;
};

struct RequestOptions {
    // Zero means no limit.
    std::chrono::milliseconds timeout{0};
    std::stop_token stop;
};

using TransferProgress =
    std::function<void(std::uint64_t sent, std::uint64_t total)>;

/**
 * @brief Minimal HTTP surface used by the uploader.
 *
 * Transport failures come back as a non-OK status (Unavailable,
 * DeadlineExceeded on timeout, Cancelled when the stop token fired). Any
 * response the server produced, including 4xx and 5xx, is an HttpResponse.
 */
class HttpClient {
   public:
    virtual ~HttpClient() = default;

    virtual absl::StatusOr<HttpResponse> postMultipart(
        std::string_view url, const std::vector<MultipartField>& fields,
        const RequestOptions& options) = 0;

    virtual absl::StatusOr<HttpResponse> postJson(
        std::string_view url, std::string_view body,
        const RequestOptions& options) = 0;

    virtual absl::StatusOr<HttpResponse> get(std::string_view url,
                                             const RequestOptions& options) = 0;

    virtual absl::StatusOr<HttpResponse> put(
        std::string_view url, std::span<const uint8_t> body,
        std::string_view contentType, const RequestOptions& options,
        const TransferProgress& progress) = 0;
};

}  // namespace HealthUploader::Net
