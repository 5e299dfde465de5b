#pragma once

#include <curl/curl.h>

#include <optional>
#include <string>
#include <vector>

#include "HttpClient.hpp"

namespace HealthUploader::Net {

// HttpClient on libcurl, one easy handle per request. Safe to share
// between threads.
class CurlHttpClient : public HttpClient {
   public:
    explicit CurlHttpClient(std::optional<std::string> bearerToken = {});
    ~CurlHttpClient() override = default;

    absl::StatusOr<HttpResponse> postMultipart(
        std::string_view url, const std::vector<MultipartField>& fields,
        const RequestOptions& options) override;
    absl::StatusOr<HttpResponse> postJson(
        std::string_view url, std::string_view body,
        const RequestOptions& options) override;
    absl::StatusOr<HttpResponse> get(std::string_view url,
                                     const RequestOptions& options) override;
    absl::StatusOr<HttpResponse> put(std::string_view url,
                                     std::span<const uint8_t> body,
                                     std::string_view contentType,
                                     const RequestOptions& options,
                                     const TransferProgress& progress) override;

   private:
    // Applies URL, headers, timeout and the stop/progress callback, then
    // runs the transfer. Pre-signed URLs carry their own credentials, so
    // authorize is false for them.
    absl::StatusOr<HttpResponse> perform(
        CURL* curl, std::string_view url,
        const std::vector<std::string>& extraHeaders,
        const RequestOptions& options, const TransferProgress* progress,
        bool authorize) const;

    std::optional<std::string> bearerToken_;
};

}  // namespace HealthUploader::Net
