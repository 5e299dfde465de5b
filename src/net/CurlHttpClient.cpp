#include <absl/status/status.h>
#include <curl/curl.h>
#include <fmt/format.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <utility>
#include <net/CurlHttpClient.hpp>

namespace HealthUploader::Net {

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
struct MimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle newHandle() {
    static std::once_flag globalInit;
    std::call_once(globalInit, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            LOG(ERROR) << "curl_global_init failed";
        }
    });
    return CurlHandle(curl_easy_init());
}

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents),
                                             size * nmemb);
    return size * nmemb;
}

struct ProgressContext {
    const std::stop_token* stop;
    const TransferProgress* progress;
};

int xferInfoCallback(void* clientp, curl_off_t /*dltotal*/,
                     curl_off_t /*dlnow*/, curl_off_t ultotal,
                     curl_off_t ulnow) {
    const auto* ctx = static_cast<ProgressContext*>(clientp);
    if (ctx->stop->stop_requested()) {
        return 1;  // Abort the transfer
    }
    if (ctx->progress != nullptr && *ctx->progress && ultotal > 0) {
        (*ctx->progress)(static_cast<std::uint64_t>(ulnow),
                         static_cast<std::uint64_t>(ultotal));
    }
    return 0;
}

struct ReadCursor {
    std::span<const uint8_t> data;
    size_t position = 0;
};

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* cursor = static_cast<ReadCursor*>(userp);
    const size_t n =
        std::min(size * nitems, cursor->data.size() - cursor->position);
    std::memcpy(buffer, cursor->data.data() + cursor->position, n);
    cursor->position += n;
    return n;
}

absl::Status toStatus(CURLcode code, std::string_view url) {
    std::string message =
        fmt::format("{}: {}", url, curl_easy_strerror(code));
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return absl::DeadlineExceededError(message);
        case CURLE_ABORTED_BY_CALLBACK:
            return absl::CancelledError(message);
        default:
            return absl::UnavailableError(message);
    }
}

}  // namespace

CurlHttpClient::CurlHttpClient(std::optional<std::string> bearerToken)
    : bearerToken_(std::move(bearerToken)) {}

absl::StatusOr<HttpResponse> CurlHttpClient::perform(
    CURL* curl, std::string_view url,
    const std::vector<std::string>& extraHeaders,
    const RequestOptions& options, const TransferProgress* progress,
    bool authorize) const {
    if (options.stop.stop_requested()) {
        return absl::CancelledError("Request cancelled before start");
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers;
    auto appendHeader = [&headers](const std::string& header) {
        curl_slist* list = curl_slist_append(headers.get(), header.c_str());
        if (list != nullptr) {
            headers.release();
            headers.reset(list);
        }
    };
    if (authorize && bearerToken_) {
        appendHeader(fmt::format("Authorization: Bearer {}", *bearerToken_));
    }
    for (const auto& header : extraHeaders) {
        appendHeader(header);
    }

    const std::string urlString(url);
    HttpResponse response;
    ProgressContext progressContext{.stop = &options.stop,
                                    .progress = progress};

    curl_easy_setopt(curl, CURLOPT_URL, urlString.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    if (options.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(options.timeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferInfoCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progressContext);

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        DLOG(INFO) << "cURL error: " << curl_easy_strerror(res);
        return toStatus(res, url);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

absl::StatusOr<HttpResponse> CurlHttpClient::postMultipart(
    std::string_view url, const std::vector<MultipartField>& fields,
    const RequestOptions& options) {
    auto curl = newHandle();
    if (!curl) {
        return absl::InternalError("Failed to initialize cURL");
    }
    std::unique_ptr<curl_mime, MimeDeleter> mime(curl_mime_init(curl.get()));
    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, field.name.c_str());
        if (field.fileName) {
            curl_mime_data(part, reinterpret_cast<const char*>(field.data.data()),
                           field.data.size());
            curl_mime_filename(part, field.fileName->c_str());
            if (!field.contentType.empty()) {
                curl_mime_type(part, field.contentType.c_str());
            }
        } else {
            curl_mime_data(part, field.value.c_str(), CURL_ZERO_TERMINATED);
        }
    }
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    return perform(curl.get(), url, {}, options, nullptr, true);
}

absl::StatusOr<HttpResponse> CurlHttpClient::postJson(
    std::string_view url, std::string_view body,
    const RequestOptions& options) {
    auto curl = newHandle();
    if (!curl) {
        return absl::InternalError("Failed to initialize cURL");
    }
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_COPYPOSTFIELDS, body.data());
    return perform(curl.get(), url, {"Content-Type: application/json"},
                   options, nullptr, true);
}

absl::StatusOr<HttpResponse> CurlHttpClient::get(
    std::string_view url, const RequestOptions& options) {
    auto curl = newHandle();
    if (!curl) {
        return absl::InternalError("Failed to initialize cURL");
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    return perform(curl.get(), url, {}, options, nullptr, true);
}

absl::StatusOr<HttpResponse> CurlHttpClient::put(
    std::string_view url, std::span<const uint8_t> body,
    std::string_view contentType, const RequestOptions& options,
    const TransferProgress& progress) {
    auto curl = newHandle();
    if (!curl) {
        return absl::InternalError("Failed to initialize cURL");
    }
    ReadCursor cursor{.data = body};
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &cursor);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE,
                     static_cast<curl_off_t>(body.size()));
    return perform(curl.get(), url,
                   {fmt::format("Content-Type: {}", contentType)}, options,
                   &progress, false);
}

}  // namespace HealthUploader::Net
