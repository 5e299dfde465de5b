#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>
#include <fmt/format.h>
#include <json/json.h>

#include <LogCompat.hpp>
#include <cctype>
#include <memory>
#include <net/UploadEndpoints.hpp>
#include <utility>
#include <vector>

namespace HealthUploader::Net {

namespace {

std::optional<Json::Value> parseJson(std::string_view body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &value,
                       &errors)) {
        DLOG(INFO) << "Invalid JSON: " << errors;
        return std::nullopt;
    }
    return value;
}

std::string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::optional<std::string> stringMember(const Json::Value& root,
                                        const char* name) {
    if (root.isObject() && root.isMember(name) && root[name].isString()) {
        return root[name].asString();
    }
    return std::nullopt;
}

std::string urlEncode(std::string_view text) {
    std::string out;
    for (const char c : text) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) != 0 || c == '-' || c == '_' || c == '.' ||
            c == '~') {
            out += c;
        } else {
            out += fmt::format("%{:02X}", u);
        }
    }
    return out;
}

}  // namespace

UploadEndpoints::UploadEndpoints(HttpClient& client, std::string baseUrl)
    : client_(client),
      baseUrl_(absl::StripSuffix(baseUrl, "/")) {}

std::string UploadEndpoints::url(std::string_view path) const {
    return absl::StrCat(baseUrl_, absl::string_view(path.data(), path.size()));
}

std::string UploadEndpoints::errorText(std::string_view body,
                                       std::string_view fallback) {
    auto root = parseJson(body);
    if (!root) {
        return std::string(fallback);
    }
    auto error = stringMember(*root, "error");
    auto details = stringMember(*root, "details");
    if (error && details) {
        return absl::StrCat(*error, ": ", *details);
    }
    if (error) {
        return *error;
    }
    return std::string(fallback);
}

ServerAck UploadEndpoints::parseChunkAck(const HttpResponse& response) {
    ServerAck ack{.httpStatus = response.status};
    auto root = parseJson(response.body);
    if (!root || !root->isObject()) {
        return ack;
    }
    ack.checksum = stringMember(*root, "checksum");
    ack.url = stringMember(*root, "url");
    if (auto message = stringMember(*root, "message"); message) {
        ack.message = *message;
    }
    if ((*root)["isComplete"].isBool()) {
        ack.isComplete = (*root)["isComplete"].asBool();
    }
    return ack;
}

absl::StatusOr<ServerAck> UploadEndpoints::uploadChunk(
    const ChunkDescriptor& chunk, std::string_view fileName,
    std::string_view checksum, std::chrono::milliseconds timeout,
    std::stop_token stop) {
    const std::vector<MultipartField> fields{
        {.name = "chunk",
         .data = chunk.bytes,
         .fileName = std::string(fileName),
         .contentType = "application/octet-stream"},
        {.name = "chunkNumber", .value = std::to_string(chunk.chunkNumber)},
        {.name = "totalChunks", .value = std::to_string(chunk.totalChunks)},
        {.name = "isLastChunk", .value = chunk.isLastChunk ? "true" : "false"},
        {.name = "fileName", .value = std::string(fileName)},
        {.name = "checksum", .value = std::string(checksum)},
    };
    auto response = client_.postMultipart(
        url(kUploadChunkPath), fields,
        {.timeout = timeout, .stop = std::move(stop)});
    if (!response.ok()) {
        return response.status();
    }
    auto ack = parseChunkAck(*response);
    if (!response->ok()) {
        ack.message = errorText(
            response->body, fmt::format("Failed to upload chunk {} (HTTP {})",
                                        chunk.chunkNumber, response->status));
    }
    return ack;
}

absl::StatusOr<std::string> UploadEndpoints::startProcessing(
    std::string_view fileName, const std::optional<std::string>& objectKey,
    std::stop_token stop) {
    Json::Value body;
    body["fileName"] = std::string(fileName);
    if (objectKey) {
        body["key"] = *objectKey;
    }
    auto response = client_.postJson(url(kProcessPath), writeJson(body),
                                     {.stop = std::move(stop)});
    if (!response.ok()) {
        return response.status();
    }
    if (!response->ok()) {
        return absl::FailedPreconditionError(
            errorText(response->body, "Failed to start processing"));
    }
    auto root = parseJson(response->body);
    if (!root) {
        return absl::DataLossError("Malformed response from " +
                                   std::string(kProcessPath));
    }
    auto processingId = stringMember(*root, "processingId");
    if (!processingId || processingId->empty()) {
        return absl::InvalidArgumentError("Response carries no processingId");
    }
    return *processingId;
}

absl::StatusOr<JobStatus> UploadEndpoints::fetchStatus(
    std::string_view processingId, std::stop_token stop) {
    auto response =
        client_.get(absl::StrCat(url(kStatusPath), "?id=",
                                 urlEncode(processingId)),
                    {.stop = std::move(stop)});
    if (!response.ok()) {
        return response.status();
    }
    if (!response->ok()) {
        return absl::UnavailableError(errorText(
            response->body, fmt::format("Failed to check processing status "
                                        "(HTTP {})",
                                        response->status)));
    }
    auto root = parseJson(response->body);
    if (!root || !root->isObject()) {
        return absl::DataLossError("Malformed processing status");
    }
    JobStatus status;
    status.completed =
        (*root)["completed"].isBool() && (*root)["completed"].asBool();
    status.error = stringMember(*root, "error");
    status.progress = stringMember(*root, "progress");
    if (auto message = stringMember(*root, "message"); message) {
        status.message = *message;
    }
    if (const auto& results = (*root)["results"]; results.isArray()) {
        for (const auto& entry : results) {
            if (entry.isString()) {
                status.results.emplace_back(entry.asString());
            } else if (auto message = stringMember(entry, "message");
                       message) {
                status.results.emplace_back(std::move(*message));
            }
        }
    }
    return status;
}

absl::StatusOr<PresignedTarget> UploadEndpoints::requestUploadUrl(
    std::string_view fileName, std::string_view contentType,
    std::stop_token stop) {
    Json::Value body;
    body["filename"] = std::string(fileName);
    body["contentType"] = std::string(contentType);
    auto response = client_.postJson(url(kUploadUrlPath), writeJson(body),
                                     {.stop = std::move(stop)});
    if (!response.ok()) {
        return response.status();
    }
    if (!response->ok()) {
        return absl::FailedPreconditionError(absl::StrCat(
            "Failed to get upload URL: ",
            errorText(response->body,
                      fmt::format("HTTP {}", response->status))));
    }
    auto root = parseJson(response->body);
    if (!root) {
        return absl::DataLossError("Malformed upload URL response");
    }
    auto target = stringMember(*root, "url");
    auto key = stringMember(*root, "key");
    if (!target || !key) {
        return absl::InvalidArgumentError(
            "Upload URL response lacks url or key");
    }
    return PresignedTarget{.url = std::move(*target), .key = std::move(*key)};
}

absl::StatusOr<HttpResponse> UploadEndpoints::putObject(
    const PresignedTarget& target, std::span<const uint8_t> body,
    std::string_view contentType, const TransferProgress& progress,
    std::stop_token stop) {
    return client_.put(target.url, body, contentType,
                       {.stop = std::move(stop)}, progress);
}

}  // namespace HealthUploader::Net
