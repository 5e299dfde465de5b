#include <absl/status/status.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <json/json.h>

#include <memory>
#include <net/UploadEndpoints.hpp>
#include <string>

#include "mocks/HttpClient.hpp"

using HealthUploader::Net::HttpResponse;
using HealthUploader::Net::UploadEndpoints;
using testing::_;
using testing::HasSubstr;
using testing::Return;

namespace {
Json::Value parse(std::string_view body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errors;
    EXPECT_TRUE(reader->parse(body.data(), body.data() + body.size(), &value,
                              &errors))
        << errors;
    return value;
}
}  // namespace

class UploadEndpointsTest : public ::testing::Test {
   protected:
    MockHttpClient client;
    UploadEndpoints endpoints{client, "https://health.test/"};
};

TEST_F(UploadEndpointsTest, ParsesChunkAck) {
    auto ack = UploadEndpoints::parseChunkAck(
        {.status = 200,
         .body = R"({"success": true, "message": "File upload completed",
                     "isComplete": true, "checksum": "ab",
                     "url": "https://blob.test/x"})"});
    EXPECT_EQ(ack.httpStatus, 200);
    EXPECT_TRUE(ack.isComplete);
    EXPECT_EQ(ack.message, "File upload completed");
    EXPECT_EQ(ack.checksum, "ab");
    EXPECT_EQ(ack.url, "https://blob.test/x");
}

TEST_F(UploadEndpointsTest, ToleratesNonJsonAck) {
    auto ack = UploadEndpoints::parseChunkAck({.status = 200, .body = "OK"});
    EXPECT_EQ(ack.httpStatus, 200);
    EXPECT_FALSE(ack.isComplete);
    EXPECT_FALSE(ack.checksum.has_value());
}

TEST_F(UploadEndpointsTest, ErrorTextCombinesErrorAndDetails) {
    EXPECT_EQ(UploadEndpoints::errorText(
                  R"({"error": "Error processing chunk upload",
                      "details": "Server error"})",
                  "fallback"),
              "Error processing chunk upload: Server error");
    EXPECT_EQ(UploadEndpoints::errorText(R"({"error": "Unauthorized"})",
                                         "fallback"),
              "Unauthorized");
    EXPECT_EQ(UploadEndpoints::errorText("<html>", "fallback"), "fallback");
}

TEST_F(UploadEndpointsTest, ChunkErrorFallsBackToStatusText) {
    EXPECT_CALL(client, postMultipart(_, _, _))
        .WillOnce(Return(HttpResponse{.status = 502, .body = ""}));
    HealthUploader::ChunkDescriptor chunk{
        .bytes = {1}, .chunkNumber = 3, .totalChunks = 4, .size = 1};
    auto ack = endpoints.uploadChunk(chunk, "a.xml", "", {}, {});
    ASSERT_TRUE(ack.ok());
    EXPECT_EQ(ack->httpStatus, 502);
    EXPECT_EQ(ack->message, "Failed to upload chunk 3 (HTTP 502)");
}

TEST_F(UploadEndpointsTest, TransportErrorIsReturnedAsStatus) {
    EXPECT_CALL(client, postMultipart(_, _, _))
        .WillOnce(Return(absl::UnavailableError("Couldn't connect")));
    HealthUploader::ChunkDescriptor chunk{.bytes = {1}, .totalChunks = 1};
    auto ack = endpoints.uploadChunk(chunk, "a.xml", "", {}, {});
    EXPECT_TRUE(absl::IsUnavailable(ack.status()));
}

TEST_F(UploadEndpointsTest, StartProcessingReturnsId) {
    EXPECT_CALL(client, postJson("https://health.test/api/process", _, _))
        .WillOnce([](std::string_view, std::string_view body, const auto&) {
            auto json = parse(body);
            EXPECT_EQ(json["fileName"].asString(), "export.xml");
            EXPECT_EQ(json["key"].asString(), "uploads/export.xml");
            return jsonResponse(200, R"({"processingId": "process_1"})");
        });
    auto id = endpoints.startProcessing(
        "export.xml", std::string("uploads/export.xml"), {});
    ASSERT_TRUE(id.ok()) << id.status();
    EXPECT_EQ(*id, "process_1");
}

TEST_F(UploadEndpointsTest, StartProcessingFailureCarriesServerError) {
    EXPECT_CALL(client, postJson(_, _, _))
        .WillOnce(Return(jsonResponse(401, R"({"error": "Unauthorized"})")));
    auto id = endpoints.startProcessing("export.xml", std::nullopt, {});
    ASSERT_FALSE(id.ok());
    EXPECT_EQ(id.status().message(), "Unauthorized");
}

TEST_F(UploadEndpointsTest, StartProcessingWithoutIdIsInvalid) {
    EXPECT_CALL(client, postJson(_, _, _))
        .WillOnce(Return(jsonResponse(200, R"({"success": true})")));
    auto id = endpoints.startProcessing("export.xml", std::nullopt, {});
    EXPECT_TRUE(absl::IsInvalidArgument(id.status()));
}

TEST_F(UploadEndpointsTest, FetchStatusParsesFields) {
    EXPECT_CALL(client,
                get("https://health.test/api/process/status?id=process_1%2Fa",
                    _))
        .WillOnce(Return(jsonResponse(
            200, R"({"success": true, "completed": true,
                     "message": "Done", "results": [{"message": "weight"},
                     {"message": "heart rate"}]})")));
    auto status = endpoints.fetchStatus("process_1/a", {});
    ASSERT_TRUE(status.ok()) << status.status();
    EXPECT_TRUE(status->completed);
    EXPECT_FALSE(status->error.has_value());
    EXPECT_EQ(status->message, "Done");
    EXPECT_EQ(status->results,
              (std::vector<std::string>{"weight", "heart rate"}));
}

TEST_F(UploadEndpointsTest, FetchStatusReportsJobError) {
    EXPECT_CALL(client, get(_, _))
        .WillOnce(Return(jsonResponse(
            200, R"({"completed": false, "error": "Bad XML",
                     "progress": "Parsing"})")));
    auto status = endpoints.fetchStatus("p", {});
    ASSERT_TRUE(status.ok());
    EXPECT_FALSE(status->completed);
    EXPECT_EQ(status->error, "Bad XML");
    EXPECT_EQ(status->progress, "Parsing");
}

TEST_F(UploadEndpointsTest, FetchStatusHttpErrorIsUnavailable) {
    EXPECT_CALL(client, get(_, _))
        .WillOnce(Return(jsonResponse(
            404, R"({"success": false, "error": "Processing status not found"})")));
    auto status = endpoints.fetchStatus("p", {});
    EXPECT_TRUE(absl::IsUnavailable(status.status()));
    EXPECT_THAT(std::string(status.status().message()),
                HasSubstr("Processing status not found"));
}

TEST_F(UploadEndpointsTest, RequestUploadUrl) {
    EXPECT_CALL(client, postJson("https://health.test/api/upload-url", _, _))
        .WillOnce([](std::string_view, std::string_view body, const auto&) {
            auto json = parse(body);
            EXPECT_EQ(json["filename"].asString(), "export.xml");
            EXPECT_EQ(json["contentType"].asString(), "application/xml");
            return jsonResponse(
                200, R"({"url": "https://s3.test/put?sig=1",
                         "key": "uploads/export.xml"})");
        });
    auto target = endpoints.requestUploadUrl("export.xml", "application/xml", {});
    ASSERT_TRUE(target.ok()) << target.status();
    EXPECT_EQ(target->url, "https://s3.test/put?sig=1");
    EXPECT_EQ(target->key, "uploads/export.xml");
}
