#include <absl/status/status.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <net/UploadEndpoints.hpp>
#include <upload/FileSource.hpp>
#include <upload/PresignedUploader.hpp>
#include <variant>
#include <vector>

#include "mocks/HttpClient.hpp"
#include "mocks/UploadObserver.hpp"

using HealthUploader::FinalAck;
using HealthUploader::MemoryFileSource;
using HealthUploader::PresignedUploader;
using HealthUploader::TransmitError;
using HealthUploader::UploadOptions;
using HealthUploader::UploadProgress;
using HealthUploader::Net::RequestOptions;
using HealthUploader::Net::TransferProgress;
using testing::_;
using testing::NiceMock;
using testing::Return;

class PresignedUploaderTest : public ::testing::Test {
   protected:
    PresignedUploaderTest() {
        ON_CALL(client, postJson("https://health.test/api/upload-url", _, _))
            .WillByDefault(Return(jsonResponse(
                200, R"({"url": "https://s3.test/obj?sig=abc",
                         "key": "uploads/u1/export.xml"})")));
    }

    std::shared_ptr<MemoryFileSource> file =
        std::make_shared<MemoryFileSource>("export.xml",
                                           std::vector<uint8_t>(1000, 'x'));
    MockHttpClient client;
    HealthUploader::Net::UploadEndpoints endpoints{client,
                                                   "https://health.test"};
    NiceMock<MockUploadObserver> observer;
    PresignedUploader uploader{endpoints, observer};
};

TEST_F(PresignedUploaderTest, PutsWholeFileAndReportsKey) {
    EXPECT_CALL(client, postJson(_, _, _)).Times(1);
    EXPECT_CALL(client, put("https://s3.test/obj?sig=abc", _,
                            "application/xml", _, _))
        .WillOnce([](std::string_view, std::span<const uint8_t> body,
                     std::string_view, const RequestOptions&,
                     const TransferProgress& progress) {
            EXPECT_EQ(body.size(), 1000U);
            progress(400, 1000);
            progress(400, 1000);
            progress(1000, 1000);
            return jsonResponse(200, "");
        });

    std::vector<UploadProgress> updates;
    UploadOptions options;
    options.onProgress = [&updates](const UploadProgress& p) {
        updates.push_back(p);
    };

    auto result = uploader.upload(file, options);
    ASSERT_TRUE(std::holds_alternative<FinalAck>(result));
    const auto& ack = std::get<FinalAck>(result);
    EXPECT_EQ(ack.objectKey, "uploads/u1/export.xml");
    EXPECT_EQ(ack.totalChunks, 1U);
    EXPECT_EQ(ack.totalBytes, 1000U);
    EXPECT_TRUE(ack.isComplete());

    ASSERT_EQ(updates.size(), 2U);
    EXPECT_EQ(updates[0].percentage, 40);
    EXPECT_EQ(updates[1].percentage, 100);
}

TEST_F(PresignedUploaderTest, StorageRejectionMapsToCode) {
    EXPECT_CALL(client, postJson(_, _, _)).Times(1);
    EXPECT_CALL(client, put(_, _, _, _, _))
        .WillOnce(Return(jsonResponse(403, "<Error>AccessDenied</Error>")));

    auto result = uploader.upload(file, {});
    ASSERT_TRUE(std::holds_alternative<TransmitError>(result));
    EXPECT_EQ(std::get<TransmitError>(result).code,
              TransmitError::Code::Forbidden);
}

TEST_F(PresignedUploaderTest, UrlRequestFailureIsUploadFailed) {
    EXPECT_CALL(client, postJson(_, _, _))
        .WillOnce(Return(jsonResponse(500, R"({"error": "S3 unavailable"})")));
    EXPECT_CALL(client, put(_, _, _, _, _)).Times(0);

    auto result = uploader.upload(file, {});
    ASSERT_TRUE(std::holds_alternative<TransmitError>(result));
    const auto& error = std::get<TransmitError>(result);
    EXPECT_EQ(error.code, TransmitError::Code::UploadFailed);
    EXPECT_NE(error.message.find("S3 unavailable"), std::string::npos);
}

TEST_F(PresignedUploaderTest, AbortedPutIsCancelled) {
    EXPECT_CALL(client, postJson(_, _, _)).Times(1);
    EXPECT_CALL(client, put(_, _, _, _, _))
        .WillOnce(Return(absl::CancelledError("aborted")));

    auto result = uploader.upload(file, {});
    ASSERT_TRUE(std::holds_alternative<TransmitError>(result));
    EXPECT_EQ(std::get<TransmitError>(result).code,
              TransmitError::Code::Cancelled);
}
