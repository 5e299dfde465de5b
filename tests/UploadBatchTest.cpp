#include <absl/status/status.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <net/UploadEndpoints.hpp>
#include <upload/FileSource.hpp>
#include <upload/UploadBatch.hpp>
#include <upload/UploadSession.hpp>
#include <string>
#include <utility>
#include <vector>

#include "mocks/HttpClient.hpp"
#include "mocks/Sleeper.hpp"
#include "mocks/UploadObserver.hpp"

using HealthUploader::JobState;
using HealthUploader::MemoryFileSource;
using HealthUploader::SessionOptions;
using HealthUploader::UploadBatch;
using HealthUploader::UploadSession;
using FileState = HealthUploader::UploadBatch::FileState;
using testing::_;
using testing::NiceMock;
using testing::Return;

namespace {
std::shared_ptr<MemoryFileSource> xmlFile(std::string name) {
    return std::make_shared<MemoryFileSource>(
        std::move(name), std::vector<uint8_t>(300, '<'));
}
}  // namespace

class UploadBatchTest : public ::testing::Test {
   protected:
    UploadBatchTest() {
        ON_CALL(client, postMultipart(_, _, _))
            .WillByDefault([this](std::string_view, const auto& fields,
                                  const auto&) {
                if (fieldValue(fields, "fileName") == rejectedFile) {
                    return jsonResponse(401, R"({"error": "Unauthorized"})");
                }
                return jsonResponse(200, R"({"isComplete": true,
                                             "message": "File upload completed"})");
            });
        ON_CALL(client, postJson(_, _, _))
            .WillByDefault(
                Return(jsonResponse(200, R"({"processingId": "process_7"})")));
        ON_CALL(client, get(_, _))
            .WillByDefault(Return(jsonResponse(
                200, R"({"completed": true, "message": "Imported",
                         "results": [{"message": "done"}]})")));
    }

    UploadBatch makeBatch(bool process = true) {
        SessionOptions options;
        options.process = process;
        return UploadBatch(session, options);
    }

    NiceMock<MockHttpClient> client;
    HealthUploader::Net::UploadEndpoints endpoints{client,
                                                   "https://health.test"};
    FakeSleeper sleeper;
    NiceMock<MockUploadObserver> observer;
    UploadSession session{endpoints, sleeper, observer};
    std::string rejectedFile;
};

TEST_F(UploadBatchTest, UploadsAndProcessesEveryFile) {
    auto batch = makeBatch();
    EXPECT_EQ(batch.add(xmlFile("a.xml")), "file-1");
    EXPECT_EQ(batch.add(xmlFile("b.xml")), "file-2");

    std::vector<FileState> seenStates;
    batch.setOnUpdate([&seenStates](const UploadBatch::Entry& entry) {
        if (entry.id == "file-1" &&
            (seenStates.empty() || seenStates.back() != entry.state)) {
            seenStates.push_back(entry.state);
        }
    });
    batch.run();

    const auto counters = batch.counters();
    EXPECT_EQ(counters.total, 2U);
    EXPECT_EQ(counters.completed, 2U);
    EXPECT_EQ(counters.failed, 0U);

    auto first = batch.find("file-1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->state, FileState::Completed);
    EXPECT_EQ(first->message, "Imported");
    EXPECT_EQ(first->progress.percentage, 100);
    ASSERT_TRUE(first->result.has_value());
    ASSERT_TRUE(first->result->processing.has_value());
    EXPECT_EQ(first->result->processing->state, JobState::Completed);
    EXPECT_EQ(first->result->processing->results,
              std::vector<std::string>{"done"});

    EXPECT_EQ(seenStates,
              (std::vector<FileState>{FileState::Uploading,
                                      FileState::Processing,
                                      FileState::Completed}));
}

TEST_F(UploadBatchTest, UploadOnlySkipsProcessing) {
    EXPECT_CALL(client, postJson(_, _, _)).Times(0);
    EXPECT_CALL(client, get(_, _)).Times(0);

    auto batch = makeBatch(false);
    batch.add(xmlFile("a.xml"));
    batch.run();

    auto entry = batch.find("file-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->state, FileState::Completed);
    ASSERT_TRUE(entry->result.has_value());
    EXPECT_FALSE(entry->result->processing.has_value());
    EXPECT_EQ(entry->message, "File upload completed");
}

TEST_F(UploadBatchTest, FailedFileCanBeRetried) {
    rejectedFile = "a.xml";
    auto batch = makeBatch();
    batch.add(xmlFile("a.xml"));
    batch.add(xmlFile("b.xml"));
    batch.run();

    auto counters = batch.counters();
    EXPECT_EQ(counters.completed, 1U);
    EXPECT_EQ(counters.failed, 1U);
    auto failed = batch.find("file-1");
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->state, FileState::Error);
    EXPECT_NE(failed->message.find("Unauthorized"), std::string::npos);

    rejectedFile.clear();
    batch.retryAllFailed();

    counters = batch.counters();
    EXPECT_EQ(counters.completed, 2U);
    EXPECT_EQ(counters.failed, 0U);
}

TEST_F(UploadBatchTest, RetryRejectsUnknownOrHealthyEntries) {
    auto batch = makeBatch(false);
    batch.add(xmlFile("a.xml"));
    batch.run();

    EXPECT_TRUE(absl::IsNotFound(batch.retry("file-9")));
    EXPECT_TRUE(absl::IsFailedPrecondition(batch.retry("file-1")));
}

TEST_F(UploadBatchTest, CancelAllStopsPendingFiles) {
    EXPECT_CALL(client, postMultipart(_, _, _)).Times(0);

    auto batch = makeBatch();
    batch.add(xmlFile("a.xml"));
    batch.add(xmlFile("b.xml"));
    batch.cancelAll();
    batch.run();

    for (const auto& entry : batch.entries()) {
        EXPECT_EQ(entry.state, FileState::Cancelled) << entry.id;
    }
    EXPECT_EQ(batch.counters().failed, 0U);
}

TEST_F(UploadBatchTest, CancelDuringProcessingMarksCancelled) {
    ON_CALL(client, get(_, _))
        .WillByDefault(Return(jsonResponse(200, R"({"completed": false})")));

    auto batch = makeBatch();
    batch.add(xmlFile("a.xml"));
    std::atomic_int sleeps = 0;
    sleeper.onSleep = [&](std::chrono::milliseconds) {
        if (++sleeps == 2) {
            batch.cancelAll();
        }
    };
    batch.run();

    auto entry = batch.find("file-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->state, FileState::Cancelled);

    // A cancelled file can be started again
    sleeper.onSleep = nullptr;
    ON_CALL(client, get(_, _))
        .WillByDefault(Return(jsonResponse(200, R"({"completed": true})")));
    EXPECT_TRUE(batch.retry("file-1").ok());
    EXPECT_EQ(batch.find("file-1")->state, FileState::Completed);
}
