#pragma once

#include <absl/status/status.h>
#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "FileSource.hpp"
#include "UploadSession.hpp"
#include "UploadTypes.hpp"

namespace HealthUploader {

/**
 * @brief A queue of files uploaded one after another.
 *
 * run() and retry() execute on the calling thread, cancelAll() may be
 * called from any other thread to stop the file in flight and everything
 * still pending.
 */
class UploadBatch {
   public:
    enum class FileState {
        Pending,
        Uploading,
        Processing,
        Completed,
        Error,
        Cancelled
    };

    struct Entry {
        std::string id;
        std::shared_ptr<const FileSource> file;
        FileState state = FileState::Pending;
        UploadProgress progress;
        // Last status text, or the error.
        std::string message;
        std::optional<SessionResult> result;
    };

    struct Counters {
        std::size_t total{};
        std::size_t completed{};
        std::size_t failed{};
    };

    using EntryUpdate = std::function<void(const Entry&)>;

    UploadBatch(UploadSession& session, SessionOptions options)
        : session_(session), options_(std::move(options)) {}

    // Queues a file and returns its id ("file-1", "file-2", ...).
    std::string add(std::shared_ptr<const FileSource> file);

    // Uploads every Pending entry in insertion order.
    void run();

    // Re-runs one Error or Cancelled entry from scratch.
    absl::Status retry(std::string_view id);
    void retryAllFailed();

    void cancelAll();

    [[nodiscard]] Counters counters() const;
    [[nodiscard]] std::vector<Entry> entries() const;
    [[nodiscard]] std::optional<Entry> find(std::string_view id) const;

    void setOnUpdate(EntryUpdate onUpdate) { onUpdate_ = std::move(onUpdate); }

   private:
    void runEntry(std::size_t index);
    // Applies fn to entry index under the lock, then notifies onUpdate_.
    void update(std::size_t index, const std::function<void(Entry&)>& fn);
    std::optional<std::size_t> indexOf(std::string_view id) const;

    UploadSession& session_;
    SessionOptions options_;
    EntryUpdate onUpdate_;

    mutable std::mutex lock_;
    std::vector<Entry> entries_;
    std::stop_source stop_;
    std::size_t nextId_ = 1;
};

}  // namespace HealthUploader

template <>
struct fmt::formatter<HealthUploader::UploadBatch::FileState>
    : formatter<string_view> {
    auto format(const HealthUploader::UploadBatch::FileState& s,
                format_context& ctx) const -> format_context::iterator {
        using State = HealthUploader::UploadBatch::FileState;
        std::string_view name = "unknown";
        switch (s) {
            case State::Pending:
                name = "pending";
                break;
            case State::Uploading:
                name = "uploading";
                break;
            case State::Processing:
                name = "processing";
                break;
            case State::Completed:
                name = "completed";
                break;
            case State::Error:
                name = "error";
                break;
            case State::Cancelled:
                name = "cancelled";
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};
