#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <upload/UploadBatch.hpp>
#include <utility>

namespace HealthUploader {

std::string UploadBatch::add(std::shared_ptr<const FileSource> file) {
    const std::lock_guard<std::mutex> guard(lock_);
    auto id = absl::StrCat("file-", nextId_++);
    entries_.push_back({.id = id, .file = std::move(file)});
    return id;
}

std::optional<std::size_t> UploadBatch::indexOf(std::string_view id) const {
    auto it = std::ranges::find_if(
        entries_, [id](const Entry& entry) { return entry.id == id; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - entries_.begin());
}

void UploadBatch::update(std::size_t index,
                         const std::function<void(Entry&)>& fn) {
    Entry snapshot;
    {
        const std::lock_guard<std::mutex> guard(lock_);
        fn(entries_[index]);
        snapshot = entries_[index];
    }
    if (onUpdate_) {
        onUpdate_(snapshot);
    }
}

void UploadBatch::runEntry(std::size_t index) {
    std::shared_ptr<const FileSource> file;
    std::stop_token stop;
    {
        const std::lock_guard<std::mutex> guard(lock_);
        file = entries_[index].file;
        stop = stop_.get_token();
    }
    if (stop.stop_requested()) {
        update(index, [](Entry& entry) {
            entry.state = FileState::Cancelled;
            entry.message = "Upload cancelled";
        });
        return;
    }
    update(index, [](Entry& entry) {
        entry.state = FileState::Uploading;
        entry.progress = {};
        entry.message.clear();
        entry.result.reset();
    });

    SessionOptions options = options_;
    options.upload.stop = stop;
    options.upload.onProgress = [this, index](const UploadProgress& progress) {
        update(index, [&progress](Entry& entry) { entry.progress = progress; });
    };
    options.onUploaded = [this, index](const FinalAck& ack) {
        update(index, [&ack, process = options_.process](Entry& entry) {
            entry.message = ack.message();
            if (process) {
                entry.state = FileState::Processing;
            }
        });
    };
    options.onStatus = [this, index](std::string_view message) {
        update(index,
               [message](Entry& entry) { entry.message = std::string(message); });
    };

    auto result = session_.run(file, options);
    update(index, [&result](Entry& entry) {
        if (result.ok()) {
            entry.state = FileState::Completed;
            if (result->processing) {
                entry.message = result->processing->message;
            }
            entry.result = *std::move(result);
        } else if (absl::IsCancelled(result.status())) {
            entry.state = FileState::Cancelled;
            entry.message = "Upload cancelled";
        } else {
            entry.state = FileState::Error;
            entry.message = std::string(result.status().message());
        }
    });
}

void UploadBatch::run() {
    for (std::size_t index = 0;; ++index) {
        {
            const std::lock_guard<std::mutex> guard(lock_);
            if (index >= entries_.size()) {
                break;
            }
            if (entries_[index].state != FileState::Pending) {
                continue;
            }
        }
        runEntry(index);
    }
}

absl::Status UploadBatch::retry(std::string_view id) {
    std::size_t index = 0;
    {
        const std::lock_guard<std::mutex> guard(lock_);
        auto found = indexOf(id);
        if (!found) {
            return absl::NotFoundError(absl::StrCat(
                "No upload with id ", absl::string_view(id.data(), id.size())));
        }
        index = *found;
        const auto state = entries_[index].state;
        if (state != FileState::Error && state != FileState::Cancelled) {
            return absl::FailedPreconditionError(
                absl::StrCat(absl::string_view(id.data(), id.size()),
                             " has not failed"));
        }
        if (stop_.stop_requested()) {
            // A previous cancelAll() must not block an explicit retry
            stop_ = std::stop_source();
        }
    }
    LOG(INFO) << "Retrying " << id;
    runEntry(index);
    return absl::OkStatus();
}

void UploadBatch::retryAllFailed() {
    std::vector<std::string> failed;
    {
        const std::lock_guard<std::mutex> guard(lock_);
        for (const auto& entry : entries_) {
            if (entry.state == FileState::Error) {
                failed.emplace_back(entry.id);
            }
        }
    }
    for (const auto& id : failed) {
        if (auto status = retry(id); !status.ok()) {
            LOG(WARNING) << "Retry of " << id << " failed: " << status;
        }
    }
}

void UploadBatch::cancelAll() {
    std::vector<Entry> cancelled;
    {
        const std::lock_guard<std::mutex> guard(lock_);
        stop_.request_stop();
        for (auto& entry : entries_) {
            if (entry.state == FileState::Pending) {
                entry.state = FileState::Cancelled;
                entry.message = "Upload cancelled";
                cancelled.push_back(entry);
            }
        }
    }
    if (onUpdate_) {
        for (const auto& entry : cancelled) {
            onUpdate_(entry);
        }
    }
}

UploadBatch::Counters UploadBatch::counters() const {
    const std::lock_guard<std::mutex> guard(lock_);
    Counters counters{.total = entries_.size()};
    for (const auto& entry : entries_) {
        if (entry.state == FileState::Completed) {
            ++counters.completed;
        } else if (entry.state == FileState::Error) {
            ++counters.failed;
        }
    }
    return counters;
}

std::vector<UploadBatch::Entry> UploadBatch::entries() const {
    const std::lock_guard<std::mutex> guard(lock_);
    return entries_;
}

std::optional<UploadBatch::Entry> UploadBatch::find(std::string_view id) const {
    const std::lock_guard<std::mutex> guard(lock_);
    if (auto index = indexOf(id); index) {
        return entries_[*index];
    }
    return std::nullopt;
}

}  // namespace HealthUploader
