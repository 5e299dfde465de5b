#include <absl/status/status.h>
#include <fmt/format.h>

#include <algorithm>
#include <upload/ChunkPlanner.hpp>
#include <utility>

namespace HealthUploader {

namespace {
constexpr std::uint64_t ceilDiv(std::uint64_t a, std::uint64_t b) {
    return (a + b - 1) / b;
}
}  // namespace

ChunkPlan::ChunkPlan(std::shared_ptr<const FileSource> file,
                     std::uint64_t chunkSize)
    : file_(std::move(file)),
      chunkSize_(chunkSize),
      totalChunks_(ceilDiv(file_->size(), chunkSize)) {}

absl::StatusOr<ChunkDescriptor> ChunkPlan::at(std::uint64_t index) const {
    if (index >= totalChunks_) {
        return absl::OutOfRangeError(
            fmt::format("Chunk {} out of {}", index, totalChunks_));
    }
    const std::uint64_t offset = index * chunkSize_;
    const std::uint64_t size = std::min(chunkSize_, file_->size() - offset);
    auto bytes = file_->read(offset, size);
    if (!bytes) {
        return absl::DataLossError(fmt::format(
            "Failed to read chunk {} of '{}'", index, file_->name()));
    }
    return ChunkDescriptor{
        .bytes = std::move(*bytes),
        .chunkNumber = index,
        .totalChunks = totalChunks_,
        .offset = offset,
        .size = size,
        .isLastChunk = index + 1 == totalChunks_,
    };
}

std::uint64_t ChunkPlanner::chooseChunkSize(std::uint64_t fileSize) {
    if (fileSize < kSmallFileLimit) {
        return std::clamp(ceilDiv(fileSize, kSmallTargetChunks),
                          kMinSmallChunk, kMaxSmallChunk);
    }
    if (fileSize < kMediumFileLimit) {
        return kMediumChunk;
    }
    return std::min(kMaxLargeChunk, ceilDiv(fileSize, kLargeTargetChunks));
}

absl::StatusOr<ChunkPlan> ChunkPlanner::plan(
    std::shared_ptr<const FileSource> file,
    std::optional<std::uint64_t> chunkSize) {
    if (!file || file->size() == 0) {
        return absl::InvalidArgumentError("Cannot plan an empty file");
    }
    if (chunkSize && *chunkSize == 0) {
        return absl::InvalidArgumentError("Chunk size must be positive");
    }
    const auto size = chunkSize.value_or(chooseChunkSize(file->size()));
    return ChunkPlan(std::move(file), size);
}

}  // namespace HealthUploader
