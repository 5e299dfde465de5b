#pragma once

#include <absl/status/statusor.h>

#include <cstdint>
#include <memory>
#include <optional>

#include "FileSource.hpp"
#include "UploadTypes.hpp"

namespace HealthUploader {

// Ordered, lazily materialised partition of a file into chunks.
class ChunkPlan {
   public:
    ChunkPlan(std::shared_ptr<const FileSource> file, std::uint64_t chunkSize);

    [[nodiscard]] std::uint64_t chunkSize() const { return chunkSize_; }
    [[nodiscard]] std::uint64_t totalChunks() const { return totalChunks_; }
    [[nodiscard]] std::uint64_t totalBytes() const { return file_->size(); }
    [[nodiscard]] const FileSource& file() const { return *file_; }

    // Reads the bytes of chunk index. OutOfRange past the end, DataLoss on
    // read failure.
    [[nodiscard]] absl::StatusOr<ChunkDescriptor> at(std::uint64_t index) const;

   private:
    std::shared_ptr<const FileSource> file_;
    std::uint64_t chunkSize_;
    std::uint64_t totalChunks_;
};

class ChunkPlanner {
   public:
    static constexpr std::uint64_t kKiB = 1024;
    static constexpr std::uint64_t kMiB = 1024 * kKiB;

    static constexpr std::uint64_t kSmallFileLimit = 10 * kMiB;
    static constexpr std::uint64_t kMediumFileLimit = 100 * kMiB;
    static constexpr std::uint64_t kSmallTargetChunks = 20;
    static constexpr std::uint64_t kLargeTargetChunks = 50;
    static constexpr std::uint64_t kMinSmallChunk = 64 * kKiB;
    static constexpr std::uint64_t kMaxSmallChunk = 1 * kMiB;
    static constexpr std::uint64_t kMediumChunk = 1 * kMiB;
    static constexpr std::uint64_t kMaxLargeChunk = 10 * kMiB;

    /**
     * @brief Picks the chunk size for a file of the given size.
     *
     * Below 10 MiB it aims for about 20 chunks (64 KiB to 1 MiB each),
     * below 100 MiB it uses 1 MiB, above that it aims for about 50 chunks
     * capped at 10 MiB.
     */
    [[nodiscard]] static std::uint64_t chooseChunkSize(std::uint64_t fileSize);

    /**
     * @brief Partitions the file. A chunkSize override wins over the tiered
     * policy. InvalidArgument for an empty file or a zero chunk size.
     */
    [[nodiscard]] static absl::StatusOr<ChunkPlan> plan(
        std::shared_ptr<const FileSource> file,
        std::optional<std::uint64_t> chunkSize = std::nullopt);
};

}  // namespace HealthUploader
