#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace HealthUploader {

// Random access view over the bytes of a file to upload.
class FileSource {
   public:
    virtual ~FileSource() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::uint64_t size() const = 0;
    /**
     * @brief Reads up to length bytes starting at offset.
     *
     * @return the bytes, or std::nullopt on an I/O failure or when the range
     * lies outside the file.
     */
    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> read(
        std::uint64_t offset, std::uint64_t length) const = 0;

    // Derived from the file name extension.
    [[nodiscard]] virtual std::string contentType() const;

    static std::string contentTypeFor(std::string_view fileName);
};

class DiskFileSource : public FileSource {
   public:
    // std::nullopt if the path is not a readable regular file.
    static std::optional<DiskFileSource> open(std::filesystem::path path);

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::uint64_t size() const override { return size_; }
    [[nodiscard]] std::optional<std::vector<uint8_t>> read(
        std::uint64_t offset, std::uint64_t length) const override;

    DiskFileSource(DiskFileSource&& other) noexcept;

   private:
    DiskFileSource(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::uint64_t size_;
    mutable std::ifstream stream_;
    mutable std::mutex streamLock_;
};

class MemoryFileSource : public FileSource {
   public:
    MemoryFileSource(std::string name, std::vector<uint8_t> data,
                     std::optional<std::string> contentType = std::nullopt)
        : name_(std::move(name)),
          data_(std::move(data)),
          contentType_(std::move(contentType)) {}

    [[nodiscard]] std::string name() const override { return name_; }
    [[nodiscard]] std::uint64_t size() const override { return data_.size(); }
    [[nodiscard]] std::optional<std::vector<uint8_t>> read(
        std::uint64_t offset, std::uint64_t length) const override;
    [[nodiscard]] std::string contentType() const override;

   private:
    std::string name_;
    std::vector<uint8_t> data_;
    std::optional<std::string> contentType_;
};

}  // namespace HealthUploader
