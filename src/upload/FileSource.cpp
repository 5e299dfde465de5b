#include <absl/strings/ascii.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <array>
#include <system_error>
#include <upload/FileSource.hpp>
#include <utility>

namespace HealthUploader {

namespace {

struct ExtensionType {
    std::string_view extension;
    std::string_view contentType;
};

constexpr std::array<ExtensionType, 5> kKnownTypes{{
    {".xml", "application/xml"},
    {".pdf", "application/pdf"},
    {".csv", "text/csv"},
    {".json", "application/json"},
    {".zip", "application/zip"},
}};

constexpr std::string_view kFallbackType = "application/octet-stream";

}  // namespace

std::string FileSource::contentTypeFor(std::string_view fileName) {
    const auto ext = absl::AsciiStrToLower(
        std::filesystem::path(fileName).extension().string());
    auto it = std::ranges::find_if(kKnownTypes, [&ext](const auto& entry) {
        return entry.extension == ext;
    });
    if (it == kKnownTypes.end()) {
        return std::string(kFallbackType);
    }
    return std::string(it->contentType);
}

std::string FileSource::contentType() const { return contentTypeFor(name()); }

std::optional<DiskFileSource> DiskFileSource::open(std::filesystem::path path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        LOG(ERROR) << path << " is not a regular file";
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        LOG(ERROR) << "Cannot stat " << path << ": " << ec.message();
        return std::nullopt;
    }
    DiskFileSource source(std::move(path), size);
    if (!source.stream_.is_open()) {
        PLOG(ERROR) << "Cannot open " << source.path_;
        return std::nullopt;
    }
    return source;
}

DiskFileSource::DiskFileSource(std::filesystem::path path, std::uint64_t size)
    : path_(std::move(path)),
      size_(size),
      stream_(path_, std::ios::in | std::ios::binary) {}

DiskFileSource::DiskFileSource(DiskFileSource&& other) noexcept
    : path_(std::move(other.path_)),
      size_(other.size_),
      stream_(std::move(other.stream_)) {}

std::string DiskFileSource::name() const { return path_.filename().string(); }

std::optional<std::vector<uint8_t>> DiskFileSource::read(
    std::uint64_t offset, std::uint64_t length) const {
    if (offset > size_ || length > size_ - offset) {
        return std::nullopt;
    }
    std::vector<uint8_t> buffer(length);
    const std::lock_guard<std::mutex> lock(streamLock_);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(stream_.gcount()) != length) {
        LOG(ERROR) << "Short read on " << path_ << " at offset " << offset;
        return std::nullopt;
    }
    return buffer;
}

std::optional<std::vector<uint8_t>> MemoryFileSource::read(
    std::uint64_t offset, std::uint64_t length) const {
    if (offset > data_.size() || length > data_.size() - offset) {
        return std::nullopt;
    }
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(begin,
                                begin + static_cast<std::ptrdiff_t>(length));
}

std::string MemoryFileSource::contentType() const {
    if (contentType_) {
        return *contentType_;
    }
    return FileSource::contentType();
}

}  // namespace HealthUploader
