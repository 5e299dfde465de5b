#include <absl/strings/escaping.h>

#include <hash/sha256.hpp>
#include <string_view>
#include <upload/ChecksumGenerator.hpp>

namespace HealthUploader {

std::optional<std::string> ChecksumGenerator::digest(
    std::span<const uint8_t> data) {
    auto result = SHA256::compute(data.data(), data.size());
    if (!result) {
        return std::nullopt;
    }
    return absl::BytesToHexString(absl::string_view(
        reinterpret_cast<const char*>(result->data()), result->size()));
}

}  // namespace HealthUploader
