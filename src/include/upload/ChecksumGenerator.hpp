#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace HealthUploader {

class ChecksumGenerator {
   public:
    // Lowercase hex SHA-256 of data, 64 characters. std::nullopt if the
    // digest backend failed.
    [[nodiscard]] static std::optional<std::string> digest(
        std::span<const uint8_t> data);
};

}  // namespace HealthUploader
