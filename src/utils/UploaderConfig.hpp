#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ConfigManager.hpp"

// Typed view of every ConfigManager entry the uploader consumes.
struct UploaderConfig {
    enum class Transport { Chunked, Presigned };

    static constexpr std::uint64_t kDefaultMaxFileSize = 500ULL * 1024 * 1024;

    std::string baseUrl;
    std::optional<std::string> authToken;
    std::vector<std::filesystem::path> files;
    std::optional<std::filesystem::path> logFile;
    std::uint64_t maxFileSize = kDefaultMaxFileSize;
    std::vector<std::string> allowedTypes{"*/*"};
    int maxRetries = 3;
    std::size_t parallelism = 3;
    std::optional<std::uint64_t> chunkSize;
    std::chrono::milliseconds chunkTimeout{30000};
    Transport transport = Transport::Chunked;
    bool process = true;

    /**
     * Reads every option from the manager. Malformed numbers are logged and
     * replaced by their default. A missing BASE_URL is an error.
     */
    static absl::StatusOr<UploaderConfig> load(ConfigManager& manager);
};
