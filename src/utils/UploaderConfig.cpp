#include "UploaderConfig.hpp"

#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include <LogCompat.hpp>
#include <string_view>

namespace {

template <typename T>
void parseNumber(ConfigManager& manager, ConfigManager::Configs config,
                 std::string_view name, T& out) {
    auto value = manager.get(config);
    if (!value) {
        return;
    }
    T parsed{};
    if (!absl::SimpleAtoi(*value, &parsed) || parsed <= 0) {
        LOG(WARNING) << "Ignoring invalid " << name << "='" << *value
                     << "', keeping " << out;
        return;
    }
    out = parsed;
}

std::vector<std::string> splitList(std::string_view value) {
    std::vector<std::string> out;
    for (absl::string_view part :
         absl::StrSplit(absl::string_view(value.data(), value.size()), ',')) {
        part = absl::StripAsciiWhitespace(part);
        if (!part.empty()) {
            out.emplace_back(part);
        }
    }
    return out;
}

}  // namespace

absl::StatusOr<UploaderConfig> UploaderConfig::load(ConfigManager& manager) {
    UploaderConfig config;

    auto baseUrl = manager.get(ConfigManager::Configs::BASE_URL);
    if (!baseUrl || baseUrl->empty()) {
        return absl::InvalidArgumentError("BASE_URL is required");
    }
    config.baseUrl = std::string(absl::StripSuffix(*baseUrl, "/"));
    config.authToken = manager.get(ConfigManager::Configs::AUTH_TOKEN);

    if (auto files = manager.get(ConfigManager::Configs::FILES); files) {
        for (auto& file : splitList(*files)) {
            config.files.emplace_back(file);
        }
    }
    if (auto logFile = manager.get(ConfigManager::Configs::LOG_FILE);
        logFile && !logFile->empty()) {
        config.logFile = *logFile;
    }
    if (auto types = manager.get(ConfigManager::Configs::ALLOWED_TYPES);
        types) {
        auto list = splitList(*types);
        if (!list.empty()) {
            config.allowedTypes = std::move(list);
        }
    }

    parseNumber(manager, ConfigManager::Configs::MAX_FILE_SIZE,
                "MAX_FILE_SIZE", config.maxFileSize);
    parseNumber(manager, ConfigManager::Configs::MAX_RETRIES, "MAX_RETRIES",
                config.maxRetries);
    parseNumber(manager, ConfigManager::Configs::PARALLELISM, "PARALLELISM",
                config.parallelism);

    std::uint64_t chunkSize = 0;
    parseNumber(manager, ConfigManager::Configs::CHUNK_SIZE, "CHUNK_SIZE",
                chunkSize);
    if (chunkSize != 0) {
        config.chunkSize = chunkSize;
    }

    std::int64_t timeoutMs = config.chunkTimeout.count();
    parseNumber(manager, ConfigManager::Configs::CHUNK_TIMEOUT_MS,
                "CHUNK_TIMEOUT_MS", timeoutMs);
    config.chunkTimeout = std::chrono::milliseconds(timeoutMs);

    if (auto transport = manager.get(ConfigManager::Configs::TRANSPORT);
        transport) {
        const auto lowered = absl::AsciiStrToLower(*transport);
        if (lowered == "presigned") {
            config.transport = Transport::Presigned;
        } else if (lowered != "chunked") {
            LOG(WARNING) << "Unknown TRANSPORT '" << *transport
                         << "', using chunked";
        }
    }
    config.process = !manager.has(ConfigManager::Configs::NO_PROCESS);
    return config;
}
