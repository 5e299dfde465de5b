#pragma once

#include <absl/status/status.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "FileSource.hpp"
#include "UploadTypes.hpp"

namespace HealthUploader {

struct ValidatorOptions {
    static constexpr std::uint64_t kDefaultMaxFileSize = 500ULL * 1024 * 1024;

    std::uint64_t maxFileSize = kDefaultMaxFileSize;
    // Entries are "*/*", "type/*" or an exact "type/subtype".
    std::vector<std::string> allowedTypes{"*/*"};
};

class FileValidator {
   public:
    explicit FileValidator(ValidatorOptions options = {})
        : options_(std::move(options)) {}

    /**
     * @brief Checks a candidate file before any bytes are sent.
     *
     * @return OkStatus, or InvalidArgument for a missing/empty file or a
     * disallowed content type, or ResourceExhausted when the file exceeds
     * the size limit. The message is meant for the user.
     */
    [[nodiscard]] absl::Status validate(const FileSource* file) const;

    // FileTooLarge for ResourceExhausted, InvalidFile otherwise.
    static TransmitError toTransmitError(const absl::Status& status);

    [[nodiscard]] bool typeAllowed(std::string_view contentType) const;

    [[nodiscard]] const ValidatorOptions& options() const { return options_; }

   private:
    ValidatorOptions options_;
};

}  // namespace HealthUploader
