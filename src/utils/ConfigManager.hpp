#pragma once

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "CommandLine.hpp"

// Abstract manager for config loader
// Currently have three sources, cmdline, env and file
class ConfigManager {
   public:
    enum class Configs {
        BASE_URL,
        AUTH_TOKEN,
        FILES,
        LOG_FILE,
        MAX_FILE_SIZE,
        ALLOWED_TYPES,
        MAX_RETRIES,
        PARALLELISM,
        CHUNK_SIZE,
        CHUNK_TIMEOUT_MS,
        TRANSPORT,
        NO_PROCESS,
        HELP,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);

    // Environment variables are looked up as kEnvPrefix + name
    static constexpr std::string_view kEnvPrefix = "HEALTHUPLOADER_";

    /**
     * get - Function used to retrieve the value of a specific
     * configuration.
     *
     * @param config The configuration for which the value is to be retrieved.
     * @return A std::optional containing the value of the specified
     * configuration, or std::nullopt if the configuration is not found.
     */
    std::optional<std::string> get(Configs config);

    // Whether a flag style option (NO_PROCESS, HELP) was given
    bool has(Configs config) { return get(config).has_value(); }

    /**
     * serializeHelpToOStream - Function used to serialize the help information
     * to an output stream.
     *
     * @param out The output stream to which the help information will be
     * serialized.
     */
    static void serializeHelpToOStream(std::ostream& out);

    explicit ConfigManager(CommandLine line);

    // False when the command line could not be parsed
    [[nodiscard]] bool commandLineValid() const { return _cmdlineValid; }

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';

        Configs config;
        std::string_view name;
        std::string_view description;
        char alias;
        enum class ArgType { NONE, STRING } type;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::BASE_URL,
            "BASE_URL",
            "Server root URL, e.g. https://example.com",
            'u',
            Entry::ArgType::STRING,
        },
        {
            Configs::AUTH_TOKEN,
            "AUTH_TOKEN",
            "Bearer token sent with every request",
            't',
            Entry::ArgType::STRING,
        },
        {
            Configs::FILES,
            "FILES",
            "Comma separated list of files to upload",
            'i',
            Entry::ArgType::STRING,
        },
        {
            Configs::LOG_FILE,
            "LOG_FILE",
            "Log file path",
            'f',
            Entry::ArgType::STRING,
        },
        {
            Configs::MAX_FILE_SIZE,
            "MAX_FILE_SIZE",
            "Largest accepted file in bytes",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::ALLOWED_TYPES,
            "ALLOWED_TYPES",
            "Comma separated content types (*/*, type/*, type/subtype)",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::MAX_RETRIES,
            "MAX_RETRIES",
            "Retries per chunk after the first attempt",
            'r',
            Entry::ArgType::STRING,
        },
        {
            Configs::PARALLELISM,
            "PARALLELISM",
            "Chunks sent concurrently per group",
            'p',
            Entry::ArgType::STRING,
        },
        {
            Configs::CHUNK_SIZE,
            "CHUNK_SIZE",
            "Fixed chunk size in bytes (overrides the tiered policy)",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::CHUNK_TIMEOUT_MS,
            "CHUNK_TIMEOUT_MS",
            "Per attempt timeout of a chunk request in milliseconds",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::TRANSPORT,
            "TRANSPORT",
            "Upload transport (chunked/presigned)",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::NO_PROCESS,
            "NO_PROCESS",
            "Upload only, do not start a processing job",
            'n',
            Entry::ArgType::NONE,
        },
        {
            Configs::HELP,
            "HELP",
            "Display help information",
            'h',
            Entry::ArgType::NONE,
        },
    };

    struct Backend {
        virtual ~Backend() = default;

        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const std::string_view name) = 0;

        /**
         * @brief This field stores the name of the backend.
         *
         * Such as "Cmdline" or "File". Used for logging purposes.
         */
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

   private:
    enum class BackendType { COMMAND_LINE, ENV, FILE, MAX };

    class BackendStorage {
        std::array<std::unique_ptr<Backend>, static_cast<int>(BackendType::MAX)>
            backends;

       public:
        std::unique_ptr<Backend>& operator[](const BackendType type) {
            return backends[static_cast<int>(type)];
        }

        [[nodiscard]] decltype(backends)::const_iterator begin() const {
            return backends.cbegin();
        }

        [[nodiscard]] decltype(backends)::const_iterator end() const {
            return backends.cend();
        }

        [[nodiscard]] size_t size() const {
            return std::ranges::count_if(
                backends, [](const auto& ent) { return ent != nullptr; });
        }
    } storage;
    bool _cmdlineValid = false;
};
