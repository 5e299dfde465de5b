#include <absl/strings/str_cat.h>
#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <algorithm>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>

#include "CommandLine.hpp"
#include "Env.hpp"

namespace po = boost::program_options;

template <typename T, ConfigManager::Configs config>
void AddOption(po::options_description &desc) {
    auto index = std::ranges::find_if(ConfigManager::kConfigMap,
                                      [](const ConfigManager::Entry &entry) {
                                          return entry.config == config;
                                      });
    std::string optionName(index->name);
    if (index->alias != ConfigManager::Entry::ALIAS_NONE) {
        optionName = fmt::format("{},{}", index->name, index->alias);
    }
    if constexpr (std::is_same_v<T, void>) {
        desc.add_options()(optionName.c_str(), index->description.data());
    } else {
        desc.add_options()(optionName.c_str(), po::value<T>(),
                           index->description.data());
    }
}

struct ConfigBackendEnv : public ConfigManager::Backend {
    ~ConfigBackendEnv() override = default;
    ConfigBackendEnv() = default;

    std::optional<std::string> get(const std::string_view name) override {
        return Env{}[absl::StrCat(
            absl::string_view(ConfigManager::kEnvPrefix.data(),
                              ConfigManager::kEnvPrefix.size()),
            absl::string_view(name.data(), name.size()))].get();
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

template <ConfigManager::Entry::ArgType type>
struct ArgTypeDeducer {};

template <>
struct ArgTypeDeducer<ConfigManager::Entry::ArgType::STRING> {
    using Type = std::string;
};

template <>
struct ArgTypeDeducer<ConfigManager::Entry::ArgType::NONE> {
    using Type = void;
};

template <ConfigManager::Configs config>
void verifyUniqueConfig() {
    constexpr auto count = std::ranges::count_if(
        ConfigManager::kConfigMap,
        [](const auto &entry) { return entry.config == config; });
    static_assert(count == 1,
                  "kConfigMap must and only contain one of each configs");
}

template <size_t index>
void addIndexConfig(po::options_description &desc) {
    constexpr auto config = static_cast<ConfigManager::Configs>(index);

    // HELP is command line only
    if constexpr (config == ConfigManager::Configs::HELP ||
                  config == ConfigManager::Configs::MAX) {
        return;
    } else {
        constexpr auto argtype =
            std::ranges::find_if(ConfigManager::kConfigMap,
                                 [](const auto &entry) {
                                     return entry.config == config;
                                 })
                ->type;
        verifyUniqueConfig<config>();
        using ArgType = typename ArgTypeDeducer<argtype>::Type;
        AddOption<ArgType, config>(desc);
    }
}

template <size_t... index>
void addAll(po::options_description &desc,
            const std::index_sequence<index...> /*indexs*/) {
    (addIndexConfig<index>(desc), ...);
}

struct ConfigBackendBoostPOBase : public ConfigManager::Backend {
    static po::options_description getOptionsDesc() {
        po::options_description desc("HealthUploader Configs");
        addAll(desc, std::make_index_sequence<ConfigManager::CONFIG_MAX>());
        return desc;
    }

    std::optional<std::string> get(const std::string_view name) override {
        if (const auto it = mp.find(std::string(name));
            it != mp.end() && !it->second.empty()) {
            return it->second.as<std::string>();
        }
        return std::nullopt;
    }

    ConfigBackendBoostPOBase() = default;
    ~ConfigBackendBoostPOBase() override = default;

   protected:
    po::variables_map mp;
};

struct ConfigBackendFile : public ConfigBackendBoostPOBase {
    static constexpr const char *kConfigFiles[] = {"healthuploader.ini",
                                                   ".healthuploader.ini"};
    bool load() override {
        std::filesystem::path home;

        if (!Env{}["HOME"].assign(home)) {
            LOG(WARNING) << "HOME is not set, skipping config file";
            return false;
        }

        std::ifstream ifs;
        std::filesystem::path confPath;
        for (const char *filename : kConfigFiles) {
            confPath = home / filename;
            ifs.open(confPath);
            if (ifs.is_open()) {
                break;
            }
            DLOG(INFO) << "Opening " << confPath << " failed";
            ifs.clear();
        }
        if (!ifs.is_open()) {
            DLOG(INFO) << "No config file found";
            return false;
        }
        try {
            po::store(po::parse_config_file(ifs, getOptionsDesc()), mp);
            po::notify(mp);
        } catch (const po::error &e) {
            LOG(ERROR) << "File backend failed to parse: " << e.what();
            return false;
        }

        LOG(INFO) << "Loaded " << mp.size() << " entries from " << confPath;
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "File"; }

    ConfigBackendFile() = default;
    ~ConfigBackendFile() override = default;
};

struct ConfigBackendCmdline : public ConfigBackendBoostPOBase {
    CommandLine _line;

    static po::options_description getOptionsDesc() {
        auto desc = ConfigBackendBoostPOBase::getOptionsDesc();

        AddOption<void, ConfigManager::Configs::HELP>(desc);
        return desc;
    }

    bool load() override {
        try {
            po::store(po::parse_command_line(_line.argc(), _line.argv(),
                                             getOptionsDesc()),
                      mp);
            po::notify(mp);
        } catch (const po::error &e) {
            LOG(ERROR) << "Cmdline backend failed to parse: " << e.what();
            return false;
        }

        DLOG(INFO) << "Loaded " << mp.size() << " entries (cmdline)";
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

    explicit ConfigBackendCmdline(CommandLine line) : _line(std::move(line)) {}
    ~ConfigBackendCmdline() override = default;
};

ConfigManager::ConfigManager(CommandLine line) {
    auto cmdline = std::make_unique<ConfigBackendCmdline>(std::move(line));
    _cmdlineValid = cmdline->load();
    if (_cmdlineValid) {
        storage[BackendType::COMMAND_LINE] = std::move(cmdline);
    }
    auto env = std::make_unique<ConfigBackendEnv>();
    if (env->load()) {
        storage[BackendType::ENV] = std::move(env);
    }
    auto file = std::make_unique<ConfigBackendFile>();
    if (file->load()) {
        storage[BackendType::FILE] = std::move(file);
    }
    DLOG(INFO) << "Loaded " << storage.size() << " config sources";
}

std::optional<std::string> ConfigManager::get(Configs config) {
    std::string_view name =
        std::ranges::find_if(kConfigMap, [config](const Entry &entry) {
            return entry.config == config;
        })->name;

    for (const auto &bit : storage) {
        if (!bit) {
            continue;
        }
        auto result = bit->get(name);
        if (result.has_value()) {
            DLOG(INFO) << fmt::format("Used '{}' backend for variable {}",
                                      bit->name(), name);
            return result;
        }
    }

    return std::nullopt;
}

void ConfigManager::serializeHelpToOStream(std::ostream &out) {
    out << ConfigBackendCmdline::getOptionsDesc() << std::endl;
}
