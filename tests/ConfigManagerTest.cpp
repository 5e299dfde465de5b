#include <absl/strings/str_cat.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <ConfigManager.hpp>
#include <Env.hpp>
#include <UploaderConfig.hpp>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "CommandLine.hpp"

namespace {

// Owns argv storage for a CommandLine.
class Argv {
   public:
    Argv(std::initializer_list<std::string> args) : strings_(args) {
        strings_.insert(strings_.begin(), "healthuploader");
        for (auto& s : strings_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    CommandLine commandLine() {
        return {static_cast<CommandLine::argc_type>(strings_.size()),
                pointers_.data()};
    }

   private:
    std::vector<std::string> strings_;
    std::vector<char*> pointers_;
};

}  // namespace

class ConfigManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        savedHome = Env{}["HOME"].get();
        home = std::filesystem::temp_directory_path() /
               absl::StrCat("healthuploader-test-", getpid());
        std::filesystem::create_directories(home);
        Env{}["HOME"] = home.string();
        for (const auto& entry : ConfigManager::kConfigMap) {
            Env{}[absl::StrCat(
                      absl::string_view(ConfigManager::kEnvPrefix.data(),
                                        ConfigManager::kEnvPrefix.size()),
                      absl::string_view(entry.name.data(), entry.name.size()))]
                .clear();
        }
    }

    void TearDown() override {
        for (const auto& entry : ConfigManager::kConfigMap) {
            Env{}[absl::StrCat(
                      absl::string_view(ConfigManager::kEnvPrefix.data(),
                                        ConfigManager::kEnvPrefix.size()),
                      absl::string_view(entry.name.data(), entry.name.size()))]
                .clear();
        }
        std::error_code ec;
        std::filesystem::remove_all(home, ec);
        if (savedHome) {
            Env{}["HOME"] = *savedHome;
        } else {
            Env{}["HOME"].clear();
        }
    }

    void writeIni(const std::string& contents) const {
        std::ofstream(home / "healthuploader.ini") << contents;
    }

    std::optional<std::string> savedHome;
    std::filesystem::path home;
};

TEST_F(ConfigManagerTest, ReadsCommandLine) {
    Argv argv{"--BASE_URL", "https://health.test", "-i", "a.xml,b.xml"};
    ConfigManager manager(argv.commandLine());
    EXPECT_TRUE(manager.commandLineValid());
    EXPECT_EQ(manager.get(ConfigManager::Configs::BASE_URL),
              "https://health.test");
    EXPECT_EQ(manager.get(ConfigManager::Configs::FILES), "a.xml,b.xml");
    EXPECT_FALSE(manager.get(ConfigManager::Configs::AUTH_TOKEN).has_value());
}

TEST_F(ConfigManagerTest, FlagOptionsAreDetected) {
    Argv argv{"--NO_PROCESS", "--HELP"};
    ConfigManager manager(argv.commandLine());
    EXPECT_TRUE(manager.has(ConfigManager::Configs::NO_PROCESS));
    EXPECT_TRUE(manager.has(ConfigManager::Configs::HELP));
}

TEST_F(ConfigManagerTest, CommandLineWinsOverEnvAndFile) {
    Env{}["HEALTHUPLOADER_BASE_URL"] = "https://env.test";
    Env{}["HEALTHUPLOADER_AUTH_TOKEN"] = "env-token";
    writeIni("BASE_URL=https://file.test\nMAX_RETRIES=7\n");

    Argv argv{"--BASE_URL", "https://cmdline.test"};
    ConfigManager manager(argv.commandLine());
    EXPECT_EQ(manager.get(ConfigManager::Configs::BASE_URL),
              "https://cmdline.test");
    EXPECT_EQ(manager.get(ConfigManager::Configs::AUTH_TOKEN), "env-token");
    EXPECT_EQ(manager.get(ConfigManager::Configs::MAX_RETRIES), "7");
}

TEST_F(ConfigManagerTest, UnknownOptionInvalidatesCommandLine) {
    Argv argv{"--NOT_AN_OPTION", "1"};
    ConfigManager manager(argv.commandLine());
    EXPECT_FALSE(manager.commandLineValid());
}

TEST_F(ConfigManagerTest, HelpListsEveryOption) {
    std::ostringstream out;
    ConfigManager::serializeHelpToOStream(out);
    for (const auto& entry : ConfigManager::kConfigMap) {
        EXPECT_NE(out.str().find(entry.name), std::string::npos) << entry.name;
    }
}

TEST_F(ConfigManagerTest, UploaderConfigParsesTypedValues) {
    Argv argv{"--BASE_URL",      "https://health.test/",
              "--FILES",         "a.xml, b.csv ,",
              "--MAX_RETRIES",   "5",
              "--PARALLELISM",   "2",
              "--CHUNK_SIZE",    "4096",
              "--TRANSPORT",     "PRESIGNED",
              "--ALLOWED_TYPES", "application/xml,text/*",
              "--NO_PROCESS"};
    ConfigManager manager(argv.commandLine());
    auto config = UploaderConfig::load(manager);
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->baseUrl, "https://health.test");
    ASSERT_EQ(config->files.size(), 2U);
    EXPECT_EQ(config->files[0], "a.xml");
    EXPECT_EQ(config->files[1], "b.csv");
    EXPECT_EQ(config->maxRetries, 5);
    EXPECT_EQ(config->parallelism, 2U);
    EXPECT_EQ(config->chunkSize, 4096U);
    EXPECT_EQ(config->transport, UploaderConfig::Transport::Presigned);
    EXPECT_EQ(config->allowedTypes,
              (std::vector<std::string>{"application/xml", "text/*"}));
    EXPECT_FALSE(config->process);
}

TEST_F(ConfigManagerTest, UploaderConfigDefaults) {
    Argv argv{"--BASE_URL", "https://health.test"};
    ConfigManager manager(argv.commandLine());
    auto config = UploaderConfig::load(manager);
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->maxFileSize, UploaderConfig::kDefaultMaxFileSize);
    EXPECT_EQ(config->maxRetries, 3);
    EXPECT_EQ(config->parallelism, 3U);
    EXPECT_EQ(config->chunkTimeout, std::chrono::milliseconds(30000));
    EXPECT_FALSE(config->chunkSize.has_value());
    EXPECT_EQ(config->transport, UploaderConfig::Transport::Chunked);
    EXPECT_TRUE(config->process);
    EXPECT_EQ(config->allowedTypes, std::vector<std::string>{"*/*"});
}

TEST_F(ConfigManagerTest, MalformedNumbersKeepDefaults) {
    Argv argv{"--BASE_URL", "https://health.test", "--MAX_RETRIES", "many",
              "--CHUNK_TIMEOUT_MS", "0"};
    ConfigManager manager(argv.commandLine());
    auto config = UploaderConfig::load(manager);
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->maxRetries, 3);
    EXPECT_EQ(config->chunkTimeout, std::chrono::milliseconds(30000));
}

TEST_F(ConfigManagerTest, MissingBaseUrlIsAnError) {
    Argv argv{"--FILES", "a.xml"};
    ConfigManager manager(argv.commandLine());
    auto config = UploaderConfig::load(manager);
    EXPECT_TRUE(absl::IsInvalidArgument(config.status()));
}
