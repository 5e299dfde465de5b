#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <LogSinks.hpp>
#include <UploaderConfig.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <net/CurlHttpClient.hpp>
#include <net/UploadEndpoints.hpp>
#include <upload/Sleeper.hpp>
#include <upload/UploadBatch.hpp>
#include <upload/UploadObserver.hpp>
#include <upload/UploadSession.hpp>
#include <utility>

#include "CommandLine.hpp"
#include "libos/libsighandler.hpp"

using namespace HealthUploader;

namespace {

constexpr int kExitConfigError = 2;

SessionOptions makeSessionOptions(const UploaderConfig& config) {
    SessionOptions options;
    options.upload.chunkSize = config.chunkSize;
    options.upload.maxRetries = config.maxRetries;
    options.upload.parallelism = config.parallelism;
    options.upload.validation = {.maxFileSize = config.maxFileSize,
                                 .allowedTypes = config.allowedTypes};
    options.transport = config.transport == UploaderConfig::Transport::Presigned
                            ? Transport::Presigned
                            : Transport::Chunked;
    options.process = config.process;
    return options;
}

void printEntry(const UploadBatch::Entry& entry) {
    const auto name = entry.file ? entry.file->name() : std::string("?");
    switch (entry.state) {
        case UploadBatch::FileState::Uploading:
            LOG(INFO) << fmt::format("{} {}: {}% ({}/{} bytes)", entry.id,
                                     name, entry.progress.percentage,
                                     entry.progress.loaded,
                                     entry.progress.total);
            break;
        case UploadBatch::FileState::Error:
            LOG(ERROR) << fmt::format("{} {}: {}: {}", entry.id, name,
                                      entry.state, entry.message);
            break;
        default:
            LOG(INFO) << fmt::format("{} {}: {}{}", entry.id, name, entry.state,
                                     entry.message.empty()
                                         ? ""
                                         : fmt::format(" - {}", entry.message));
            break;
    }
}

}  // namespace

int app_main(int argc, char** argv) {
    ConfigManager configMgr(CommandLine{argc, argv});

    RAIILogSink<LogFileSink> logFileSink;

    if (configMgr.has(ConfigManager::Configs::HELP)) {
        ConfigManager::serializeHelpToOStream(std::cout);
        return EXIT_SUCCESS;
    }
    if (!configMgr.commandLineValid()) {
        ConfigManager::serializeHelpToOStream(std::cerr);
        return kExitConfigError;
    }

    auto config = UploaderConfig::load(configMgr);
    if (!config.ok()) {
        LOG(ERROR) << config.status().message();
        return kExitConfigError;
    }
    if (config->logFile) {
        logFileSink = std::make_shared<LogFileSink>(*config->logFile);
    }
    if (config->files.empty()) {
        LOG(ERROR) << "FILES is not set, nothing to upload";
        return kExitConfigError;
    }

    Net::CurlHttpClient client(config->authToken);
    Net::UploadEndpoints endpoints(client, config->baseUrl);
    RealSleeper sleeper;
    LoggingUploadObserver observer;
    UploadSession session(endpoints, sleeper, observer, config->chunkTimeout);
    UploadBatch batch(session, makeSessionOptions(*config));
    batch.setOnUpdate(printEntry);

    for (const auto& path : config->files) {
        auto source = DiskFileSource::open(path);
        if (!source) {
            LOG(ERROR) << "Skipping " << path;
            continue;
        }
        const auto id =
            batch.add(std::make_shared<DiskFileSource>(std::move(*source)));
        DLOG(INFO) << "Queued " << path << " as " << id;
    }
    const auto queued = batch.counters().total;
    if (queued == 0) {
        return EXIT_FAILURE;
    }

    SignalHandler::install();
    {
        auto watcher = SignalHandler::watch([&batch] {
            LOG(WARNING) << "Signal received, cancelling uploads";
            batch.cancelAll();
        });
        batch.run();
    }
    SignalHandler::uninstall();

    const auto counters = batch.counters();
    LOG(INFO) << fmt::format("{} of {} files completed, {} failed",
                             counters.completed, counters.total,
                             counters.failed);
    const bool allDone = counters.completed == counters.total &&
                         queued == config->files.size();
    return allDone ? EXIT_SUCCESS : EXIT_FAILURE;
}
