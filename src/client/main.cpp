#include <LogCompat.hpp>

#include <CommandLine.hpp>
#include <ConfigManager.hpp>
#include <SpdlogInit.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <utility>

#include "ByteSource.hpp"
#include "CurlTransport.hpp"
#include "OptionsFromConfig.hpp"
#include "Sleeper.hpp"
#include "TransferLoop.hpp"
#include "UploadInitiator.hpp"

using namespace ResumableUpload;

namespace {

bool setupLogging(ConfigManager& configMgr) {
    if (const auto it = configMgr.get(ConfigManager::Configs::LOG_LEVEL); it) {
        if (!ResumableUpload_SetLogLevel(*it)) {
            LOG(ERROR) << "Unknown log level: " << *it;
            return false;
        }
    }
    if (const auto it = configMgr.get(ConfigManager::Configs::LOG_FILE); it) {
        if (!ResumableUpload_AddLogFile(*it)) {
            return false;
        }
    }
    return true;
}

}  // namespace

int app_main(int argc, char** argv) {
    ConfigManager configMgr(CommandLine{argc, argv});

    if (!configMgr.commandLineValid()) {
        ConfigManager::serializeHelpToOStream(std::cerr);
        return EXIT_FAILURE;
    }

    // Print help and return if help option is set
    if (configMgr.get(ConfigManager::Configs::HELP)) {
        ConfigManager::serializeHelpToOStream(std::cout);
        return EXIT_SUCCESS;
    }

    if (!setupLogging(configMgr)) {
        return EXIT_FAILURE;
    }

    auto options = optionsFromConfig(configMgr);
    if (!options.ok()) {
        LOG(FATAL) << "Invalid configuration: " << options.status();
        return EXIT_FAILURE;
    }
    LOG(INFO) << "Uploading " << options->sourcePath << " to "
              << options->serverBaseUrl << " in chunks of "
              << options->chunkSize << " bytes";

    auto logger = ResumableUpload_Logger();
    FileByteSource source(options->sourcePath);
    CurlTransport transport(
        CurlTransport::Options{.connectTimeout = options->connectTimeout});

    UploadInitiator initiator(transport, *options, logger);
    auto session = options->resumeId
                       ? initiator.resume(source, *options->resumeId)
                       : initiator.create(source);
    if (!session.ok()) {
        LOG(FATAL) << "Failed to start upload: " << session.status();
        return EXIT_FAILURE;
    }
    LOG(INFO) << "Upload resource: " << session->resourceId();

    ThreadSleeper sleeper;
    TransferLoop loop(std::move(session).value(), transport, source, sleeper,
                      *options, logger);
    const auto stats = loop.run();

    LOG(INFO) << "Sent " << stats.bytesSent << " bytes in " << stats.appends
              << " requests, " << stats.retries << " retries";
    return EXIT_SUCCESS;
}
