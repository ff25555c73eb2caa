#include "SpdlogInit.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

static std::shared_ptr<spdlog::logger> main_logger;

void ResumableUpload_SpdlogInit() {
    if (main_logger) return;

    // Create console sink with color support
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    main_logger = std::make_shared<spdlog::logger>("resumable", console_sink);
    main_logger->set_level(spdlog::level::debug);

    // Set as default logger
    spdlog::set_default_logger(main_logger);

    spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%f [%L] %v");
}

void ResumableUpload_SpdlogDeInit() {
    if (!main_logger) {
        return;
    }
    main_logger->flush();
    spdlog::drop_all();
    main_logger.reset();
}

std::shared_ptr<spdlog::logger> ResumableUpload_Logger() {
    ResumableUpload_SpdlogInit();
    return main_logger;
}

bool ResumableUpload_SetLogLevel(std::string_view level) {
    const std::string name(level);
    const auto parsed = spdlog::level::from_str(name);
    // from_str() falls back to "off" for unknown names
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    ResumableUpload_Logger()->set_level(parsed);
    return true;
}

bool ResumableUpload_AddLogFile(const std::filesystem::path& path) {
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
    try {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            path.string(), true);
    } catch (const spdlog::spdlog_ex& e) {
        SPDLOG_ERROR("Couldn't open file {}: {}", path.string(), e.what());
        return false;
    }
    auto logger = ResumableUpload_Logger();
    logger->sinks().push_back(sink);
    // Apply the current pattern to the new sink as well
    sink->set_pattern("%Y-%m-%dT%H:%M:%S.%f [%L] %v");
    SPDLOG_INFO("File {} added as logsink", path.string());
    return true;
}
