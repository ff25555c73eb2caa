#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string_view>

/**
 * Initializes the spdlog logger used by the uploader.
 * A colored stderr sink is created and the logger is registered as the
 * spdlog default logger, so both LOG() macros and injected loggers write
 * through it.
 *
 * @note Calling this more than once is a no-op.
 */
extern void ResumableUpload_SpdlogInit();

// Deregister and cleanup spdlog
extern void ResumableUpload_SpdlogDeInit();

/**
 * Returns the logger created by ResumableUpload_SpdlogInit(), to be handed
 * to the protocol components.
 */
extern std::shared_ptr<spdlog::logger> ResumableUpload_Logger();

/**
 * Applies a level name as understood by spdlog ("trace", "debug", "info",
 * "warning", "error", "critical", "off").
 *
 * @return false if the name is not a known level; the level is unchanged.
 */
extern bool ResumableUpload_SetLogLevel(std::string_view level);

/**
 * Adds a file sink to the logger. The file is truncated on open.
 *
 * @return false if the file could not be opened.
 */
extern bool ResumableUpload_AddLogFile(const std::filesystem::path& path);
