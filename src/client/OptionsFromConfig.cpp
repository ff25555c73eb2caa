#include "OptionsFromConfig.hpp"

#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace ResumableUpload {

namespace {

// Both delays end up in milliseconds: retryDelay as a chrono duration,
// the connect timeout inside curl
constexpr std::int64_t kMaxRetryDelaySeconds =
    std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::milliseconds::max())
        .count();
constexpr std::int64_t kMaxConnectTimeoutSeconds =
    std::numeric_limits<long>::max() / 1000;

template <typename T>
absl::Status parseNumber(const std::string& name, const std::string& value,
                         T* out) {
    if (!absl::SimpleAtoi(value, out)) {
        return absl::InvalidArgumentError(
            absl::StrCat(name, ": not a valid number: '", value, "'"));
    }
    return absl::OkStatus();
}

absl::StatusOr<ChecksumAlgorithm> parseChecksum(std::string value) {
    absl::AsciiStrToLower(&value);
    if (value.empty() || value == "none") {
        return ChecksumAlgorithm::None;
    }
    if (value == "md5") {
        return ChecksumAlgorithm::MD5;
    }
    return absl::InvalidArgumentError(
        absl::StrCat("CHECKSUM: unsupported algorithm '", value, "'"));
}

absl::StatusOr<bool> parseSwitch(const std::string& name, std::string value) {
    absl::AsciiStrToLower(&value);
    if (value == "on" || value == "true" || value == "1") {
        return true;
    }
    if (value == "off" || value == "false" || value == "0") {
        return false;
    }
    return absl::InvalidArgumentError(
        absl::StrCat(name, ": expected on/off, got '", value, "'"));
}

}  // namespace

absl::StatusOr<UploadOptions> optionsFromConfig(ConfigManager& config) {
    using Configs = ConfigManager::Configs;
    UploadOptions options;

    if (auto value = config.get(Configs::SERVER_URL); value) {
        options.serverBaseUrl = *value;
    }
    if (auto value = config.get(Configs::SOURCE_FILE); value) {
        options.sourcePath = *value;
    }
    if (auto value = config.get(Configs::CHUNK_SIZE); value) {
        if (auto status =
                parseNumber("CHUNK_SIZE", *value, &options.chunkSize);
            !status.ok()) {
            return status;
        }
    }
    if (auto value = config.get(Configs::RETRY_DELAY); value) {
        std::int64_t seconds = 0;
        if (auto status = parseNumber("RETRY_DELAY", *value, &seconds);
            !status.ok()) {
            return status;
        }
        if (seconds > kMaxRetryDelaySeconds) {
            return absl::InvalidArgumentError("RETRY_DELAY: out of range");
        }
        options.retryDelay = std::chrono::seconds(seconds);
    }
    if (auto value = config.get(Configs::UPLOAD_ID); value) {
        options.resumeId = *value;
    }
    if (auto value = config.get(Configs::CHECKSUM); value) {
        auto checksum = parseChecksum(*value);
        if (!checksum.ok()) {
            return checksum.status();
        }
        options.checksum = *checksum;
    }
    if (auto value = config.get(Configs::CONNECT_TIMEOUT); value) {
        std::int64_t seconds = 0;
        if (auto status = parseNumber("CONNECT_TIMEOUT", *value, &seconds);
            !status.ok()) {
            return status;
        }
        if (seconds < 0) {
            return absl::InvalidArgumentError(
                "CONNECT_TIMEOUT must be >= 0");
        }
        if (seconds > kMaxConnectTimeoutSeconds) {
            return absl::InvalidArgumentError("CONNECT_TIMEOUT: out of range");
        }
        options.connectTimeout = std::chrono::seconds(seconds);
    }
    if (auto value = config.get(Configs::FILENAME_METADATA); value) {
        auto enabled = parseSwitch("FILENAME_METADATA", *value);
        if (!enabled.ok()) {
            return enabled.status();
        }
        options.sendFilenameMetadata = *enabled;
    }

    if (auto status = options.validate(); !status.ok()) {
        return status;
    }
    return options;
}

}  // namespace ResumableUpload
