#pragma once

#include <absl/status/status.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "ChunkChecksum.hpp"

namespace ResumableUpload {

struct UploadOptions {
    static constexpr std::uint64_t kDefaultChunkSize = 32ULL * 1024 * 1024;
    static constexpr char kDefaultServerBaseUrl[] = "http://localhost:8080";
    static constexpr char kDefaultSourceFile[] = "testfile";

    std::string serverBaseUrl = kDefaultServerBaseUrl;
    std::filesystem::path sourcePath = kDefaultSourceFile;
    // Upper bound on bytes per append request
    std::uint64_t chunkSize = kDefaultChunkSize;
    // Wait between failed iterations of the transfer loop
    std::chrono::milliseconds retryDelay = std::chrono::seconds(1);
    // Existing upload to continue instead of creating a new one
    std::optional<std::string> resumeId;
    ChecksumAlgorithm checksum = ChecksumAlgorithm::None;
    bool sendFilenameMetadata = false;
    // Zero keeps the transport's default
    std::chrono::seconds connectTimeout = std::chrono::seconds(10);

    // Rejects values the transfer cannot run with
    [[nodiscard]] absl::Status validate() const;
};

}  // namespace ResumableUpload
