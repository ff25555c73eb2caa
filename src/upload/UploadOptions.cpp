#include "UploadOptions.hpp"

#include <absl/strings/match.h>

namespace ResumableUpload {

absl::Status UploadOptions::validate() const {
    if (chunkSize == 0) {
        return absl::InvalidArgumentError("chunk size must be > 0");
    }
    if (retryDelay.count() < 0) {
        return absl::InvalidArgumentError("retry delay must be >= 0");
    }
    if (serverBaseUrl.empty()) {
        return absl::InvalidArgumentError("server URL must not be empty");
    }
    if (!absl::StartsWith(serverBaseUrl, "http://") &&
        !absl::StartsWith(serverBaseUrl, "https://")) {
        return absl::InvalidArgumentError(
            "server URL must start with http:// or https://");
    }
    if (sourcePath.empty()) {
        return absl::InvalidArgumentError("source file must not be empty");
    }
    if (resumeId && resumeId->empty()) {
        return absl::InvalidArgumentError("upload id must not be empty");
    }
    return absl::OkStatus();
}

}  // namespace ResumableUpload
