#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace ResumableUpload {

// One in-progress transfer. The total size is fixed at creation.
class UploadSession {
   public:
    UploadSession(std::string resourceId, std::uint64_t totalSize,
                  std::filesystem::path sourcePath)
        : _resourceId(std::move(resourceId)),
          _totalSize(totalSize),
          _sourcePath(std::move(sourcePath)) {}

    [[nodiscard]] const std::string& resourceId() const { return _resourceId; }
    [[nodiscard]] std::uint64_t totalSize() const { return _totalSize; }
    [[nodiscard]] const std::filesystem::path& sourcePath() const {
        return _sourcePath;
    }

   private:
    std::string _resourceId;
    std::uint64_t _totalSize;
    std::filesystem::path _sourcePath;
};

}  // namespace ResumableUpload
