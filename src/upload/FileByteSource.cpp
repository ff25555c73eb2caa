#include <LogCompat.hpp>
#include <StructF.hpp>
#include <absl/status/status.h>
#include <fmt/format.h>

#include <system_error>
#include <utility>

#include "ByteSource.hpp"

namespace ResumableUpload {

FileByteSource::FileByteSource(std::filesystem::path path)
    : _path(std::move(path)) {}

std::filesystem::path FileByteSource::path() const { return _path; }

absl::StatusOr<std::uint64_t> FileByteSource::size() {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(_path, ec)) {
        return absl::NotFoundError(
            fmt::format("{} is not a regular file", _path.string()));
    }
    const auto fileSize = std::filesystem::file_size(_path, ec);
    if (ec) {
        return absl::NotFoundError(fmt::format(
            "Cannot get size of {}: {}", _path.string(), ec.message()));
    }
    return static_cast<std::uint64_t>(fileSize);
}

absl::StatusOr<std::string> FileByteSource::read(std::uint64_t offset,
                                                 std::size_t length) {
    F file;
    if (!file.open(_path, F::Mode::ReadBinary)) {
        return absl::NotFoundError(
            fmt::format("Cannot open {}", _path.string()));
    }
    if (!file.seek(offset)) {
        return absl::DataLossError(fmt::format("Cannot seek {} to {}",
                                               _path.string(), offset));
    }

    std::string buffer(length, '\0');
    const auto result = file.read(buffer.data(), length);
    if (!result) {
        LOG(WARNING) << "Read of " << length << " bytes at " << offset
                     << " from " << _path << " failed: " << result.reason;
        return absl::DataLossError(
            fmt::format("Cannot read {} bytes at offset {} from {}", length,
                        offset, _path.string()));
    }
    return buffer;
}

}  // namespace ResumableUpload
