#pragma once

#include <absl/status/statusor.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ResumableUpload {

/**
 * @brief A sized, randomly readable sequence of bytes.
 *
 * Implementations acquire the underlying resource only for the duration of
 * a single call.
 */
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    // Where the bytes come from, for logging and metadata
    [[nodiscard]] virtual std::filesystem::path path() const = 0;

    // Total length in bytes
    virtual absl::StatusOr<std::uint64_t> size() = 0;

    /**
     * @brief Reads exactly `length` bytes starting at `offset`.
     *
     * A source that ends before `offset + length` is an error.
     */
    virtual absl::StatusOr<std::string> read(std::uint64_t offset,
                                             std::size_t length) = 0;
};

class FileByteSource : public ByteSource {
   public:
    explicit FileByteSource(std::filesystem::path path);
    ~FileByteSource() override = default;

    [[nodiscard]] std::filesystem::path path() const override;
    absl::StatusOr<std::uint64_t> size() override;
    absl::StatusOr<std::string> read(std::uint64_t offset,
                                     std::size_t length) override;

   private:
    std::filesystem::path _path;
};

}  // namespace ResumableUpload
