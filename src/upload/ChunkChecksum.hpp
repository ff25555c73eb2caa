#pragma once

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include <string>

namespace ResumableUpload {

enum class ChecksumAlgorithm { None, MD5 };

// Lower-case hex MD5 of `data`, as expected by the server's checksum
// extension.
absl::StatusOr<std::string> md5Hex(absl::string_view data);

// Value for Upload-Checksum, e.g. "md5 9e107d9d372bb6826bd81d3542a419d6"
absl::StatusOr<std::string> uploadChecksumHeader(ChecksumAlgorithm algorithm,
                                                 absl::string_view data);

}  // namespace ResumableUpload
