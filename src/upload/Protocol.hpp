#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include <cstdint>
#include <optional>
#include <string>

#include "HttpTransport.hpp"

namespace ResumableUpload::Protocol {

inline constexpr char kVersion[] = "1.0.0";

inline constexpr char kResumableHeader[] = "Protocol-Resumable";
inline constexpr char kUploadOffsetHeader[] = "Upload-Offset";
inline constexpr char kUploadLengthHeader[] = "Upload-Length";
inline constexpr char kUploadMetadataHeader[] = "Upload-Metadata";
inline constexpr char kUploadChecksumHeader[] = "Upload-Checksum";
inline constexpr char kContentTypeHeader[] = "Content-Type";
inline constexpr char kLocationHeader[] = "Location";

inline constexpr char kCreateContentType[] = "application/octet-stream";
inline constexpr char kAppendContentType[] =
    "application/offset+octet-stream";

inline constexpr char kFilesPath[] = "/api/v3/files";

// <base>/api/v3/files, a trailing '/' on the base is ignored.
std::string filesUrl(absl::string_view baseUrl);

// <base>/api/v3/files/<id>
std::string resourceUrl(absl::string_view baseUrl, absl::string_view resourceId);

/**
 * @brief Extracts the resource identifier from a creation response Location.
 *
 * The identifier is the final path segment. A missing header, or a location
 * whose final segment is empty, is an error.
 */
absl::StatusOr<std::string> resourceIdFromLocation(
    const std::optional<std::string>& location);

/**
 * @brief Reads Upload-Offset from a response.
 *
 * An absent header means offset 0. A value that is not a non-negative
 * decimal integer yields InvalidArgument.
 */
absl::StatusOr<std::uint64_t> parseOffset(const HttpResponse& response);

// 2xx
bool isSuccess(long httpStatus);

/**
 * @brief Maps a non-2xx response to a status.
 *
 * @param what Short description of the request, used as message prefix.
 * @return OkStatus() for 2xx.
 */
absl::Status statusFromResponse(const HttpResponse& response,
                                absl::string_view what);

// "filename <base64>" as carried by Upload-Metadata
std::string filenameMetadata(absl::string_view filename);

}  // namespace ResumableUpload::Protocol
