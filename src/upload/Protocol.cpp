#include "Protocol.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>
#include <fmt/format.h>

namespace ResumableUpload::Protocol {

std::string filesUrl(absl::string_view baseUrl) {
    return absl::StrCat(absl::StripSuffix(baseUrl, "/"), kFilesPath);
}

std::string resourceUrl(absl::string_view baseUrl,
                        absl::string_view resourceId) {
    return absl::StrCat(filesUrl(baseUrl), "/", resourceId);
}

absl::StatusOr<std::string> resourceIdFromLocation(
    const std::optional<std::string>& location) {
    if (!location) {
        return absl::DataLossError("Location header is missing");
    }
    const absl::string_view trimmed = absl::StripAsciiWhitespace(*location);
    const auto pos = trimmed.rfind('/');
    const absl::string_view id =
        pos == absl::string_view::npos ? trimmed : trimmed.substr(pos + 1);
    if (id.empty()) {
        return absl::DataLossError(
            fmt::format("Location '{}' has no resource id", *location));
    }
    return std::string(id);
}

absl::StatusOr<std::uint64_t> parseOffset(const HttpResponse& response) {
    const auto value = response.header(kUploadOffsetHeader);
    if (!value) {
        return std::uint64_t{0};
    }
    std::uint64_t offset = 0;
    const absl::string_view digits = absl::StripAsciiWhitespace(*value);
    // SimpleAtoi accepts a leading '+', which is not a valid offset
    if (digits.empty() || !absl::ascii_isdigit(digits.front()) ||
        !absl::SimpleAtoi(digits, &offset)) {
        return absl::InvalidArgumentError(
            fmt::format("Invalid {} header: '{}'", kUploadOffsetHeader, *value));
    }
    return offset;
}

bool isSuccess(long httpStatus) { return httpStatus >= 200 && httpStatus < 300; }

absl::Status statusFromResponse(const HttpResponse& response,
                                absl::string_view what) {
    if (isSuccess(response.status)) {
        return absl::OkStatus();
    }
    std::string message = absl::StrCat(what, ": HTTP ", response.status);
    const absl::string_view body = absl::StripAsciiWhitespace(response.body);
    if (!body.empty()) {
        absl::StrAppend(&message, ": ", body);
    }

    switch (response.status) {
        case 404:
            return absl::NotFoundError(message);
        case 409:
            // Upload-Offset does not match the server's offset
            return absl::FailedPreconditionError(message);
        case 410:
            return absl::NotFoundError(absl::StrCat(message, " (expired)"));
        case 412:
            // Protocol version not supported
            return absl::FailedPreconditionError(message);
        case 413:
            return absl::OutOfRangeError(message);
        case 415:
            return absl::InvalidArgumentError(message);
        default:
            break;
    }
    if (response.status >= 400 && response.status < 500) {
        return absl::InvalidArgumentError(message);
    }
    if (response.status >= 500 && response.status < 600) {
        return absl::UnavailableError(message);
    }
    return absl::UnknownError(message);
}

std::string filenameMetadata(absl::string_view filename) {
    return absl::StrCat("filename ", absl::Base64Escape(filename));
}

}  // namespace ResumableUpload::Protocol
