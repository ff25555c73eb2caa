#include "UploadInitiator.hpp"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include <utility>

#include "Protocol.hpp"

namespace ResumableUpload {

UploadInitiator::UploadInitiator(HttpTransport& transport,
                                 UploadOptions options,
                                 std::shared_ptr<spdlog::logger> logger)
    : _transport(transport),
      _options(std::move(options)),
      _logger(std::move(logger)) {}

HttpRequest UploadInitiator::buildCreateRequest(
    const ByteSource& source, std::uint64_t totalSize) const {
    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = Protocol::filesUrl(_options.serverBaseUrl);
    request.headers = {
        {Protocol::kContentTypeHeader, Protocol::kCreateContentType},
        {Protocol::kUploadLengthHeader, absl::StrCat(totalSize)},
        {Protocol::kResumableHeader, Protocol::kVersion},
    };
    if (_options.sendFilenameMetadata) {
        request.headers.emplace_back(
            Protocol::kUploadMetadataHeader,
            Protocol::filenameMetadata(source.path().filename().string()));
    }
    return request;
}

absl::StatusOr<UploadSession> UploadInitiator::create(ByteSource& source) {
    const auto totalSize = source.size();
    if (!totalSize.ok()) {
        return totalSize.status();
    }
    _logger->debug("File size in bytes: {}", *totalSize);

    const auto request = buildCreateRequest(source, *totalSize);
    const auto response = _transport.perform(request);
    if (!response.ok()) {
        return response.status();
    }
    _logger->debug("Check file creation response: status={} location={}",
                   response->status,
                   response->header(Protocol::kLocationHeader).value_or(""));

    if (auto status = Protocol::statusFromResponse(*response, "Create upload");
        !status.ok()) {
        return status;
    }

    auto resourceId = Protocol::resourceIdFromLocation(
        response->header(Protocol::kLocationHeader));
    if (!resourceId.ok()) {
        return resourceId.status();
    }
    _logger->debug("Extracted file ID: {}", *resourceId);
    return UploadSession(std::move(resourceId).value(), *totalSize,
                         source.path());
}

absl::StatusOr<UploadSession> UploadInitiator::resume(
    ByteSource& source, const std::string& resourceId) {
    if (resourceId.empty()) {
        return absl::InvalidArgumentError("Empty upload id");
    }
    const auto totalSize = source.size();
    if (!totalSize.ok()) {
        return totalSize.status();
    }
    _logger->debug("Resuming upload {} of {} bytes", resourceId, *totalSize);
    return UploadSession(resourceId, *totalSize, source.path());
}

}  // namespace ResumableUpload
