#pragma once

#include <absl/status/statusor.h>
#include <spdlog/logger.h>

#include <memory>
#include <string>

#include "ByteSource.hpp"
#include "HttpTransport.hpp"
#include "UploadOptions.hpp"
#include "UploadSession.hpp"

namespace ResumableUpload {

/**
 * @brief Creates the upload resource on the server.
 *
 * Runs once per transfer. Any failure is final: the caller is expected to
 * abort, there is no retry at this stage.
 */
class UploadInitiator {
   public:
    UploadInitiator(HttpTransport& transport, UploadOptions options,
                    std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Sizes the source and POSTs a creation request.
     *
     * @param source The bytes to be uploaded. Only size() is used.
     * @return The new session, or the reason creation failed:
     * NotFound if the source cannot be sized, Unavailable for transport
     * errors, a code mapped from the HTTP status for non-2xx responses,
     * DataLoss when the Location header is missing or has no id.
     */
    absl::StatusOr<UploadSession> create(ByteSource& source);

    /**
     * @brief Forms a session for an upload created earlier.
     *
     * No request is made; the transfer loop discovers the server offset.
     */
    absl::StatusOr<UploadSession> resume(ByteSource& source,
                                         const std::string& resourceId);

   private:
    HttpTransport& _transport;
    UploadOptions _options;
    std::shared_ptr<spdlog::logger> _logger;

    HttpRequest buildCreateRequest(const ByteSource& source,
                                   std::uint64_t totalSize) const;
};

}  // namespace ResumableUpload
