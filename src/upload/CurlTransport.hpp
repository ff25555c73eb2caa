#pragma once

#include <absl/strings/string_view.h>

#include <chrono>

#include "HttpTransport.hpp"

namespace ResumableUpload {

namespace detail {

// Applies one raw header line as delivered by curl's header callback.
// A status line discards headers of an earlier interim response.
void applyHeaderLine(absl::string_view line, HttpResponse* response);

}  // namespace detail

/**
 * @brief HttpTransport backed by libcurl's easy interface.
 *
 * Each request uses its own easy handle and a fresh connection.
 * Redirects are not followed.
 */
class CurlTransport : public HttpTransport {
   public:
    struct Options {
        // Zero keeps curl's default
        std::chrono::seconds connectTimeout{0};
        bool verbose = false;
    };

    CurlTransport();
    explicit CurlTransport(Options options);
    ~CurlTransport() override = default;

    absl::StatusOr<HttpResponse> perform(const HttpRequest& request) override;

   private:
    Options _options;

    static size_t headerCallback(char* buffer, size_t size, size_t nitems,
                                 void* userdata);
    static size_t writeCallback(char* contents, size_t size, size_t nmemb,
                                void* userp);
};

}  // namespace ResumableUpload
