#pragma once

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ResumableUpload {

enum class HttpMethod { Head, Post, Patch };

std::string_view toString(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::Head;
    std::string url;
    // Sent in insertion order
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Returns the first header with a case-insensitive name match
    [[nodiscard]] std::optional<std::string> header(
        absl::string_view name) const;
};

struct HttpResponse {
    long status = 0;
    // Keys are lower-cased header names
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] std::optional<std::string> header(
        absl::string_view name) const;
    void setHeader(absl::string_view name, std::string value);
};

/**
 * @brief Performs one HTTP exchange.
 *
 * Implementations must not follow redirects and must report only transport
 * level failures (DNS, connect, send, receive) as an error status. Any HTTP
 * status received from the server is returned inside HttpResponse.
 */
class HttpTransport {
   public:
    virtual ~HttpTransport() = default;

    virtual absl::StatusOr<HttpResponse> perform(const HttpRequest& request) = 0;
};

}  // namespace ResumableUpload
