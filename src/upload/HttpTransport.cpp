#include "HttpTransport.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>

#include <utility>

namespace ResumableUpload {

std::string_view toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Head:
            return "HEAD";
        case HttpMethod::Post:
            return "POST";
        case HttpMethod::Patch:
            return "PATCH";
    }
    return "UNKNOWN";
}

std::optional<std::string> HttpRequest::header(absl::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (absl::EqualsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> HttpResponse::header(absl::string_view name) const {
    const auto it = headers.find(absl::AsciiStrToLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

void HttpResponse::setHeader(absl::string_view name, std::string value) {
    headers[absl::AsciiStrToLower(name)] = std::move(value);
}

}  // namespace ResumableUpload
