#include "CurlTransport.hpp"

#include <LogCompat.hpp>
#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <curl/curl.h>
#include <fmt/format.h>

#include <memory>
#include <string>
#include <utility>

namespace ResumableUpload {

CurlTransport::CurlTransport() : CurlTransport(Options{}) {}

CurlTransport::CurlTransport(Options options) : _options(options) {}

namespace detail {

void applyHeaderLine(absl::string_view line, HttpResponse* response) {
    // A new status line starts a new header block (e.g. after 100 Continue)
    if (absl::StartsWithIgnoreCase(line, "HTTP/")) {
        response->headers.clear();
        return;
    }
    const auto colon = line.find(':');
    if (colon == absl::string_view::npos) {
        return;
    }
    const absl::string_view name =
        absl::StripAsciiWhitespace(line.substr(0, colon));
    const absl::string_view value =
        absl::StripAsciiWhitespace(line.substr(colon + 1));
    response->setHeader(name, std::string(value));
}

}  // namespace detail

size_t CurlTransport::headerCallback(char* buffer, size_t size, size_t nitems,
                                     void* userdata) {
    const size_t length = size * nitems;
    detail::applyHeaderLine(absl::string_view(buffer, length),
                            static_cast<HttpResponse*>(userdata));
    return length;
}

size_t CurlTransport::writeCallback(char* contents, size_t size, size_t nmemb,
                                    void* userp) {
    static_cast<std::string*>(userp)->append(contents, size * nmemb);
    return size * nmemb;
}

absl::StatusOr<HttpResponse> CurlTransport::perform(
    const HttpRequest& request) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl{
        curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        LOG(ERROR) << "Cannot initialize curl";
        return absl::InternalError("curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList{
        nullptr, &curl_slist_free_all};
    for (const auto& [name, value] : request.headers) {
        const std::string line = absl::StrCat(name, ": ", value);
        curl_slist* appended = curl_slist_append(headerList.get(), line.c_str());
        if (appended == nullptr) {
            return absl::ResourceExhaustedError("curl_slist_append failed");
        }
        (void)headerList.release();
        headerList.reset(appended);
    }
    // Don't wait for 100-continue before sending chunk bodies
    if (request.method != HttpMethod::Head) {
        curl_slist* appended = curl_slist_append(headerList.get(), "Expect:");
        if (appended == nullptr) {
            return absl::ResourceExhaustedError("curl_slist_append failed");
        }
        (void)headerList.release();
        headerList.reset(appended);
    }

    HttpResponse response;
    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
    // One connection per request
    curl_easy_setopt(handle, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(handle, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    if (_options.connectTimeout.count() > 0) {
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(_options.connectTimeout.count()));
    }
    if (_options.verbose) {
        curl_easy_setopt(handle, CURLOPT_VERBOSE, 1L);
    }

    switch (request.method) {
        case HttpMethod::Head:
            curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            break;
        case HttpMethod::Patch:
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "PATCH");
            break;
    }
    if (request.method != HttpMethod::Head) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
    }

    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);

    const CURLcode res = curl_easy_perform(handle);
    if (res != CURLE_OK) {
        return absl::UnavailableError(
            fmt::format("{} {} failed: {}", toString(request.method),
                        request.url, curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    response.status = status;
    DLOG(INFO) << toString(request.method) << " " << request.url << " -> "
               << status;
    return response;
}

}  // namespace ResumableUpload
