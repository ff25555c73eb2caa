#include "TransferLoop.hpp"

#include <absl/strings/str_cat.h>

#include <algorithm>
#include <utility>

#include "ChunkChecksum.hpp"
#include "Protocol.hpp"

namespace ResumableUpload {

TransferLoop::TransferLoop(UploadSession session, HttpTransport& transport,
                           ByteSource& source, Sleeper& sleeper,
                           UploadOptions options,
                           std::shared_ptr<spdlog::logger> logger)
    : _session(std::move(session)),
      _transport(transport),
      _source(source),
      _sleeper(sleeper),
      _options(std::move(options)),
      _logger(std::move(logger)) {}

TransferLoop::Stats TransferLoop::run() {
    while (step() != State::Complete) {
    }
    _logger->info("File upload complete: {} bytes, {} appends, {} retries",
                  _session.totalSize(), _stats.appends, _stats.retries);
    return _stats;
}

TransferLoop::State TransferLoop::step() {
    switch (_state) {
        case State::Discovering: {
            const auto offset = discoverOffset();
            if (!offset.ok()) {
                retryAfterFailure(offset.status());
                break;
            }
            _offset = *offset;
            if (_offset >= _session.totalSize()) {
                _state = State::Complete;
            } else {
                _state = State::Sending;
            }
            break;
        }
        case State::Sending: {
            if (auto status = sendChunk(_offset); !status.ok()) {
                retryAfterFailure(status);
                break;
            }
            _state = State::Discovering;
            break;
        }
        case State::Complete:
            break;
    }
    return _state;
}

absl::StatusOr<std::uint64_t> TransferLoop::discoverOffset() {
    HttpRequest request;
    request.method = HttpMethod::Head;
    request.url = Protocol::resourceUrl(_options.serverBaseUrl,
                                        _session.resourceId());
    request.headers = {{Protocol::kResumableHeader, Protocol::kVersion}};

    const auto response = _transport.perform(request);
    if (!response.ok()) {
        return response.status();
    }
    if (auto status = Protocol::statusFromResponse(*response, "Query offset");
        !status.ok()) {
        return status;
    }
    auto offset = Protocol::parseOffset(*response);
    if (!offset.ok()) {
        return offset.status();
    }
    _logger->debug("Check file upload offset: {}/{}", *offset,
                   _session.totalSize());
    return offset;
}

absl::Status TransferLoop::sendChunk(std::uint64_t offset) {
    const std::uint64_t remaining = _session.totalSize() - offset;
    const auto length =
        static_cast<std::size_t>(std::min(_options.chunkSize, remaining));

    // The source is only held open while the chunk is read
    auto chunk = _source.read(offset, length);
    if (!chunk.ok()) {
        return chunk.status();
    }

    HttpRequest request;
    request.method = HttpMethod::Patch;
    request.url = Protocol::resourceUrl(_options.serverBaseUrl,
                                        _session.resourceId());
    request.headers = {
        {Protocol::kContentTypeHeader, Protocol::kAppendContentType},
        {Protocol::kResumableHeader, Protocol::kVersion},
        {Protocol::kUploadOffsetHeader, absl::StrCat(offset)},
    };
    if (_options.checksum != ChecksumAlgorithm::None) {
        auto checksum = uploadChecksumHeader(_options.checksum, *chunk);
        if (!checksum.ok()) {
            return checksum.status();
        }
        request.headers.emplace_back(Protocol::kUploadChecksumHeader,
                                     std::move(checksum).value());
    }
    request.body = std::move(chunk).value();

    _logger->debug("Sending file chunk: chunk_size={} offset={}", length,
                   offset);
    const auto response = _transport.perform(request);
    if (!response.ok()) {
        return response.status();
    }
    if (auto status = Protocol::statusFromResponse(*response, "Append chunk");
        !status.ok()) {
        return status;
    }

    ++_stats.appends;
    _stats.bytesSent += length;
    _logger->debug("Check file upload response: status={} Upload-Offset={}",
                   response->status,
                   response->header(Protocol::kUploadOffsetHeader)
                       .value_or("(none)"));
    return absl::OkStatus();
}

void TransferLoop::retryAfterFailure(const absl::Status& status) {
    ++_stats.retries;
    _logger->warn("Error during upload, retrying in {}ms: {}",
                  _options.retryDelay.count(), status.ToString());
    _state = State::Discovering;
    _sleeper.sleepFor(_options.retryDelay);
}

std::ostream& operator<<(std::ostream& os, TransferLoop::State state) {
    switch (state) {
        case TransferLoop::State::Discovering:
            return os << "Discovering";
        case TransferLoop::State::Sending:
            return os << "Sending";
        case TransferLoop::State::Complete:
            return os << "Complete";
    }
    return os;
}

}  // namespace ResumableUpload
