#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <ostream>

#include "ByteSource.hpp"
#include "HttpTransport.hpp"
#include "Sleeper.hpp"
#include "UploadOptions.hpp"
#include "UploadSession.hpp"

namespace ResumableUpload {

/**
 * @brief Drives one UploadSession to completion.
 *
 * Discovering -> Sending -> Discovering ... -> Complete
 *
 * The offset is always taken from the server before a chunk is sent. Every
 * failure is transient: it is logged, the retry delay is waited once, and
 * the loop goes back to Discovering. Complete is the only terminal state.
 *
 * At most one request is outstanding at any time.
 */
class TransferLoop {
   public:
    enum class State { Discovering, Sending, Complete };

    struct Stats {
        // Successful append requests
        std::uint64_t appends = 0;
        // Failed iterations, each followed by one retry delay
        std::uint64_t retries = 0;
        // Payload bytes of successful appends
        std::uint64_t bytesSent = 0;
    };

    TransferLoop(UploadSession session, HttpTransport& transport,
                 ByteSource& source, Sleeper& sleeper, UploadOptions options,
                 std::shared_ptr<spdlog::logger> logger);

    // Runs until Complete. Never returns otherwise.
    Stats run();

    // Performs one transition and returns the new state.
    State step();

    [[nodiscard]] State state() const { return _state; }
    [[nodiscard]] const Stats& stats() const { return _stats; }
    // Offset most recently reported by the server
    [[nodiscard]] std::uint64_t offset() const { return _offset; }
    [[nodiscard]] const UploadSession& session() const { return _session; }

   private:
    UploadSession _session;
    HttpTransport& _transport;
    ByteSource& _source;
    Sleeper& _sleeper;
    UploadOptions _options;
    std::shared_ptr<spdlog::logger> _logger;

    State _state = State::Discovering;
    std::uint64_t _offset = 0;
    Stats _stats;

    absl::StatusOr<std::uint64_t> discoverOffset();
    absl::Status sendChunk(std::uint64_t offset);
    void retryAfterFailure(const absl::Status& status);
};

std::ostream& operator<<(std::ostream& os, TransferLoop::State state);

}  // namespace ResumableUpload
