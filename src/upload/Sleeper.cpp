#include "Sleeper.hpp"

#include <thread>

namespace ResumableUpload {

void ThreadSleeper::sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

}  // namespace ResumableUpload
