#pragma once

#include <chrono>

namespace ResumableUpload {

// Suspends the calling thread. Injected so tests don't wait for real.
class Sleeper {
   public:
    virtual ~Sleeper() = default;

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class ThreadSleeper : public Sleeper {
   public:
    void sleepFor(std::chrono::milliseconds duration) override;
};

}  // namespace ResumableUpload
