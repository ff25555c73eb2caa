#pragma once

#include <gmock/gmock.h>

#include <Sleeper.hpp>

class MockSleeper : public ResumableUpload::Sleeper {
   public:
    MOCK_METHOD(void, sleepFor, (std::chrono::milliseconds duration),
                (override));
};
