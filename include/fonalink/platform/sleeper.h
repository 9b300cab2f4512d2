#pragma once

#include <chrono>

namespace fonalink::platform {

// Blocking wait used by protocol code. Swapped for a recording fake in tests.
class ISleeper {
public:
    virtual ~ISleeper() = default;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

// std::this_thread::sleep_for
ISleeper& system_sleeper();

} // namespace fonalink::platform
