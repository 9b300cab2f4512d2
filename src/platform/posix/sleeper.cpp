#include "fonalink/platform/sleeper.h"

#include <chrono>
#include <thread>

namespace fonalink::platform {

namespace {

class ThreadSleeper final : public ISleeper {
public:
    void sleep_for(std::chrono::milliseconds duration) override
    {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
};

} // namespace

ISleeper& system_sleeper()
{
    static ThreadSleeper sleeper;
    return sleeper;
}

} // namespace fonalink::platform
