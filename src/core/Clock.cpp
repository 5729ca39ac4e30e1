#include "core/Clock.hpp"

#include <chrono>
#include <thread>

namespace vitco {

    std::uint64_t SystemClock::nowMs() const {
        const auto now{std::chrono::system_clock::now().time_since_epoch()};
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    }

    void SystemClock::sleepFor(const std::uint32_t ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds{ms});
    }

}
