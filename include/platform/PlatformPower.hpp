#ifndef VITCO_PLATFORM_POWER_HPP
#define VITCO_PLATFORM_POWER_HPP

/**
 * @file PlatformPower.hpp
 * @brief Linux power and session signal plumbing
 *
 * Session and power notifications reach the agent as POSIX signals
 * (sent by the session manager, a logind hook or the user). The signals
 * are blocked in every thread and collected by one `sigtimedwait` loop.
 *
 * Suspend is observed indirectly: CLOCK_BOOTTIME keeps counting while
 * the machine sleeps and CLOCK_MONOTONIC does not, so a jump in their
 * difference is the time spent suspended.
 */

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string>

#include "core/Result.hpp"

namespace vitco::platform
{
/**
 * @brief Block SIGTERM, SIGINT, SIGHUP, SIGUSR1 and SIGUSR2 in the calling thread
 *
 * Call from main() before any thread is created so every thread inherits
 * the mask and the signals are only seen by `waitPowerSignal`.
 */
[[nodiscard]] Status blockPowerSignals();

/**
 * @brief Wait for one of the blocked power signals
 *
 * @return The signal number, or nullopt on timeout
 */
[[nodiscard]] std::optional<int> waitPowerSignal(std::uint32_t timeoutMs);

/**
 * @brief Milliseconds the machine has spent suspended since boot
 */
[[nodiscard]] std::uint64_t suspendedTimeMs();

/**
 * @brief Holds a `systemd-inhibit --what=sleep --mode=block` child while acquired
 */
class SleepInhibitor
{
public:
    explicit SleepInhibitor(std::string reason);
    SleepInhibitor(const SleepInhibitor &) = delete;
    SleepInhibitor &operator=(const SleepInhibitor &) = delete;
    ~SleepInhibitor();

    [[nodiscard]] Status acquire();
    void release();

    [[nodiscard]] bool isHeld() const noexcept
    {
        return m_pid > 0;
    }

private:
    std::string m_reason;
    pid_t m_pid{-1};
};
} // namespace vitco::platform

#endif // VITCO_PLATFORM_POWER_HPP
