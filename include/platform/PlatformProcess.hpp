#ifndef VITCO_PLATFORM_PROCESS_HPP
#define VITCO_PLATFORM_PROCESS_HPP

/**
 * @file PlatformProcess.hpp
 * @brief Child process helpers (fork/exec) for the Linux desktop tools
 *
 * The agent talks to `iwgetid`, `nmcli`, `ip`, `zenity`, `notify-send`
 * and `systemd-inhibit` through these helpers. Children start with an
 * empty signal mask even though the agent itself keeps its power
 * signals blocked for the sigwait thread.
 */

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

#include "core/Result.hpp"

namespace vitco::platform
{
struct CommandOutput
{
    int exitCode{-1};
    std::string out{};
};

/**
 * @brief Run `argv` to completion and capture its stdout
 *
 * @param argv Program and arguments, looked up in PATH
 * @param timeoutMs The child is killed once this elapses
 * @return Output and exit code, `Timeout` if killed, `NotFound` if exec failed
 */
[[nodiscard]] Result<CommandOutput> runCommand(const std::vector<std::string> &argv, std::uint32_t timeoutMs);

/**
 * @brief Start `argv` in the background without waiting for it
 *
 * @return The child pid
 */
[[nodiscard]] Result<pid_t> spawnProcess(const std::vector<std::string> &argv);

/**
 * @brief SIGTERM the child and reap it
 */
void terminateProcess(pid_t pid);

/**
 * @brief Non-blocking check that a spawned child is still alive (reaps it if not)
 */
[[nodiscard]] bool isProcessAlive(pid_t pid);
} // namespace vitco::platform

#endif // VITCO_PLATFORM_PROCESS_HPP
