#include "platform/PlatformPower.hpp"

#include "AppConfig.hpp"
#include "core/Logger.hpp"
#include "platform/PlatformProcess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>

namespace vitco::platform
{
namespace
{
constexpr auto *POWER_TAG{"PlatformPower"};

sigset_t powerSignalSet()
{
    sigset_t set{};
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGUSR1);
    sigaddset(&set, SIGUSR2);
    return set;
}

std::uint64_t clockMs(const clockid_t id)
{
    timespec ts{};
    clock_gettime(id, &ts);
    return static_cast<std::uint64_t>(ts.tv_sec) * 1000 + static_cast<std::uint64_t>(ts.tv_nsec) / 1000000;
}
} // namespace

Status blockPowerSignals()
{
    const auto set{powerSignalSet()};
    if (const int rc{pthread_sigmask(SIG_BLOCK, &set, nullptr)}; rc != 0)
    {
        return Status::Error(ErrorCode::OperationFailed, std::strerror(rc));
    }
    return Status::OK();
}

std::optional<int> waitPowerSignal(const std::uint32_t timeoutMs)
{
    const auto set{powerSignalSet()};
    const timespec timeout{
        .tv_sec = static_cast<time_t>(timeoutMs / 1000),
        .tv_nsec = static_cast<long>(timeoutMs % 1000) * 1000000L,
    };

    const int sig{sigtimedwait(&set, nullptr, &timeout)};
    if (sig < 0)
    {
        return std::nullopt;
    }
    return sig;
}

std::uint64_t suspendedTimeMs()
{
    const auto boot{clockMs(CLOCK_BOOTTIME)};
    const auto mono{clockMs(CLOCK_MONOTONIC)};
    return boot > mono ? boot - mono : 0;
}

SleepInhibitor::SleepInhibitor(std::string reason) : m_reason(std::move(reason))
{
}

SleepInhibitor::~SleepInhibitor()
{
    release();
}

Status SleepInhibitor::acquire()
{
    if (m_pid > 0 && isProcessAlive(m_pid))
    {
        return Status::OK();
    }

    auto child{spawnProcess({
        "systemd-inhibit",
        "--what=sleep",
        "--mode=block",
        "--who=" + std::string{defaults::APP_NAME},
        "--why=" + m_reason,
        "sleep",
        "infinity",
    })};
    if (child.failed())
    {
        LOG_WARNING(POWER_TAG, "Cannot start systemd-inhibit: %s", child.status.message.c_str());
        return child.status;
    }

    m_pid = child.value;
    LOG_DEBUG(POWER_TAG, "Sleep inhibited (pid=%d)", static_cast<int>(m_pid));
    return Status::OK();
}

void SleepInhibitor::release()
{
    if (m_pid <= 0)
    {
        return;
    }
    terminateProcess(m_pid);
    LOG_DEBUG(POWER_TAG, "Sleep inhibitor released (pid=%d)", static_cast<int>(m_pid));
    m_pid = -1;
}
} // namespace vitco::platform
