#include "services/PowerService.hpp"
#include "core/Logger.hpp"

#include <csignal>
#include <cstring>

namespace vitco {

    namespace {
        constexpr auto* POWER_TAG = "PowerService";
        constexpr std::size_t MAX_WAKE_LOCKS = 16;
    }

    PowerService::PowerService(EventBus& bus, IClock& clock)
        : m_bus(bus), m_clock(clock), m_inhibitor("Checking out of attendance before sleep") {
        m_wakeLocks.reserve(MAX_WAKE_LOCKS);
    }

    PowerService::~PowerService() {
        stop();
    }

    Status PowerService::begin() {
        if (m_running.load()) {
            return Status::OK();
        }

        m_lastSuspendedMs = platform::suspendedTimeMs();
        m_running.store(true);
        m_signalThread = std::thread(&PowerService::signalTask, this);
        m_resumeTimer.startPeriodic(RESUME_POLL_MS, [this] { checkResume(); });

        LOG_INFO(POWER_TAG, "PowerService started (suspended so far: %llums)",
                 static_cast<unsigned long long>(m_lastSuspendedMs));
        return Status::OK();
    }

    void PowerService::stop() {
        const bool wasRunning{m_running.exchange(false)};
        m_resumeTimer.cancel();
        if (m_signalThread.joinable()) {
            m_signalThread.join();
        }

        std::lock_guard lock{m_wakeLockMutex};
        if (!m_wakeLocks.empty()) {
            LOG_WARNING(POWER_TAG, "Dropping %zu wake lock(s) on stop", m_wakeLocks.size());
            m_wakeLocks.clear();
        }
        m_inhibitor.release();
        if (wasRunning) {
            LOG_INFO(POWER_TAG, "PowerService stopped");
        }
    }

    std::optional<EventType> PowerService::eventForSignal(const int signalNumber) noexcept {
        switch (signalNumber) {
            case SIGTERM:
            case SIGINT:  return EventType::ShutdownRequested;
            case SIGHUP:  return EventType::LogoutRequested;
            case SIGUSR1: return EventType::SystemSuspending;
            case SIGUSR2: return EventType::ScreenLocked;
            default:      return std::nullopt;
        }
    }

    void PowerService::signalTask() {
        while (m_running.load()) {
            const auto sig{platform::waitPowerSignal(SIGNAL_WAIT_MS)};
            if (!sig) {
                continue;
            }

            const auto type{eventForSignal(*sig)};
            if (!type) {
                continue;
            }

            LOG_INFO(POWER_TAG, "Signal %d (%s) -> %s", *sig, strsignal(*sig), toString(*type));
            const Event evt{
                .type = *type,
                .payload = PowerSignalEvent{.signalNumber = *sig},
                .timestampMs = m_clock.nowMs(),
                .priority = EventPriority::E_HIGH,
            };
            if (!m_bus.publish(evt)) {
                LOG_ERROR(POWER_TAG, "Failed to publish %s", toString(*type));
            }
        }
    }

    void PowerService::checkResume() {
        const auto suspended{platform::suspendedTimeMs()};
        const auto slept{suspended > m_lastSuspendedMs ? suspended - m_lastSuspendedMs : 0};
        m_lastSuspendedMs = suspended;

        if (slept < RESUME_MIN_SLEEP_MS) {
            return;
        }

        LOG_INFO(POWER_TAG, "System resumed after %llums asleep", static_cast<unsigned long long>(slept));
        const Event evt{
            .type = EventType::SystemResumed,
            .payload = SystemResumedEvent{.sleepDurationMs = slept},
            .timestampMs = m_clock.nowMs(),
        };
        (void)m_bus.publish(evt);
    }

    // ==================== Wake Locks ====================

    WakeLockHandle PowerService::requestWakeLock(const char* name) {
        std::unique_lock lock{m_wakeLockMutex};

        if (m_wakeLocks.size() >= MAX_WAKE_LOCKS) {
            LOG_ERROR(POWER_TAG, "Max wake locks exceeded (%zu)", MAX_WAKE_LOCKS);
            return WakeLockHandle{};
        }

        if (m_wakeLocks.empty()) {
            if (const auto status{m_inhibitor.acquire()}; status.failed()) {
                // Still hand out the lock: callers rely on the scope, not on the inhibitor.
                LOG_WARNING(POWER_TAG, "Sleep inhibitor unavailable: %s", status.message.c_str());
            }
        }

        const auto lockId = m_nextWakeLockId++;
        m_wakeLocks.push_back(WakeLockEntry{
            .id = lockId,
            .name = name,
            .acquiredAt = m_clock.nowMs(),
        });
        const auto activeCount = countActiveLocked();
        lock.unlock();

        LOG_DEBUG(POWER_TAG, "Wake lock acquired: '%s' (id=%u, active=%u)", name, lockId, unsigned{activeCount});

        const Event evt{
            .type = EventType::WakeLockAcquired,
            .payload = WakeLockEvent{
                .lockName = name,
                .lockId = lockId,
                .totalActiveLocks = activeCount
            },
            .timestampMs = m_clock.nowMs()
        };
        (void)m_bus.publish(evt);

        return WakeLockHandle{lockId, name};
    }

    void PowerService::releaseWakeLock(WakeLockHandle& handle) {
        if (!handle.isValid()) {
            return;
        }

        std::unique_lock lock{m_wakeLockMutex};
        const auto before{m_wakeLocks.size()};
        std::erase_if(m_wakeLocks, [&](const WakeLockEntry& wl) { return wl.id == handle.id; });
        const bool found{m_wakeLocks.size() != before};

        if (found && m_wakeLocks.empty()) {
            m_inhibitor.release();
        }
        const auto activeCount = countActiveLocked();
        lock.unlock();

        if (found) {
            LOG_DEBUG(POWER_TAG, "Wake lock released: '%s' (id=%u, remaining=%u)",
                      handle.name, handle.id, unsigned{activeCount});

            const Event evt{
                .type = EventType::WakeLockReleased,
                .payload = WakeLockEvent{
                    .lockName = handle.name,
                    .lockId = handle.id,
                    .totalActiveLocks = activeCount
                },
                .timestampMs = m_clock.nowMs()
            };
            (void)m_bus.publish(evt);
        } else {
            LOG_WARNING(POWER_TAG, "Wake lock not found for release: id=%u", handle.id);
        }

        handle.invalidate();
    }

    bool PowerService::hasActiveWakeLocks() const {
        return getActiveWakeLockCount() > 0;
    }

    std::uint8_t PowerService::getActiveWakeLockCount() const {
        std::lock_guard lock{m_wakeLockMutex};
        return countActiveLocked();
    }

    std::uint8_t PowerService::countActiveLocked() const {
        return static_cast<std::uint8_t>(m_wakeLocks.size());
    }

}
