#ifndef VITCO_SERVICES_POWERSERVICE_HPP
#define VITCO_SERVICES_POWERSERVICE_HPP

/**
 * @file PowerService.hpp
 * @brief Power and session signal source plus sleep wake locks.
 *
 * Turns the power signals the session delivers into typed events, detects
 * resume from suspend, and keeps the machine awake while any wake lock is
 * held.
 *
 * @note Thread-safe. Signal collection and resume detection run on their
 *       own threads; events are delivered through the EventBus.
 */

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/IWakeLockProvider.hpp"
#include "core/Result.hpp"
#include "core/TaskTimer.hpp"
#include "platform/PlatformPower.hpp"

namespace vitco {
    /**
     * @brief PowerService maps OS signals to events and manages wake locks.
     *
     * Responsibilities:
     * - SIGTERM/SIGINT -> ShutdownRequested, SIGHUP -> LogoutRequested,
     *   SIGUSR1 -> SystemSuspending, SIGUSR2 -> ScreenLocked
     * - Publish SystemResumed when the suspended time since boot grows
     * - Hold a sleep inhibitor while at least one wake lock is active
     */
    class PowerService : public IWakeLockProvider {
    public:
        PowerService(EventBus& bus, IClock& clock);
        PowerService(const PowerService&) = delete;
        PowerService& operator=(const PowerService&) = delete;
        PowerService(PowerService&&) = delete;
        PowerService& operator=(PowerService&&) = delete;
        ~PowerService() override;

        /**
         * @brief Start the signal thread and the resume monitor.
         *
         * The power signals must already be blocked in every thread
         * (see platform::blockPowerSignals()).
         */
        [[nodiscard]] Status begin();

        /**
         * @brief Stop both threads and drop every wake lock.
         */
        void stop();

        // ==================== Wake Lock Management ====================
        [[nodiscard]] WakeLockHandle requestWakeLock(const char* name) override;
        void releaseWakeLock(WakeLockHandle& handle) override;

        [[nodiscard]] bool hasActiveWakeLocks() const;
        [[nodiscard]] std::uint8_t getActiveWakeLockCount() const;

        /**
         * @brief Event published for a delivered power signal, nullopt if unmapped.
         */
        [[nodiscard]] static std::optional<EventType> eventForSignal(int signalNumber) noexcept;

        static constexpr std::uint32_t SIGNAL_WAIT_MS = 250;
        static constexpr std::uint32_t RESUME_POLL_MS = 2000;
        static constexpr std::uint64_t RESUME_MIN_SLEEP_MS = 1000;

    private:
        void signalTask();
        void checkResume();
        [[nodiscard]] std::uint8_t countActiveLocked() const;

        struct WakeLockEntry {
            std::uint32_t id{0};
            const char* name{""};
            std::uint64_t acquiredAt{0};
        };

        EventBus& m_bus;
        IClock& m_clock;

        std::thread m_signalThread{};
        std::atomic<bool> m_running{false};

        TaskTimer m_resumeTimer{"resume_monitor"};
        std::uint64_t m_lastSuspendedMs{0};

        mutable std::mutex m_wakeLockMutex{};
        std::vector<WakeLockEntry> m_wakeLocks{};
        std::uint32_t m_nextWakeLockId{1};
        platform::SleepInhibitor m_inhibitor;
    };
}

#endif  // VITCO_SERVICES_POWERSERVICE_HPP
