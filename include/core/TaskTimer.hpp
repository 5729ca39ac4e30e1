#ifndef VITCO_CORE_TASKTIMER_HPP
#define VITCO_CORE_TASKTIMER_HPP

/**
 * @file TaskTimer.hpp
 * @brief Supervised one-shot and periodic timer.
 *
 * Each TaskTimer owns one worker thread. `cancel()` wakes the worker,
 * joins it and guarantees the callback will not run again, so the owner
 * can tear down the resources the callback touches right after.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace vitco {

    class TaskTimer {
    public:
        using Callback = std::function<void()>;

        explicit TaskTimer(std::string name);
        TaskTimer(const TaskTimer&) = delete;
        TaskTimer& operator=(const TaskTimer&) = delete;
        TaskTimer(TaskTimer&&) = delete;
        TaskTimer& operator=(TaskTimer&&) = delete;
        ~TaskTimer();

        /**
         * @brief Run `cb` every `intervalMs` until cancelled.
         *        Replaces any schedule already running on this timer.
         */
        void startPeriodic(std::uint32_t intervalMs, Callback cb);

        /**
         * @brief Run `cb` once after `delayMs`.
         *        Replaces any schedule already running on this timer.
         */
        void startOnce(std::uint32_t delayMs, Callback cb);

        /**
         * @brief Stop the schedule and wait for an in-flight callback.
         */
        void cancel();

        [[nodiscard]] bool isActive() const noexcept {
            return m_active.load();
        }

        [[nodiscard]] const std::string& name() const noexcept {
            return m_name;
        }

    private:
        void start(std::uint32_t intervalMs, bool periodic, Callback cb);
        void timerTask(std::uint32_t intervalMs, bool periodic, Callback cb);

        std::string m_name;
        std::thread m_thread{};
        std::mutex m_mutex{};
        std::condition_variable m_cv{};
        bool m_cancelled{false};
        std::atomic<bool> m_active{false};
    };

}

#endif  // VITCO_CORE_TASKTIMER_HPP
