#include "core/TaskTimer.hpp"
#include "core/Logger.hpp"

#include <chrono>

namespace vitco {
    namespace {
        constexpr auto* TIMER_TAG{"TaskTimer"};
    }

    TaskTimer::TaskTimer(std::string name) : m_name(std::move(name)) {
    }

    TaskTimer::~TaskTimer() {
        cancel();
    }

    void TaskTimer::startPeriodic(const std::uint32_t intervalMs, Callback cb) {
        start(intervalMs, true, std::move(cb));
    }

    void TaskTimer::startOnce(const std::uint32_t delayMs, Callback cb) {
        start(delayMs, false, std::move(cb));
    }

    void TaskTimer::start(const std::uint32_t intervalMs, const bool periodic, Callback cb) {
        cancel();

        {
            std::lock_guard lock{m_mutex};
            m_cancelled = false;
        }

        m_active.store(true);
        m_thread = std::thread(&TaskTimer::timerTask, this, intervalMs, periodic, std::move(cb));
        LOG_DEBUG(TIMER_TAG, "'%s' scheduled: %s every %ums", m_name.c_str(), periodic ? "periodic" : "once", unsigned{intervalMs});
    }

    void TaskTimer::cancel() {
        {
            std::lock_guard lock{m_mutex};
            m_cancelled = true;
        }
        m_cv.notify_all();

        if (!m_thread.joinable()) {
            return;
        }

        if (m_thread.get_id() == std::this_thread::get_id()) {
            // Cancelled from inside the callback: the worker exits on return.
            m_thread.detach();
        } else {
            m_thread.join();
        }
        m_active.store(false);
    }

    void TaskTimer::timerTask(const std::uint32_t intervalMs, const bool periodic, Callback cb) {
        do {
            {
                std::unique_lock lock{m_mutex};
                if (m_cv.wait_for(lock, std::chrono::milliseconds{intervalMs}, [this] { return m_cancelled; })) {
                    break;
                }
            }

            if (cb) {
                cb();
            }
        } while (periodic);

        m_active.store(false);
    }

}
