#ifndef VITCO_CORE_IWAKELOCKPROVIDER_HPP
#define VITCO_CORE_IWAKELOCKPROVIDER_HPP

/**
 * @file IWakeLockProvider.hpp
 * @brief Wake locks that keep the machine from suspending.
 */

#include <cstdint>

namespace vitco {
    /**
     * @brief Wake lock handle returned when acquiring a wake lock.
     *        Must be released via releaseWakeLock() when no longer needed.
     */
    struct WakeLockHandle {
        std::uint32_t id{0};
        const char* name{""};

        [[nodiscard]] bool isValid() const noexcept {
            return id != 0;
        }

        void invalidate() noexcept {
            id = 0;
        }
    };

    class IWakeLockProvider {
    public:
        virtual ~IWakeLockProvider() = default;

        /**
         * @brief Request a wake lock to prevent sleep.
         * @param name Human-readable name for debugging (should be string literal)
         * @return Handle to the wake lock (check isValid())
         */
        [[nodiscard]] virtual WakeLockHandle requestWakeLock(const char* name) = 0;

        /**
         * @brief Release a previously acquired wake lock.
         */
        virtual void releaseWakeLock(WakeLockHandle& handle) = 0;
    };

    /**
     * @brief RAII wrapper for wake locks. Automatically releases the lock when destroyed.
     *
     * @note Non-copyable, movable.
     */
    class ScopedWakeLock {
    public:
        ScopedWakeLock(IWakeLockProvider& provider, const char* name) : m_provider(provider), m_handle(provider.requestWakeLock(name)) {}
        ScopedWakeLock(const ScopedWakeLock&) = delete;
        ScopedWakeLock& operator=(const ScopedWakeLock&) = delete;
        ScopedWakeLock(ScopedWakeLock&& other) noexcept : m_provider(other.m_provider), m_handle(other.m_handle) {
            other.m_handle.invalidate();
        }
        ScopedWakeLock& operator=(ScopedWakeLock&&) = delete;
        ~ScopedWakeLock() {
            if (m_handle.isValid()) {
                m_provider.releaseWakeLock(m_handle);
            }
        }

        [[nodiscard]] bool isValid() const noexcept { return m_handle.isValid(); }

    private:
        IWakeLockProvider& m_provider;
        WakeLockHandle m_handle;
    };
}

#endif  // VITCO_CORE_IWAKELOCKPROVIDER_HPP
