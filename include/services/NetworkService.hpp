#ifndef VITCO_SERVICES_NETWORKSERVICE_HPP
#define VITCO_SERVICES_NETWORKSERVICE_HPP

/**
 * @file NetworkService.hpp
 * @brief Network attachment observer.
 *
 * Reads the attachment on demand and polls it in the background. A change
 * is only published once the new attachment has stayed the same for the
 * settle delay, so a roaming or reconnecting adapter produces one event.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "AppConfig.hpp"
#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/INetworkObserver.hpp"
#include "core/Result.hpp"
#include "core/TaskTimer.hpp"

namespace vitco {

    class NetworkService : public INetworkObserver {
    public:
        NetworkService(EventBus& bus, IClock& clock);
        NetworkService(const NetworkService&) = delete;
        NetworkService& operator=(const NetworkService&) = delete;
        ~NetworkService() override;

        /**
         * @brief Take the initial reading and start polling.
         */
        [[nodiscard]] Status begin(const AttendanceConfig& cfg);

        void stop();

        // ==================== INetworkObserver ====================
        [[nodiscard]] NetworkInfo currentNetwork() override;
        [[nodiscard]] std::optional<std::string> localIpv4Address() override;

        /**
         * @brief Feed one poll reading (the poller calls this with each reading).
         */
        void observe(const NetworkInfo& reading);

        [[nodiscard]] NetworkInfo lastKnown() const;

        static constexpr std::uint32_t COMMAND_TIMEOUT_MS = 5000;

    private:
        EventBus& m_bus;
        IClock& m_clock;
        std::uint32_t m_settleMs{defaults::NETWORK_SETTLE_MS};

        mutable std::mutex m_mutex{};
        NetworkInfo m_stable{};
        std::optional<NetworkInfo> m_candidate{};
        std::uint64_t m_candidateSinceMs{0};

        TaskTimer m_pollTimer{"network_poll"};
    };

}

#endif  // VITCO_SERVICES_NETWORKSERVICE_HPP
