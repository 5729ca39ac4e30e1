#ifndef VITCO_SERVICES_PROXYSERVICE_HPP
#define VITCO_SERVICES_PROXYSERVICE_HPP

/**
 * @file ProxyService.hpp
 * @brief Local HTTP relay that lets mobile devices reach the server through this host.
 *
 * The relay listens on all interfaces and forwards every request to the
 * main server unchanged. It announces itself to the server with its LAN
 * address and keeps that registration alive with heartbeats; a periodic
 * check re-registers when the address changes or a registration was lost.
 * A failed registration never stops the relay itself.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "AppConfig.hpp"
#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/INetworkObserver.hpp"
#include "core/IProxyApi.hpp"
#include "core/ISessionProvider.hpp"
#include "core/Result.hpp"
#include "core/TaskTimer.hpp"
#include "utils/HttpMessage.hpp"

namespace httplib {
    class Server;
}

namespace vitco {

    struct ProxyEndpoint {
        std::uint16_t port{0};
        std::string ipAddress{};
    };

    struct ProxyRegistration {
        bool isRunning{false};
        std::uint16_t port{0};
        std::optional<std::string> ipAddress{};
        bool isRegistered{false};
        std::optional<std::uint64_t> lastAttemptMs{};
        std::optional<std::string> lastError{};
        std::string mainServerUrl{};
    };

    class ProxyService {
    public:
        ProxyService(EventBus& bus,
                     IClock& clock,
                     IProxyApi& api,
                     ISessionProvider& session,
                     INetworkObserver& network,
                     const ProxyConfig& cfg,
                     std::string mainServerUrl);
        ProxyService(const ProxyService&) = delete;
        ProxyService& operator=(const ProxyService&) = delete;
        ~ProxyService();

        /**
         * @brief Bind the listener, register and start the keep-alive timers.
         *
         * Fails only when there is no LAN address or the port is taken.
         */
        [[nodiscard]] Result<ProxyEndpoint> start();

        /**
         * @brief Cancel timers, unregister (best effort) and close the listener.
         */
        void stop();

        [[nodiscard]] ProxyRegistration status() const;

        // ==================== Protocol ====================

        /**
         * @brief Answer one relay request (CORS, OPTIONS, /health, forwarding).
         */
        [[nodiscard]] http::Response handleRequest(const http::Request& request);

        /**
         * @brief Register with retry and backoff. Never throws, never fatal.
         */
        Status registerWithServer();

        void sendHeartbeat();

        /**
         * @brief Re-register when the LAN address changed or the last registration failed.
         */
        void checkRegistration();

        /**
         * @brief Delay before retry number `attempt` (0 based).
         */
        [[nodiscard]] static std::uint32_t backoffDelayMs(const ProxyConfig& cfg, std::uint8_t attempt) noexcept;

        [[nodiscard]] const std::string& deviceName() const noexcept {
            return m_deviceName;
        }

    private:
        /**
         * @brief One registration call, with a single token refresh on 401.
         */
        [[nodiscard]] Status registerOnce(const ProxyAnnouncement& announcement, bool& refreshed);

        /**
         * @brief Bind 0.0.0.0 on the configured port (0 picks a free one).
         * @return the bound port
         */
        [[nodiscard]] Result<std::uint16_t> listen();

        void closeListener();

        void unregisterFromServer();
        void publishState();

        EventBus& m_bus;
        IClock& m_clock;
        IProxyApi& m_api;
        ISessionProvider& m_session;
        INetworkObserver& m_network;
        ProxyConfig m_cfg;
        std::string m_deviceName;

        mutable std::mutex m_mutex{};
        ProxyRegistration m_state{};

        std::mutex m_registerMutex{};
        std::atomic<bool> m_running{false};

        std::unique_ptr<httplib::Server> m_server{};
        std::thread m_serverThread{};
        TaskTimer m_heartbeatTimer{"proxy_heartbeat"};
        TaskTimer m_reregisterTimer{"proxy_reregister"};
    };

}

#endif  // VITCO_SERVICES_PROXYSERVICE_HPP
