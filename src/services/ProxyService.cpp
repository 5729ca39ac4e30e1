#include "services/ProxyService.hpp"

#include "core/Logger.hpp"
#include "platform/PlatformSystem.hpp"

#include <ArduinoJson.h>
#include <httplib.h>

#include <algorithm>
#include <cmath>

namespace vitco {
    namespace {
        constexpr auto *PROXY_TAG{"Proxy"};
        constexpr auto *DEFAULT_DEVICE_NAME{"Desktop Proxy"};
        constexpr auto *LISTEN_ADDRESS{"0.0.0.0"};
        constexpr auto *ANY_PATH{R"(.*)"};

        void setHeader(http::Headers &headers, const char *name, const char *value) {
            std::erase_if(headers, [name](const auto &header) {
                return http::equalsIgnoreCase(header.first, name);
            });
            headers.emplace_back(name, value);
        }

        void addCorsHeaders(http::Response &response) {
            setHeader(response.headers, "Access-Control-Allow-Origin", "*");
            setHeader(response.headers, "Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            setHeader(response.headers, "Access-Control-Allow-Headers", "Content-Type, Authorization");
        }

        http::Response jsonResponse(const int status, const JsonDocument &doc) {
            http::Response response{};
            response.status = status;
            response.headers.emplace_back("Content-Type", "application/json");
            serializeJson(doc, response.body);
            return response;
        }
    }

    ProxyService::ProxyService(EventBus &bus, IClock &clock, IProxyApi &api, ISessionProvider &session,
                               INetworkObserver &network, const ProxyConfig &cfg, std::string mainServerUrl)
        : m_bus(bus), m_clock(clock), m_api(api), m_session(session), m_network(network), m_cfg(cfg) {
        m_deviceName = platform::hostName();
        if (m_deviceName.empty()) {
            m_deviceName = DEFAULT_DEVICE_NAME;
        }
        m_state.port = cfg.port;
        m_state.mainServerUrl = std::move(mainServerUrl);
    }

    ProxyService::~ProxyService() {
        stop();
        closeListener();
    }

    Result<ProxyEndpoint> ProxyService::start() {
        if (m_running.load()) {
            const auto current{status()};
            return Result<ProxyEndpoint>(ProxyEndpoint{current.port, current.ipAddress.value_or("")});
        }

        const auto ip{m_network.localIpv4Address()};
        if (!ip) {
            LOG_ERROR(PROXY_TAG, "No network interface found");
            return Result<ProxyEndpoint>(ErrorCode::NetworkError, "No network interface found");
        }

        const auto port{listen()};
        if (port.failed()) {
            LOG_ERROR(PROXY_TAG, "Failed to start relay: %s", port.status.message.c_str());
            return Result<ProxyEndpoint>(port.status);
        }

        const ProxyEndpoint endpoint{port.value, *ip};
        {
            std::lock_guard lock{m_mutex};
            m_state.isRunning = true;
            m_state.port = endpoint.port;
            m_state.ipAddress = endpoint.ipAddress;
        }
        m_running.store(true);
        LOG_INFO(PROXY_TAG, "Relay listening on %s:%u -> %s", endpoint.ipAddress.c_str(), unsigned{endpoint.port}, status().mainServerUrl.c_str());

        (void)registerWithServer();

        m_heartbeatTimer.startPeriodic(m_cfg.heartbeatIntervalMs, [this] { sendHeartbeat(); });
        m_reregisterTimer.startPeriodic(m_cfg.reregisterIntervalMs, [this] { checkRegistration(); });

        publishState();
        return Result<ProxyEndpoint>(endpoint);
    }

    void ProxyService::stop() {
        if (!m_running.exchange(false)) {
            return;
        }

        m_heartbeatTimer.cancel();
        m_reregisterTimer.cancel();

        unregisterFromServer();

        closeListener();

        {
            std::lock_guard lock{m_mutex};
            m_state.isRunning = false;
            m_state.isRegistered = false;
            m_state.ipAddress.reset();
        }
        publishState();
        LOG_INFO(PROXY_TAG, "Relay stopped");
    }

    Result<std::uint16_t> ProxyService::listen() {
        auto server{std::make_unique<httplib::Server>()};
        const auto relay = [this](const httplib::Request &req, httplib::Response &res) {
            http::toLibrary(handleRequest(http::fromLibrary(req)), res);
        };
        server->Get(ANY_PATH, relay);
        server->Post(ANY_PATH, relay);
        server->Put(ANY_PATH, relay);
        server->Patch(ANY_PATH, relay);
        server->Delete(ANY_PATH, relay);
        server->Options(ANY_PATH, relay);

        int port{m_cfg.port};
        if (port == 0) {
            port = server->bind_to_any_port(LISTEN_ADDRESS);
        } else if (!server->bind_to_port(LISTEN_ADDRESS, port)) {
            port = -1;
        }
        if (port <= 0) {
            return Result<std::uint16_t>::Error(ErrorCode::ResourceBusy, "Port " + std::to_string(m_cfg.port) + " is already in use");
        }

        m_serverThread = std::thread([srv = server.get()] {
            if (!srv->listen_after_bind()) {
                LOG_ERROR(PROXY_TAG, "Relay listener exited with an error");
            }
        });
        server->wait_until_ready();
        m_server = std::move(server);
        return Result<std::uint16_t>::Ok(static_cast<std::uint16_t>(port));
    }

    void ProxyService::closeListener() {
        if (m_server) {
            m_server->stop();
        }
        if (m_serverThread.joinable()) {
            m_serverThread.join();
        }
        m_server.reset();
    }

    ProxyRegistration ProxyService::status() const {
        std::lock_guard lock{m_mutex};
        return m_state;
    }

    // ==================== Relay ====================

    http::Response ProxyService::handleRequest(const http::Request &request) {
        http::Response response{};

        if (request.method == "OPTIONS") {
            response.status = 200;
        } else if (request.method == "GET" && request.target == "/health") {
            const auto state{status()};
            const auto user{m_session.user()};

            JsonDocument doc;
            doc["success"] = true;
            auto proxy{doc["proxy"].to<JsonObject>()};
            if (state.ipAddress) {
                proxy["ip"] = *state.ipAddress;
            } else {
                proxy["ip"] = nullptr;
            }
            proxy["port"] = state.port;
            proxy["isRunning"] = state.isRunning;
            if (user && !user->id.empty()) {
                proxy["userId"] = user->id;
            } else {
                proxy["userId"] = nullptr;
            }
            proxy["deviceName"] = m_deviceName;
            response = jsonResponse(200, doc);
        } else {
            auto upstream{m_api.forward(request)};
            if (upstream.ok()) {
                response = std::move(upstream.value);
            } else {
                LOG_WARNING(PROXY_TAG, "Forwarding %s %s failed: %s", request.method.c_str(), request.target.c_str(), upstream.status.message.c_str());
                JsonDocument doc;
                doc["success"] = false;
                doc["message"] = upstream.status.message.empty() ? std::string{"Proxy error"} : upstream.status.message;
                response = jsonResponse(500, doc);
            }
        }

        addCorsHeaders(response);
        LOG_DEBUG(PROXY_TAG, "%s %s -> %d", request.method.c_str(), request.target.c_str(), response.status);
        return response;
    }

    // ==================== Registration ====================

    std::uint32_t ProxyService::backoffDelayMs(const ProxyConfig &cfg, const std::uint8_t attempt) noexcept {
        const auto delay{static_cast<double>(cfg.backoffMinMs) * std::pow(static_cast<double>(cfg.backoffMultiplier), attempt)};
        return static_cast<std::uint32_t>(std::min(delay, static_cast<double>(cfg.backoffMaxMs)));
    }

    Status ProxyService::registerOnce(const ProxyAnnouncement &announcement, bool &refreshed) {
        auto result{m_api.registerProxy(m_session.accessToken(), announcement)};
        if (!result.isUnauthorized() || refreshed) {
            return result;
        }

        refreshed = true;
        LOG_INFO(PROXY_TAG, "Token expired, refreshing before retrying registration");
        const auto fresh{m_session.refreshAccessToken()};
        if (!fresh.ok()) {
            LOG_WARNING(PROXY_TAG, "Token refresh failed: %s", fresh.status.message.c_str());
            return fresh.status;
        }
        return m_api.registerProxy(fresh.value, announcement);
    }

    Status ProxyService::registerWithServer() {
        std::lock_guard registering{m_registerMutex};

        ProxyAnnouncement announcement{};
        {
            std::lock_guard lock{m_mutex};
            announcement.ipAddress = m_state.ipAddress.value_or("");
            announcement.port = m_state.port;
            m_state.lastAttemptMs = m_clock.nowMs();
        }
        announcement.deviceName = m_deviceName;

        const auto fail = [this](Status status) {
            {
                std::lock_guard lock{m_mutex};
                m_state.isRegistered = false;
                m_state.lastError = status.message;
            }
            LOG_WARNING(PROXY_TAG, "Registration failed: %s - relay keeps running", status.message.c_str());
            publishState();
            return status;
        };

        const auto user{m_session.user()};
        if (!user || user->id.empty()) {
            return fail(Status::Error(ErrorCode::AuthError, "Cannot register - user not authenticated"));
        }
        if (m_session.accessToken().empty()) {
            return fail(Status::Error(ErrorCode::AuthError, "Cannot register - no valid session"));
        }

        bool refreshed{false};
        Status last{};
        for (std::uint8_t attempt = 0;; ++attempt) {
            last = registerOnce(announcement, refreshed);
            if (last.ok()) {
                {
                    std::lock_guard lock{m_mutex};
                    m_state.isRegistered = true;
                    m_state.lastError.reset();
                }
                LOG_INFO(PROXY_TAG, "Registered with main server as %s (%s:%u)", m_deviceName.c_str(), announcement.ipAddress.c_str(), unsigned{announcement.port});
                publishState();
                return Status::OK();
            }

            // A 401 that survived the refresh will not get better by waiting
            if (last.code == ErrorCode::AuthError || attempt >= m_cfg.maxRetries || !m_running.load()) {
                break;
            }

            const auto delayMs{backoffDelayMs(m_cfg, attempt)};
            LOG_WARNING(PROXY_TAG, "Registration failed (%s), retry %u/%u in %ums", last.message.c_str(),
                        unsigned(attempt + 1), unsigned{m_cfg.maxRetries}, unsigned{delayMs});
            m_clock.sleepFor(delayMs);
        }

        return fail(last);
    }

    void ProxyService::sendHeartbeat() {
        const auto token{m_session.accessToken()};
        if (token.empty()) {
            LOG_WARNING(PROXY_TAG, "Cannot send heartbeat - no access token");
            return;
        }

        auto result{m_api.heartbeat(token)};
        if (result.isUnauthorized()) {
            const auto fresh{m_session.refreshAccessToken()};
            if (!fresh.ok()) {
                LOG_WARNING(PROXY_TAG, "Heartbeat unauthorized and token refresh failed: %s", fresh.status.message.c_str());
                return;
            }
            result = m_api.heartbeat(fresh.value);
            if (result.isUnauthorized()) {
                LOG_WARNING(PROXY_TAG, "Heartbeat still unauthorized after token refresh");
                return;
            }
        }

        if (result.failed()) {
            LOG_WARNING(PROXY_TAG, "Heartbeat failed: %s", result.message.c_str());
            return;
        }
        LOG_TRACE(PROXY_TAG, "Heartbeat ok");
    }

    void ProxyService::checkRegistration() {
        if (!m_running.load()) {
            return;
        }

        const auto ip{m_network.localIpv4Address()};
        if (!ip) {
            LOG_WARNING(PROXY_TAG, "No LAN address, keeping current registration");
            return;
        }

        bool reregister{false};
        {
            std::lock_guard lock{m_mutex};
            if (m_state.ipAddress != ip) {
                LOG_INFO(PROXY_TAG, "LAN address changed: %s -> %s", m_state.ipAddress.value_or("none").c_str(), ip->c_str());
                m_state.ipAddress = ip;
                reregister = true;
            } else if (!m_state.isRegistered) {
                reregister = true;
            }
        }

        if (reregister) {
            (void)registerWithServer();
        }
    }

    void ProxyService::unregisterFromServer() {
        const auto token{m_session.accessToken()};
        if (token.empty()) {
            LOG_WARNING(PROXY_TAG, "Cannot unregister - no access token");
            return;
        }

        auto result{m_api.unregister(token)};
        if (result.isUnauthorized()) {
            if (const auto fresh{m_session.refreshAccessToken()}; fresh.ok()) {
                result = m_api.unregister(fresh.value);
            }
        }
        if (result.failed()) {
            LOG_WARNING(PROXY_TAG, "Unregistration failed: %s", result.message.c_str());
            return;
        }
        LOG_INFO(PROXY_TAG, "Unregistered from main server");
    }

    void ProxyService::publishState() {
        const auto state{status()};
        const Event evt{
            .type = EventType::ProxyStateChanged,
            .payload = ProxyStateEvent{
                .running = state.isRunning,
                .registered = state.isRegistered,
                .ipAddress = state.ipAddress.value_or(""),
                .port = state.port,
            },
            .timestampMs = m_clock.nowMs(),
        };
        (void)m_bus.publish(evt);
    }

}
