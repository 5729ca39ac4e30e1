#ifndef VITCO_SERVICES_BACKENDAPI_HPP
#define VITCO_SERVICES_BACKENDAPI_HPP

/**
 * @file BackendApi.hpp
 * @brief REST client for the attendance server.
 *
 * Every JSON endpoint answers with the envelope
 * `{success, data, message?, error?, errorCode?}`. A rejected call becomes
 * a Status whose message is the body `error`, else `message`, else the
 * transport message, and whose `reasonCode` is the body `errorCode`.
 */

#include <mutex>
#include <string>

#include <ArduinoJson.h>

#include "AppConfig.hpp"
#include "core/IAttendanceApi.hpp"
#include "core/IProxyApi.hpp"
#include "core/ISessionProvider.hpp"
#include "utils/RestClient.hpp"

namespace vitco {

    class BackendApi : public IAttendanceApi, public IProxyApi {
    public:
        BackendApi(const ApiConfig& cfg, ISessionProvider& session);
        BackendApi(const BackendApi&) = delete;
        BackendApi& operator=(const BackendApi&) = delete;
        ~BackendApi() override = default;

        /**
         * @brief Apply a new API configuration (base URL, timeouts).
         */
        void updateConfig(const ApiConfig& cfg);

        /**
         * @brief Base URL in use, with `localhost` rewritten to `127.0.0.1`.
         */
        [[nodiscard]] std::string baseUrl() const;

        // ==================== IAttendanceApi ====================
        [[nodiscard]] Result<AttendanceStatus> getStatus() override;
        [[nodiscard]] Result<AttendanceRecord> checkIn(const CheckInRequest& request) override;
        [[nodiscard]] Result<AttendanceRecord> checkOut(const CheckOutRequest& request) override;
        [[nodiscard]] Result<NetworkValidation> validateNetwork(const NetworkInfo& network) override;

        // ==================== IProxyApi ====================
        [[nodiscard]] Status registerProxy(const std::string& accessToken, const ProxyAnnouncement& announcement) override;
        [[nodiscard]] Status heartbeat(const std::string& accessToken) override;
        [[nodiscard]] Status unregister(const std::string& accessToken) override;
        [[nodiscard]] Result<http::Response> forward(const http::Request& request) override;

        /**
         * @brief `localhost` host names become `127.0.0.1` (avoids IPv6 resolution).
         */
        [[nodiscard]] static std::string normalizeBaseUrl(const std::string& url);

        /**
         * @brief Body `error`, else `message`, else empty.
         */
        [[nodiscard]] static std::string envelopeMessage(JsonVariantConst body);

    private:
        /**
         * @brief Perform one JSON call and unwrap the envelope into `out`.
         * @param bearer Token for the Authorization header, empty for none
         */
        [[nodiscard]] Status call(const char* method, const char* path, const std::string& body, const std::string& bearer, JsonDocument& out);

        http::RestClient m_client{};
        std::string m_baseUrl;
        std::uint32_t m_timeoutMs;
        ISessionProvider& m_session;
        mutable std::mutex m_mutex{};
    };

}

#endif  // VITCO_SERVICES_BACKENDAPI_HPP
