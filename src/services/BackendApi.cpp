#include "services/BackendApi.hpp"

#include "core/Logger.hpp"
#include "utils/TimeFormat.hpp"

namespace vitco {
    namespace {
        constexpr auto* API_TAG{"BackendApi"};
        constexpr int DEFAULT_ERROR_STATUS{500};

        void writeAttachment(JsonObject root, const NetworkInfo& network) {
            if (const auto* wifi = std::get_if<WifiNetwork>(&network)) {
                const auto obj{root["wifi"].to<JsonObject>()};
                obj["ssid"] = wifi->ssid;
                if (wifi->bssid) {
                    obj["bssid"] = *wifi->bssid;
                }
            } else if (const auto* eth = std::get_if<EthernetNetwork>(&network)) {
                root["ethernet"].to<JsonObject>()["macAddress"] = eth->macAddress;
            }
        }

        Result<AttendanceRecord> toRecord(const JsonDocument& doc) {
            const auto data{doc["data"]};
            return Result<AttendanceRecord>::Ok(AttendanceRecord{
                .id = data["id"] | std::string{},
                .status = data["status"] | std::string{},
            });
        }

        // Rejections of attendance submissions always carry an HTTP status.
        Status withDefaultStatus(Status status) {
            if (status.httpStatus == 0) {
                status.httpStatus = DEFAULT_ERROR_STATUS;
            }
            return status;
        }
    }

    BackendApi::BackendApi(const ApiConfig& cfg, ISessionProvider& session)
        : m_baseUrl(normalizeBaseUrl(cfg.baseUrl)), m_timeoutMs(cfg.timeoutMs), m_session(session) {
    }

    void BackendApi::updateConfig(const ApiConfig& cfg) {
        std::lock_guard lock{m_mutex};
        m_baseUrl = normalizeBaseUrl(cfg.baseUrl);
        m_timeoutMs = cfg.timeoutMs;
    }

    std::string BackendApi::baseUrl() const {
        std::lock_guard lock{m_mutex};
        return m_baseUrl;
    }

    std::string BackendApi::normalizeBaseUrl(const std::string& url) {
        constexpr std::string_view localhost{"//localhost"};
        auto out{url};
        if (const auto pos{out.find(localhost)}; pos != std::string::npos) {
            out.replace(pos + 2, localhost.size() - 2, "127.0.0.1");
        }
        while (!out.empty() && out.back() == '/') {
            out.pop_back();
        }
        return out;
    }

    // ==================== Envelope ====================

    std::string BackendApi::envelopeMessage(const JsonVariantConst body) {
        if (const char* error = body["error"]; error && *error) {
            return error;
        }
        if (const char* message = body["message"]; message && *message) {
            return message;
        }
        return {};
    }

    Status BackendApi::call(const char* method, const char* path, const std::string& body, const std::string& bearer, JsonDocument& out) {
        std::string base{};
        std::uint32_t timeoutMs{0};
        {
            std::lock_guard lock{m_mutex};
            base = m_baseUrl;
            timeoutMs = m_timeoutMs;
        }

        http::Request req{
            .method = method,
            .headers = {{"Content-Type", "application/json"}, {"Accept", "application/json"}},
            .body = body,
        };
        if (!bearer.empty()) {
            req.headers.emplace_back("Authorization", "Bearer " + bearer);
        }

        const auto res{m_client.send(http::joinUrl(base, path), req, timeoutMs)};
        if (res.failed()) {
            LOG_WARNING(API_TAG, "%s %s failed: %s", method, path, res.status.message.c_str());
            return res.status;
        }

        const auto& response{res.value};
        const auto parseErr{deserializeJson(out, response.body)};

        if (response.status >= 400) {
            std::string message{};
            std::string reasonCode{};
            if (!parseErr) {
                message = envelopeMessage(out.as<JsonVariantConst>());
                reasonCode = out["errorCode"] | std::string{};
            }
            if (message.empty()) {
                message = "Request failed with status code " + std::to_string(response.status);
            }
            if (response.status == 401) {
                LOG_ERROR(API_TAG, "Authentication failed - session may be expired");
            }
            LOG_WARNING(API_TAG, "%s %s -> %d: %s", method, path, response.status, message.c_str());
            return Status::HttpError(response.status, message, reasonCode);
        }

        if (parseErr) {
            return Status::Error(ErrorCode::JsonError, std::string{"invalid response body: "} + parseErr.c_str());
        }

        if (!(out["success"] | false)) {
            std::string message{envelopeMessage(out.as<JsonVariantConst>())};
            if (message.empty()) {
                message = "Request was not successful";
            }
            return Status::HttpError(response.status, message, out["errorCode"] | std::string{});
        }
        return Status::OK();
    }

    // ==================== IAttendanceApi ====================

    Result<AttendanceStatus> BackendApi::getStatus() {
        JsonDocument doc{};
        if (auto status{call("GET", "/attendance/status", "", m_session.accessToken(), doc)}; status.failed()) {
            return Result<AttendanceStatus>::Error(status);
        }

        const std::string text{doc["data"]["status"] | ""};
        const auto parsed{parseAttendanceStatus(text)};
        if (!parsed) {
            return Result<AttendanceStatus>::Error(ErrorCode::JsonError, "unknown attendance status '" + text + "'");
        }
        return Result<AttendanceStatus>::Ok(*parsed);
    }

    Result<AttendanceRecord> BackendApi::checkIn(const CheckInRequest& request) {
        JsonDocument body{};
        body["source"] = request.source;
        writeAttachment(body.as<JsonObject>(), request.network);
        if (request.systemFingerprint) {
            body["systemFingerprint"] = *request.systemFingerprint;
        }
        std::string json{};
        serializeJson(body, json);

        JsonDocument doc{};
        if (auto status{call("POST", "/attendance/check-in", json, m_session.accessToken(), doc)}; status.failed()) {
            return Result<AttendanceRecord>::Error(withDefaultStatus(std::move(status)));
        }
        return toRecord(doc);
    }

    Result<AttendanceRecord> BackendApi::checkOut(const CheckOutRequest& request) {
        JsonDocument body{};
        body["source"] = request.source;
        writeAttachment(body.as<JsonObject>(), request.network);
        if (request.systemFingerprint) {
            body["systemFingerprint"] = *request.systemFingerprint;
        }
        if (request.checkOutTimeMs) {
            body["checkOutTime"] = utils::toIso8601(*request.checkOutTimeMs);
        }
        std::string json{};
        serializeJson(body, json);

        JsonDocument doc{};
        if (auto status{call("POST", "/attendance/check-out", json, m_session.accessToken(), doc)}; status.failed()) {
            return Result<AttendanceRecord>::Error(withDefaultStatus(std::move(status)));
        }
        return toRecord(doc);
    }

    Result<NetworkValidation> BackendApi::validateNetwork(const NetworkInfo& network) {
        JsonDocument body{};
        if (const auto* wifi = std::get_if<WifiNetwork>(&network)) {
            body["ssid"] = wifi->ssid;
            if (wifi->bssid) {
                body["bssid"] = *wifi->bssid;
            }
        } else if (const auto* eth = std::get_if<EthernetNetwork>(&network)) {
            body["macAddress"] = eth->macAddress;
        } else {
            return Result<NetworkValidation>::Error(ErrorCode::InvalidArgument, "no network to validate");
        }
        std::string json{};
        serializeJson(body, json);

        JsonDocument doc{};
        if (auto status{call("POST", "/wifi/validate", json, m_session.accessToken(), doc)}; status.failed()) {
            return Result<NetworkValidation>::Error(status);
        }

        const auto data{doc["data"]};
        return Result<NetworkValidation>::Ok(NetworkValidation{
            .allowed = data["allowed"] | false,
            .reason = data["reason"] | std::string{},
        });
    }

    // ==================== IProxyApi ====================

    Status BackendApi::registerProxy(const std::string& accessToken, const ProxyAnnouncement& announcement) {
        JsonDocument body{};
        body["ipAddress"] = announcement.ipAddress;
        body["port"] = announcement.port;
        body["deviceName"] = announcement.deviceName;
        std::string json{};
        serializeJson(body, json);

        JsonDocument doc{};
        return call("POST", "/proxy/register", json, accessToken, doc);
    }

    Status BackendApi::heartbeat(const std::string& accessToken) {
        JsonDocument doc{};
        return call("POST", "/proxy/heartbeat", "{}", accessToken, doc);
    }

    Status BackendApi::unregister(const std::string& accessToken) {
        JsonDocument doc{};
        return call("DELETE", "/proxy/unregister", "", accessToken, doc);
    }

    Result<http::Response> BackendApi::forward(const http::Request& request) {
        std::string base{};
        std::uint32_t timeoutMs{0};
        {
            std::lock_guard lock{m_mutex};
            base = m_baseUrl;
            timeoutMs = m_timeoutMs;
        }

        // Host and framing headers are rewritten by the client for the upstream hop
        return m_client.send(base + request.target, request, timeoutMs);
    }

}
