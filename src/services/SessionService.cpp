#include "services/SessionService.hpp"

#include "core/Logger.hpp"
#include "services/BackendApi.hpp"
#include "utils/FileUtils.hpp"

#include <ArduinoJson.h>

namespace vitco {
    namespace {
        constexpr auto* SESSION_TAG{"Session"};
        constexpr auto* SESSION_FILE_NAME{"auth-session.json"};

        std::string readId(const JsonVariantConst id) {
            if (id.is<const char*>()) {
                return id.as<const char*>();
            }
            if (id.is<long long>()) {
                return std::to_string(id.as<long long>());
            }
            return {};
        }

        // Zustand-style persistence nests the payload under "state".
        JsonObject sessionObject(JsonDocument& doc) {
            if (auto wrapped = doc["state"].as<JsonObject>()) {
                return wrapped;
            }
            return doc.as<JsonObject>();
        }
    }

    SessionService::SessionService(EventBus& bus, IClock& clock, std::string dataDir, const ApiConfig& cfg)
        : m_bus(bus),
          m_clock(clock),
          m_dataDir(std::move(dataDir)),
          m_baseUrl(BackendApi::normalizeBaseUrl(cfg.baseUrl)),
          m_refreshTimeoutMs(cfg.refreshTimeoutMs) {
        m_path = m_dataDir + "/" + SESSION_FILE_NAME;
    }

    SessionService::~SessionService() {
        stop();
    }

    Status SessionService::begin(const std::uint32_t reloadIntervalMs) {
        const auto state{readState()};
        {
            std::lock_guard lock{m_mutex};
            m_state = state.ok() ? state.value : AuthState{};
        }

        if (state.ok() && state.value.valid()) {
            LOG_INFO(SESSION_TAG, "Signed in as %s", state.value.user->email.c_str());
        } else {
            LOG_INFO(SESSION_TAG, "No signed-in user (%s)", state.ok() ? "incomplete session" : state.status.message.c_str());
        }

        m_reloadTimer.startPeriodic(reloadIntervalMs, [this] { reload(); });
        return Status::OK();
    }

    void SessionService::stop() {
        m_reloadTimer.cancel();
    }

    void SessionService::updateConfig(const ApiConfig& cfg) {
        std::lock_guard lock{m_mutex};
        m_baseUrl = BackendApi::normalizeBaseUrl(cfg.baseUrl);
        m_refreshTimeoutMs = cfg.refreshTimeoutMs;
    }

    void SessionService::reload() {
        const auto state{readState()};
        const AuthState next{state.ok() ? state.value : AuthState{}};

        std::optional<std::string> previousUser{};
        std::optional<std::string> currentUser{};
        {
            std::lock_guard lock{m_mutex};
            if (m_state.valid()) {
                previousUser = m_state.user->id;
            }
            if (next.valid()) {
                currentUser = next.user->id;
            }
            m_state = next;
        }

        if (previousUser == currentUser) {
            return;
        }

        const auto now{m_clock.nowMs()};
        if (previousUser) {
            LOG_INFO(SESSION_TAG, "User %s signed out", previousUser->c_str());
            (void)m_bus.publish(Event{
                .type = EventType::UserLoggedOut,
                .payload = UserSessionEvent{.userId = *previousUser},
                .timestampMs = now,
            });
        }
        if (currentUser) {
            LOG_INFO(SESSION_TAG, "User %s signed in", currentUser->c_str());
            (void)m_bus.publish(Event{
                .type = EventType::UserLoggedIn,
                .payload = UserSessionEvent{.userId = *currentUser},
                .timestampMs = now,
            });
        }
    }

    // ==================== ISessionProvider ====================

    bool SessionService::isAuthenticated() {
        std::lock_guard lock{m_mutex};
        return m_state.valid();
    }

    std::string SessionService::accessToken() {
        std::lock_guard lock{m_mutex};
        return m_state.valid() ? m_state.accessToken : std::string{};
    }

    std::optional<UserInfo> SessionService::user() {
        std::lock_guard lock{m_mutex};
        return m_state.valid() ? m_state.user : std::nullopt;
    }

    Result<std::string> SessionService::refreshAccessToken() {
        // One refresh at a time; a second caller reuses the fresh token.
        std::lock_guard refreshLock{m_refreshMutex};

        std::string refreshToken{};
        std::string url{};
        std::uint32_t timeoutMs{0};
        {
            std::lock_guard lock{m_mutex};
            if (!m_state.valid()) {
                return Result<std::string>::Error(ErrorCode::AuthError, "No refresh token available");
            }
            refreshToken = m_state.refreshToken;
            url = http::joinUrl(m_baseUrl, "/auth/refresh");
            timeoutMs = m_refreshTimeoutMs;
        }

        JsonDocument body{};
        body["refreshToken"] = refreshToken;
        http::Request req{
            .method = "POST",
            .headers = {{"Content-Type", "application/json"}},
        };
        serializeJson(body, req.body);

        LOG_DEBUG(SESSION_TAG, "Refreshing access token");
        const auto res{m_client.send(url, req, timeoutMs)};
        if (res.failed()) {
            LOG_WARNING(SESSION_TAG, "Token refresh failed: %s", res.status.message.c_str());
            return Result<std::string>::Error(res.status);
        }

        JsonDocument doc{};
        const auto err{deserializeJson(doc, res.value.body)};
        if (res.value.status >= 400 || err || !(doc["success"] | false)) {
            std::string message{err ? std::string{} : BackendApi::envelopeMessage(doc.as<JsonVariantConst>())};
            if (message.empty()) {
                message = "Token refresh failed with status code " + std::to_string(res.value.status);
            }
            LOG_WARNING(SESSION_TAG, "%s", message.c_str());
            return Result<std::string>::Error(Status::HttpError(res.value.status >= 400 ? res.value.status : 401, message));
        }

        const std::string newAccess{doc["data"]["accessToken"] | ""};
        if (newAccess.empty()) {
            return Result<std::string>::Error(ErrorCode::AuthError, "Refresh response carried no access token");
        }
        const std::string newRefresh{doc["data"]["refreshToken"] | refreshToken};

        {
            std::lock_guard lock{m_mutex};
            m_state.accessToken = newAccess;
            m_state.refreshToken = newRefresh;
        }
        if (auto status{writeTokens(newAccess, newRefresh)}; status.failed()) {
            LOG_WARNING(SESSION_TAG, "Refreshed token not persisted: %s", status.message.c_str());
        }

        LOG_INFO(SESSION_TAG, "Access token refreshed");
        return Result<std::string>::Ok(newAccess);
    }

    // ==================== File ====================

    Result<SessionService::AuthState> SessionService::readState() const {
        const auto file{utils::readTextFile(m_path)};
        if (file.failed()) {
            return Result<AuthState>::Error(file.status);
        }
        return parse(file.value);
    }

    Result<SessionService::AuthState> SessionService::parse(const std::string& json) {
        JsonDocument doc{};
        if (const auto err = deserializeJson(doc, json); err) {
            return Result<AuthState>::Error(ErrorCode::JsonError, std::string{"auth session: "} + err.c_str());
        }

        const auto root{sessionObject(doc)};
        if (!root) {
            return Result<AuthState>::Error(ErrorCode::JsonError, "auth session is not an object");
        }

        AuthState state{};
        state.accessToken = root["accessToken"] | "";
        state.refreshToken = root["refreshToken"] | "";

        if (const auto u = root["user"].as<JsonObjectConst>()) {
            state.user = UserInfo{
                .id = readId(u["id"]),
                .email = u["email"] | "",
                .name = u["name"] | "",
                .role = u["role"] | "",
            };
        }
        return Result<AuthState>::Ok(std::move(state));
    }

    Status SessionService::writeTokens(const std::string& accessToken, const std::string& refreshToken) {
        const auto file{utils::readTextFile(m_path)};
        if (file.failed()) {
            return file.status;
        }

        JsonDocument doc{};
        if (const auto err = deserializeJson(doc, file.value); err) {
            return Status::Error(ErrorCode::JsonError, err.c_str());
        }

        auto root{sessionObject(doc)};
        if (!root) {
            return Status::Error(ErrorCode::JsonError, "auth session is not an object");
        }
        root["accessToken"] = accessToken;
        root["refreshToken"] = refreshToken;

        std::string out{};
        serializeJson(doc, out);
        return utils::writeTextFileAtomic(m_path, out);
    }

}
