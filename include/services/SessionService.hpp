#ifndef VITCO_SERVICES_SESSIONSERVICE_HPP
#define VITCO_SERVICES_SESSIONSERVICE_HPP

/**
 * @file SessionService.hpp
 * @brief Signed-in user and tokens, shared with the desktop sign-in UI.
 *
 * The sign-in UI writes `auth-session.json` in the data directory, either
 * as `{state: {user, accessToken, refreshToken}}` or as the flat object.
 * The service reloads it periodically, publishes UserLoggedIn and
 * UserLoggedOut when the signed-in user changes, and writes refreshed
 * tokens back in place.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "AppConfig.hpp"
#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/ISessionProvider.hpp"
#include "core/TaskTimer.hpp"
#include "utils/RestClient.hpp"

namespace vitco {

    class SessionService : public ISessionProvider {
    public:
        SessionService(EventBus& bus, IClock& clock, std::string dataDir, const ApiConfig& cfg);
        SessionService(const SessionService&) = delete;
        SessionService& operator=(const SessionService&) = delete;
        ~SessionService() override;

        /**
         * @brief Load the session file and start watching it.
         *        A missing or unreadable file means signed out.
         */
        [[nodiscard]] Status begin(std::uint32_t reloadIntervalMs = RELOAD_INTERVAL_MS);

        void stop();

        void updateConfig(const ApiConfig& cfg);

        /**
         * @brief Re-read the session file and publish login/logout transitions.
         */
        void reload();

        // ==================== ISessionProvider ====================
        [[nodiscard]] bool isAuthenticated() override;
        [[nodiscard]] std::string accessToken() override;
        [[nodiscard]] std::optional<UserInfo> user() override;
        [[nodiscard]] Result<std::string> refreshAccessToken() override;

        [[nodiscard]] const std::string& path() const noexcept {
            return m_path;
        }

        static constexpr std::uint32_t RELOAD_INTERVAL_MS = 5000;

    private:
        struct AuthState {
            std::optional<UserInfo> user{};
            std::string accessToken{};
            std::string refreshToken{};

            [[nodiscard]] bool valid() const noexcept {
                return user.has_value() && !refreshToken.empty();
            }
        };

        [[nodiscard]] Result<AuthState> readState() const;
        [[nodiscard]] static Result<AuthState> parse(const std::string& json);
        [[nodiscard]] Status writeTokens(const std::string& accessToken, const std::string& refreshToken);

        EventBus& m_bus;
        IClock& m_clock;
        std::string m_dataDir;
        std::string m_path;

        http::RestClient m_client{};
        std::string m_baseUrl;
        std::uint32_t m_refreshTimeoutMs;

        AuthState m_state{};
        mutable std::mutex m_mutex{};
        std::mutex m_refreshMutex{};

        TaskTimer m_reloadTimer{"session_reload"};
    };

}

#endif  // VITCO_SERVICES_SESSIONSERVICE_HPP
