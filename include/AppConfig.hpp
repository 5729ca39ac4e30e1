#ifndef VITCO_APPCONFIG_HPP
#define VITCO_APPCONFIG_HPP

/**
 * @file AppConfig.hpp
 * @brief Application configuration structures for the vitco agent.
 *
 * All structures use brace initialization with the defaults the agent
 * ships with. `ConfigService` overlays `config.json` on top of them.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace vitco {

    // ================== Compile-time Constants ==================
    namespace defaults {
        inline constexpr std::string_view AGENT_VERSION = "1.4.0";
        inline constexpr std::string_view APP_NAME = "vitco-agent";

        // Event bus
        inline constexpr std::uint32_t EVENTBUS_QUEUE_SIZE = 64;
        inline constexpr std::uint32_t EVENTBUS_HIGH_PRIORITY_QUEUE_SIZE = 16;

        // Remote API
        inline constexpr std::string_view API_BASE_URL = "http://127.0.0.1:3001/api/v1";
        inline constexpr std::uint32_t API_TIMEOUT_MS = 30000;
        inline constexpr std::uint32_t REFRESH_TIMEOUT_MS = 10000;

        // Attendance timings
        inline constexpr std::uint32_t TRIGGER_DEBOUNCE_MS = 30000;
        inline constexpr std::uint32_t WAKE_CHECKIN_DELAY_MS = 5000;
        inline constexpr std::uint32_t NETWORK_POLL_INTERVAL_MS = 5000;
        inline constexpr std::uint32_t NETWORK_SETTLE_MS = 3000;
        inline constexpr std::uint32_t RECOVERY_WARMUP_MS = 2000;
        inline constexpr std::uint32_t CHECKOUT_TIMEOUT_SEC = 30;

        // Proxy
        inline constexpr std::uint16_t PROXY_PORT = 3002;
        inline constexpr std::uint32_t PROXY_HEARTBEAT_MS = 30000;
        inline constexpr std::uint32_t PROXY_REREGISTER_MS = 5 * 60 * 1000;
        inline constexpr std::uint8_t PROXY_MAX_RETRIES = 3;

        // Logs
        inline constexpr std::uint32_t AUDIT_RETENTION_DAYS = 7;
    }

    // ================== Attendance Configuration ==================
    struct AttendanceConfig {
        bool autoCheckInEnabled{true};
        bool autoStartEnabled{true};
        bool showNotifications{true};

        std::uint32_t debounceMs{defaults::TRIGGER_DEBOUNCE_MS};
        std::uint32_t wakeCheckInDelayMs{defaults::WAKE_CHECKIN_DELAY_MS};
        std::uint32_t networkPollIntervalMs{defaults::NETWORK_POLL_INTERVAL_MS};
        std::uint32_t networkSettleMs{defaults::NETWORK_SETTLE_MS};
        std::uint32_t recoveryWarmupMs{defaults::RECOVERY_WARMUP_MS};
    };

    // ================== Check-out Configuration ==================
    struct CheckoutConfig {
        bool autoCheckoutOnShutdownEnabled{true};
        std::uint32_t checkoutTimeoutSec{defaults::CHECKOUT_TIMEOUT_SEC};
        bool checkoutNotificationsEnabled{true};
    };

    // ================== Remote API Configuration ==================
    struct ApiConfig {
        std::string baseUrl{std::string(defaults::API_BASE_URL)};
        std::uint32_t timeoutMs{defaults::API_TIMEOUT_MS};
        std::uint32_t refreshTimeoutMs{defaults::REFRESH_TIMEOUT_MS};
    };

    // ================== Proxy Configuration ==================
    struct ProxyConfig {
        bool autoStartEnabled{false};
        std::uint16_t port{defaults::PROXY_PORT};

        std::uint32_t heartbeatIntervalMs{defaults::PROXY_HEARTBEAT_MS};
        std::uint32_t reregisterIntervalMs{defaults::PROXY_REREGISTER_MS};

        // Registration retry (same shape as a reconnect backoff)
        std::uint8_t maxRetries{defaults::PROXY_MAX_RETRIES};
        std::uint32_t backoffMinMs{1000};
        std::uint32_t backoffMaxMs{4000};
        float backoffMultiplier{2.0f};
    };

    // ================== Log Configuration ==================
    struct LogConfig {
        std::string level{"info"};
        bool fileEnabled{true};
        std::uint32_t auditRetentionDays{defaults::AUDIT_RETENTION_DAYS};
    };

    // ================== Root Configuration ==================
    struct AppConfig {
        AttendanceConfig attendance{};
        CheckoutConfig checkout{};
        ApiConfig api{};
        ProxyConfig proxy{};
        LogConfig log{};

        /**
         * @brief Reject values that would stall timers or break URLs.
         */
        [[nodiscard]] bool validate() const noexcept {
            if (api.baseUrl.empty() || api.timeoutMs == 0 || api.refreshTimeoutMs == 0) {
                return false;
            }
            if (attendance.networkPollIntervalMs == 0 || checkout.checkoutTimeoutSec == 0) {
                return false;
            }
            if (proxy.port == 0 || proxy.heartbeatIntervalMs == 0 || proxy.reregisterIntervalMs == 0) {
                return false;
            }
            if (proxy.backoffMinMs == 0 || proxy.backoffMaxMs < proxy.backoffMinMs || proxy.backoffMultiplier < 1.0f) {
                return false;
            }
            return true;
        }

        [[nodiscard]] static AppConfig makeDefault() {
            return AppConfig{};
        }
    };

}

#endif  // VITCO_APPCONFIG_HPP
