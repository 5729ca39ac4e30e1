#ifndef VITCO_CORE_TYPES_HPP
#define VITCO_CORE_TYPES_HPP

/**
 * @file Types.hpp
 * @brief Attendance domain types shared by services and modules.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace vitco {

    // ------------------------ Attendance Status ------------------------
    enum class AttendanceStatus : std::uint8_t {
        NotStarted,
        CheckedIn,
        CheckedOut,

        Count
    };
    [[nodiscard]] constexpr const char* toString(const AttendanceStatus status) noexcept {
        switch (status) {
            case AttendanceStatus::NotStarted: return "NOT_STARTED";
            case AttendanceStatus::CheckedIn:  return "CHECKED_IN";
            case AttendanceStatus::CheckedOut: return "CHECKED_OUT";
            default:                           return "UNKNOWN";
        }
    }
    [[nodiscard]] std::optional<AttendanceStatus> parseAttendanceStatus(std::string_view text) noexcept;

    // ------------------------ Triggers ------------------------
    enum class Trigger : std::uint8_t {
        Login,
        AppStart,
        NetworkChange,
        SystemWake,
        Shutdown,
        Logout,
        Recovery,
        Background,

        Count
    };
    [[nodiscard]] constexpr const char* toString(const Trigger trigger) noexcept {
        switch (trigger) {
            case Trigger::Login:         return "login";
            case Trigger::AppStart:      return "app_start";
            case Trigger::NetworkChange: return "network_change";
            case Trigger::SystemWake:    return "system_wake";
            case Trigger::Shutdown:      return "shutdown";
            case Trigger::Logout:        return "logout";
            case Trigger::Recovery:      return "recovery";
            case Trigger::Background:    return "background";
            default:                     return "unknown";
        }
    }
    [[nodiscard]] std::optional<Trigger> parseTrigger(std::string_view text) noexcept;

    [[nodiscard]] constexpr bool isCheckInTrigger(const Trigger trigger) noexcept {
        return trigger == Trigger::Login || trigger == Trigger::AppStart
            || trigger == Trigger::NetworkChange || trigger == Trigger::SystemWake;
    }
    [[nodiscard]] constexpr bool isCheckOutTrigger(const Trigger trigger) noexcept {
        return trigger == Trigger::Shutdown || trigger == Trigger::Logout
            || trigger == Trigger::Recovery || trigger == Trigger::Background;
    }

    // ------------------------ Network Attachment ------------------------
    struct WifiNetwork {
        std::string ssid{};
        std::optional<std::string> bssid{};

        bool operator==(const WifiNetwork&) const = default;
    };

    struct EthernetNetwork {
        std::string macAddress{};
        std::optional<std::string> adapterName{};

        bool operator==(const EthernetNetwork&) const = default;
    };

    /**
     * @brief Current network attachment. `std::monostate` means no network.
     */
    using NetworkInfo = std::variant<std::monostate, WifiNetwork, EthernetNetwork>;

    enum class NetworkType : std::uint8_t {
        None,
        Wifi,
        Ethernet,
    };
    [[nodiscard]] constexpr const char* toString(const NetworkType type) noexcept {
        switch (type) {
            case NetworkType::None:     return "none";
            case NetworkType::Wifi:     return "wifi";
            case NetworkType::Ethernet: return "ethernet";
            default:                    return "unknown";
        }
    }

    [[nodiscard]] inline NetworkType networkType(const NetworkInfo& info) noexcept {
        if (std::holds_alternative<WifiNetwork>(info)) {
            return NetworkType::Wifi;
        }
        if (std::holds_alternative<EthernetNetwork>(info)) {
            return NetworkType::Ethernet;
        }
        return NetworkType::None;
    }

    [[nodiscard]] inline bool isConnected(const NetworkInfo& info) noexcept {
        return networkType(info) != NetworkType::None;
    }

    /**
     * @brief Short human readable label for logs and notifications.
     */
    [[nodiscard]] std::string describe(const NetworkInfo& info);

    // ------------------------ Attempt Outcome ------------------------
    enum class ErrorType : std::uint8_t {
        None,
        Validation,
        Network,
        Authentication,
        System,
    };
    [[nodiscard]] constexpr const char* toString(const ErrorType type) noexcept {
        switch (type) {
            case ErrorType::None:           return "none";
            case ErrorType::Validation:     return "validation";
            case ErrorType::Network:        return "network";
            case ErrorType::Authentication: return "authentication";
            case ErrorType::System:         return "system";
            default:                        return "unknown";
        }
    }

    enum class AttendanceIntent : std::uint8_t {
        CheckIn,
        CheckOut,
    };

    struct AttemptResult {
        bool success{false};
        std::string reason{};
        std::string errorCode{};
        ErrorType errorType{ErrorType::None};
        std::string attendanceId{};
        std::uint64_t timestampMs{0};
    };

    // ------------------------ Persisted Session ------------------------
    struct SessionState {
        std::optional<std::uint64_t> lastCheckInTimestamp{};
        std::optional<std::uint64_t> lastCheckOutTimestamp{};
        std::optional<NetworkInfo> lastNetworkInfo{};
        std::optional<std::string> systemFingerprint{};
        std::optional<std::uint64_t> sessionEndTimestamp{};
        bool pendingCheckout{false};
    };

    /**
     * @brief Field-wise update of the stored SessionState.
     *
     * Unset fields leave the stored value untouched.
     */
    struct SessionStateUpdate {
        std::optional<std::uint64_t> lastCheckInTimestamp{};
        std::optional<std::uint64_t> lastCheckOutTimestamp{};
        std::optional<NetworkInfo> lastNetworkInfo{};
        std::optional<std::string> systemFingerprint{};
        std::optional<std::uint64_t> sessionEndTimestamp{};
        std::optional<bool> pendingCheckout{};
    };

    // ------------------------ Signed-in User ------------------------
    struct UserInfo {
        std::string id{};
        std::string email{};
        std::string name{};
        std::string role{};
    };

}

#endif  // VITCO_CORE_TYPES_HPP
