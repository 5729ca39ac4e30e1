#ifndef VITCO_CORE_EVENTS_HPP
#define VITCO_CORE_EVENTS_HPP

/**
 * @file Events.hpp
 * @brief Event types and payloads for the EventBus system.
 *
 * OS power/session signals, network changes and attendance outcomes all
 * travel as `Event` values. Payloads use `std::variant` so listeners can
 * pick out the alternative they expect with `std::get_if`.
 */

#include <cstdint>
#include <string>
#include <variant>

#include "core/Types.hpp"

// Forward declaration to avoid circular dependency
namespace vitco {
    struct AppConfig;
}

namespace vitco {

    // ------------------------ Event Types ------------------------
    enum class EventType : std::uint8_t {
        // Application lifecycle
        AppStarted,
        ConfigUpdated,

        // Session
        UserLoggedIn,
        UserLoggedOut,

        // Network
        NetworkChanged,

        // Power / session signals from the OS
        SystemSuspending,
        SystemResumed,
        ShutdownRequested,
        LogoutRequested,
        ScreenLocked,

        // Power
        WakeLockAcquired,
        WakeLockReleased,

        // Attendance
        AttendanceAttempted,
        PendingCheckoutChanged,

        // Proxy
        ProxyStateChanged,

        // System
        SystemError,

        Count
    };
    [[nodiscard]] constexpr const char* toString(const EventType type) noexcept {
        switch (type) {
            case EventType::AppStarted:             return "app_started";
            case EventType::ConfigUpdated:          return "config_updated";
            case EventType::UserLoggedIn:           return "user_logged_in";
            case EventType::UserLoggedOut:          return "user_logged_out";
            case EventType::NetworkChanged:         return "network_changed";
            case EventType::SystemSuspending:       return "system_suspending";
            case EventType::SystemResumed:          return "system_resumed";
            case EventType::ShutdownRequested:      return "shutdown_requested";
            case EventType::LogoutRequested:        return "logout_requested";
            case EventType::ScreenLocked:           return "screen_locked";
            case EventType::WakeLockAcquired:       return "wake_lock_acquired";
            case EventType::WakeLockReleased:       return "wake_lock_released";
            case EventType::AttendanceAttempted:    return "attendance_attempted";
            case EventType::PendingCheckoutChanged: return "pending_checkout_changed";
            case EventType::ProxyStateChanged:      return "proxy_state_changed";
            case EventType::SystemError:            return "system_error";
            default:                                return "unknown";
        }
    }

    // ------------------------ Event Payloads ------------------------
    struct ConfigUpdatedEvent {
        const AppConfig* config{nullptr};
    };
    struct UserSessionEvent {
        std::string userId{};
    };
    struct NetworkChangedEvent {
        NetworkInfo previous{};
        NetworkInfo current{};
    };
    struct PowerSignalEvent {
        int signalNumber{0};
    };
    struct SystemResumedEvent {
        std::uint64_t sleepDurationMs{0};
    };
    struct WakeLockEvent {
        std::string lockName{};
        std::uint32_t lockId{0};
        std::uint8_t totalActiveLocks{0};
    };
    struct AttendanceAttemptedEvent {
        Trigger trigger{Trigger::AppStart};
        AttendanceIntent intent{AttendanceIntent::CheckIn};
        bool success{false};
        std::string reason{};
    };
    struct PendingCheckoutEvent {
        bool pending{false};
        std::uint64_t sessionEndTimestampMs{0};
    };
    struct ProxyStateEvent {
        bool running{false};
        bool registered{false};
        std::string ipAddress{};
        std::uint16_t port{0};
    };
    struct SystemErrorEvent {
        std::string component{};
        std::string message{};
    };
    using EventPayload = std::variant<
        std::monostate,
        ConfigUpdatedEvent,
        UserSessionEvent,
        NetworkChangedEvent,
        PowerSignalEvent,
        SystemResumedEvent,
        WakeLockEvent,
        AttendanceAttemptedEvent,
        PendingCheckoutEvent,
        ProxyStateEvent,
        SystemErrorEvent
    >;

    struct Event {
        EventType type{EventType::AppStarted};
        EventPayload payload{};
        std::uint64_t timestampMs{0};
        std::uint8_t priority{0};      // 0 = normal, higher = more urgent
    };

    namespace EventPriority {
        inline constexpr std::uint8_t E_LOW = 0;
        inline constexpr std::uint8_t E_NORMAL = 1;
        inline constexpr std::uint8_t E_HIGH = 2;
        inline constexpr std::uint8_t E_CRITICAL = 3;
    }

}

#endif  // VITCO_CORE_EVENTS_HPP
