#include "core/Types.hpp"

namespace vitco {

    std::optional<AttendanceStatus> parseAttendanceStatus(std::string_view text) noexcept {
        for (auto i = 0; i < static_cast<int>(AttendanceStatus::Count); ++i) {
            const auto status{static_cast<AttendanceStatus>(i)};
            if (text == toString(status)) {
                return status;
            }
        }
        return std::nullopt;
    }

    std::optional<Trigger> parseTrigger(std::string_view text) noexcept {
        for (auto i = 0; i < static_cast<int>(Trigger::Count); ++i) {
            const auto trigger{static_cast<Trigger>(i)};
            if (text == toString(trigger)) {
                return trigger;
            }
        }
        return std::nullopt;
    }

    std::string describe(const NetworkInfo& info) {
        if (const auto* wifi = std::get_if<WifiNetwork>(&info)) {
            return "wifi:" + wifi->ssid;
        }
        if (const auto* eth = std::get_if<EthernetNetwork>(&info)) {
            return "ethernet:" + eth->macAddress;
        }
        return "none";
    }

}
