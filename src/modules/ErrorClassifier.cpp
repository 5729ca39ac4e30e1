#include "modules/ErrorClassifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <utility>

namespace vitco::classifier {
    namespace {
        using CodeMessage = std::pair<std::string_view, std::string_view>;

        constexpr std::array<CodeMessage, 12> CHECK_IN_MESSAGES{{
            {"NO_SHIFT_ASSIGNED", "You do not have a shift assigned for today. Please contact your manager or HR to assign a shift."},
            {"SHIFT_INACTIVE", "Your assigned shift is currently inactive. Please contact your manager or HR for assistance."},
            {"DAY_NOT_ALLOWED", "You are not scheduled to work today. Please check your shift schedule."},
            {"HOLIDAY_NOT_ALLOWED", "Today is a holiday and your shift does not allow work on holidays. Please contact your manager if you need to work today."},
            {"TOO_EARLY", "It is too early to check in. Please check in during your assigned shift time window."},
            {"TOO_LATE", "It is too late to check in. Please contact your manager if you need to mark attendance."},
            {"ALREADY_CHECKED_IN", "You are already checked in for today."},
            {"ALREADY_CHECKED_OUT", "You have already checked out for today. Cannot check in again."},
            {"WIFI_REQUIRED", "WiFi or Ethernet connection is required for attendance. Please connect to an approved network."},
            {"LOCATION_REQUIRED", "Location information is required for attendance. Please enable location services."},
            {"DEVICE_FINGERPRINT_REQUIRED", "Device identification is required. Please restart the application and try again."},
            {"NETWORK_NOT_APPROVED", "The network you are connected to is not approved for attendance. Please connect to an approved office network."},
        }};

        constexpr std::array<CodeMessage, 5> CHECK_OUT_MESSAGES{{
            {"NOT_CHECKED_IN", "You are not checked in. Cannot check out."},
            {"ALREADY_CHECKED_OUT", "You have already checked out for today."},
            {"INVALID_STATUS", "Cannot check out in your current attendance status. You may already be checked out."},
            {"NETWORK_NOT_APPROVED", "The network you are connected to is not approved for attendance."},
            {"DEVICE_FINGERPRINT_REQUIRED", "Device identification is required. Please restart the application and try again."},
        }};

        std::string upper(std::string_view text) {
            std::string out{text};
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
            return out;
        }

        bool contains(const std::string& haystack, std::string_view needle) {
            return haystack.find(needle) != std::string::npos;
        }

        template<std::size_t N>
        std::string lookup(const std::array<CodeMessage, N>& table, std::string_view code, const std::string& fallback) {
            for (const auto& [key, message] : table) {
                if (key == code) {
                    return std::string{message};
                }
            }
            return fallback;
        }

        // Shared head of both type rules; nullopt when neither matched.
        std::optional<ErrorType> networkOrAuth(const std::string& text) {
            if (contains(text, "NETWORK") || contains(text, "WIFI") || contains(text, "ETHERNET")) {
                return ErrorType::Network;
            }
            if (contains(text, "AUTH") || contains(text, "UNAUTHORIZED") || contains(text, "TOKEN")) {
                return ErrorType::Authentication;
            }
            return std::nullopt;
        }

        std::string codeFor(const Status& error, std::string (*infer)(std::string_view)) {
            if (!error.reasonCode.empty()) {
                return error.reasonCode;
            }
            return infer(error.message);
        }
    }

    std::string inferCheckInCode(const std::string_view message) {
        const auto text{upper(message)};
        if (contains(text, "TOO EARLY")) return "TOO_EARLY";
        if (contains(text, "TOO LATE")) return "TOO_LATE";
        if (contains(text, "NO SHIFT")) return "NO_SHIFT_ASSIGNED";
        if (contains(text, "SHIFT INACTIVE")) return "SHIFT_INACTIVE";
        if (contains(text, "DAY NOT ALLOWED")) return "DAY_NOT_ALLOWED";
        if (contains(text, "HOLIDAY")) return "HOLIDAY_NOT_ALLOWED";
        if (contains(text, "ALREADY CHECKED IN")) return "ALREADY_CHECKED_IN";
        if (contains(text, "NETWORK") || contains(text, "WIFI")) return "NETWORK_NOT_APPROVED";
        if (contains(text, "DEVICE") || contains(text, "FINGERPRINT")) return "DEVICE_FINGERPRINT_REQUIRED";
        return {};
    }

    std::string inferCheckOutCode(const std::string_view message) {
        const auto text{upper(message)};
        if (contains(text, "NOT CHECKED IN")) return "NOT_CHECKED_IN";
        if (contains(text, "ALREADY CHECKED OUT")) return "ALREADY_CHECKED_OUT";
        if (contains(text, "CANNOT PERFORM") || contains(text, "CURRENT ATTENDANCE STATUS")) return "INVALID_STATUS";
        if (contains(text, "NETWORK") || contains(text, "WIFI")) return "NETWORK_NOT_APPROVED";
        if (contains(text, "DEVICE") || contains(text, "FINGERPRINT")) return "DEVICE_FINGERPRINT_REQUIRED";
        return {};
    }

    ErrorType checkInErrorType(const std::string_view code, const std::string_view message) {
        if (code.empty() && message.empty()) {
            return ErrorType::System;
        }
        const auto text{upper(code.empty() ? message : code)};
        if (const auto head{networkOrAuth(text)}) {
            return *head;
        }
        for (const auto* word : {"SHIFT", "EARLY", "LATE", "DAY", "HOLIDAY", "ALREADY"}) {
            if (contains(text, word)) {
                return ErrorType::Validation;
            }
        }
        return ErrorType::System;
    }

    ErrorType checkOutErrorType(const std::string_view code, const std::string_view message) {
        if (code.empty() && message.empty()) {
            return ErrorType::System;
        }
        const auto text{upper(code.empty() ? message : code)};
        if (const auto head{networkOrAuth(text)}) {
            return *head;
        }
        for (const auto* word : {"NOT CHECKED IN", "NOT_CHECKED_IN", "ALREADY CHECKED OUT", "ALREADY_CHECKED_OUT", "VALIDATION", "INVALID_STATUS"}) {
            if (contains(text, word)) {
                return ErrorType::Validation;
            }
        }
        return ErrorType::System;
    }

    std::string checkInMessage(const std::string_view code, const std::string& fallback) {
        return lookup(CHECK_IN_MESSAGES, code, fallback);
    }

    std::string checkOutMessage(const std::string_view code, const std::string& fallback) {
        return lookup(CHECK_OUT_MESSAGES, code, fallback);
    }

    ClassifiedError classifyCheckIn(const Status& error) {
        const auto message{error.message.empty() ? std::string{"Unknown error during check-in"} : error.message};
        auto code{codeFor(error, &inferCheckInCode)};

        ClassifiedError out{};
        out.type = error.code == ErrorCode::AuthError ? ErrorType::Authentication : checkInErrorType(code, message);
        out.userMessage = checkInMessage(code, message);
        out.errorCode = std::move(code);
        return out;
    }

    ClassifiedError classifyCheckOut(const Status& error) {
        const auto message{error.message.empty() ? std::string{"Unknown error during check-out"} : error.message};
        auto code{codeFor(error, &inferCheckOutCode)};

        ClassifiedError out{};
        out.type = error.code == ErrorCode::AuthError ? ErrorType::Authentication : checkOutErrorType(code, message);
        out.userMessage = checkOutMessage(code, message);
        out.errorCode = std::move(code);
        return out;
    }

    bool isConnectionFailure(const Status& error) noexcept {
        return error.code == ErrorCode::NetworkError || error.code == ErrorCode::Timeout;
    }

    bool isStatusConflict(const std::string_view errorCode, const std::string_view reason) {
        if (errorCode == "ALREADY_CHECKED_OUT" || errorCode == "INVALID_STATUS") {
            return true;
        }
        const auto text{upper(reason)};
        return contains(text, "ALREADY CHECKED OUT") || contains(text, "CURRENT ATTENDANCE STATUS");
    }

    bool settlesPendingCheckout(const AttemptResult& result) {
        if (result.success) {
            return true;
        }
        // Benign skip: not checked in, or checked out in the meantime
        if (result.errorType == ErrorType::None && !result.reason.empty()) {
            return true;
        }
        return isStatusConflict(result.errorCode, result.reason);
    }

}
