#ifndef VITCO_CORE_RESULT_HPP
#define VITCO_CORE_RESULT_HPP

/**
 * @file Result.hpp
 * @brief Status and Result<T>, the failure currency of the agent.
 *
 * Nothing below the App throws for expected failures. A call that can fail
 * returns a `Status` (or a `Result<T>` carrying a value), and a failure that
 * came back from the attendance server also records the HTTP status and the
 * server's `errorCode`, which is what the classifier keys on.
 */

#include <cstdint>
#include <string>
#include <utility>

namespace vitco {

    enum class ErrorCode : std::uint8_t {
        Ok = 0,
        StorageError,       // state file or log could not be read/written
        JsonError,          // malformed body or file
        NetworkError,       // connect/send/recv failure, nothing came back
        HttpError,          // server answered with a rejection
        Timeout,
        InvalidArgument,
        ResourceBusy,
        ResourceExhausted,
        ConfigError,
        AuthError,          // 401, or no usable session
        NotFound,
        AlreadyExists,
        OperationFailed,
        Cancelled,
        Unknown,
    };

    [[nodiscard]] inline constexpr const char* toString(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::Ok:                return "ok";
            case ErrorCode::StorageError:      return "storage_error";
            case ErrorCode::JsonError:         return "json_error";
            case ErrorCode::NetworkError:      return "network_error";
            case ErrorCode::HttpError:         return "http_error";
            case ErrorCode::Timeout:           return "timeout";
            case ErrorCode::InvalidArgument:   return "invalid_argument";
            case ErrorCode::ResourceBusy:      return "resource_busy";
            case ErrorCode::ResourceExhausted: return "resource_exhausted";
            case ErrorCode::ConfigError:       return "config_error";
            case ErrorCode::AuthError:         return "auth_error";
            case ErrorCode::NotFound:          return "not_found";
            case ErrorCode::AlreadyExists:     return "already_exists";
            case ErrorCode::OperationFailed:   return "operation_failed";
            case ErrorCode::Cancelled:         return "cancelled";
            default:                           return "unknown";
        }
    }

    struct Status {
        ErrorCode code{ErrorCode::Ok};
        std::string message{};
        int httpStatus{0};          // 0 unless the server answered
        std::string reasonCode{};   // server `errorCode`, e.g. TOO_EARLY

        Status() = default;

        Status(const ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

        [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::Ok; }
        [[nodiscard]] bool failed() const noexcept { return !ok(); }
        [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

        [[nodiscard]] bool isUnauthorized() const noexcept { return httpStatus == 401; }

        [[nodiscard]] static Status OK() { return Status{}; }

        [[nodiscard]] static Status Error(const ErrorCode c, std::string msg = "") {
            return Status{c, std::move(msg)};
        }

        /**
         * @brief Failure reported by the server. A 401 maps to AuthError so
         *        callers can tell "log in again" from an ordinary rejection.
         */
        [[nodiscard]] static Status HttpError(const int status, std::string msg, std::string reason = "") {
            Status s{status == 401 ? ErrorCode::AuthError : ErrorCode::HttpError, std::move(msg)};
            s.httpStatus = status;
            s.reasonCode = std::move(reason);
            return s;
        }
    };

    /**
     * @brief A value or the Status explaining why there is none.
     *
     * `value` stays default-constructed on failure, so T must be default
     * constructible.
     *
     * @code
     * auto status{api.getStatus()};
     * if (status.failed()) {
     *     return Result<bool>::Error(status.status);
     * }
     * @endcode
     */
    template<typename T>
    struct Result {
        Status status{};
        T value{};

        Result() = default;
        explicit Result(T v) : value(std::move(v)) {}
        explicit Result(Status s) : status(std::move(s)) {}
        Result(const ErrorCode c, std::string msg) : status(c, std::move(msg)) {}

        [[nodiscard]] bool ok() const noexcept { return status.ok(); }
        [[nodiscard]] bool failed() const noexcept { return status.failed(); }
        [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

        [[nodiscard]] static Result Ok(T v) { return Result{std::move(v)}; }

        [[nodiscard]] static Result Error(const ErrorCode c, std::string msg = "") {
            return Result{Status{c, std::move(msg)}};
        }

        [[nodiscard]] static Result Error(Status s) { return Result{std::move(s)}; }
    };

}  // namespace vitco

#endif  // VITCO_CORE_RESULT_HPP
