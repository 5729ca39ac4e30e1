#ifndef VITCO_CORE_IATTENDANCEAPI_HPP
#define VITCO_CORE_IATTENDANCEAPI_HPP

/**
 * @file IAttendanceApi.hpp
 * @brief Remote attendance endpoints as seen by the orchestrator.
 *
 * Failures are reported through `Status`: transport problems as
 * `NetworkError`/`Timeout`, server rejections as `HttpError`/`AuthError`
 * with `httpStatus` and the server `errorCode` in `reasonCode`.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "core/Result.hpp"
#include "core/Types.hpp"

namespace vitco {

    struct CheckInRequest {
        std::string source{"desktop"};
        NetworkInfo network{};
        std::optional<std::string> systemFingerprint{};
    };

    struct CheckOutRequest {
        std::string source{"desktop"};
        NetworkInfo network{};
        std::optional<std::string> systemFingerprint{};
        std::optional<std::uint64_t> checkOutTimeMs{};
    };

    struct NetworkValidation {
        bool allowed{false};
        std::string reason{};
    };

    struct AttendanceRecord {
        std::string id{};
        std::string status{};
    };

    class IAttendanceApi {
    public:
        virtual ~IAttendanceApi() = default;

        [[nodiscard]] virtual Result<AttendanceStatus> getStatus() = 0;
        [[nodiscard]] virtual Result<AttendanceRecord> checkIn(const CheckInRequest& request) = 0;
        [[nodiscard]] virtual Result<AttendanceRecord> checkOut(const CheckOutRequest& request) = 0;
        [[nodiscard]] virtual Result<NetworkValidation> validateNetwork(const NetworkInfo& network) = 0;
    };

}

#endif  // VITCO_CORE_IATTENDANCEAPI_HPP
