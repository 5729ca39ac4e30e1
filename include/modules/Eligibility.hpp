#ifndef VITCO_MODULES_ELIGIBILITY_HPP
#define VITCO_MODULES_ELIGIBILITY_HPP

/**
 * @file Eligibility.hpp
 * @brief Sequential pre-checks before an attendance submission.
 *
 * Checks run in a fixed order and the first failing one decides the
 * outcome. Evaluation has no side effects besides the remote reads.
 */

#include <optional>
#include <string>

#include "AppConfig.hpp"
#include "core/IAttendanceApi.hpp"
#include "core/ISessionProvider.hpp"
#include "core/Types.hpp"

namespace vitco {

    struct EligibilityResult {
        bool eligible{false};
        std::string reason{};

        // Status already says there is nothing to do, as opposed to a failed check
        bool benign{false};
        ErrorType errorType{ErrorType::None};

        std::optional<AttendanceStatus> status{};
    };

    class EligibilityEvaluator {
    public:
        EligibilityEvaluator(IAttendanceApi& api, ISessionProvider& session);

        /**
         * @brief enabled -> authenticated -> status NOT_STARTED -> network approved.
         */
        [[nodiscard]] EligibilityResult evaluateCheckIn(const AttendanceConfig& cfg, const NetworkInfo& network);

        /**
         * @brief enabled -> authenticated -> status CHECKED_IN.
         *
         * The network is not checked; the server decides whether an
         * off-network check-out is acceptable.
         */
        [[nodiscard]] EligibilityResult evaluateCheckOut(const CheckoutConfig& cfg);

    private:
        IAttendanceApi& m_api;
        ISessionProvider& m_session;
    };

}

#endif  // VITCO_MODULES_ELIGIBILITY_HPP
