#ifndef VITCO_MODULES_ERRORCLASSIFIER_HPP
#define VITCO_MODULES_ERRORCLASSIFIER_HPP

/**
 * @file ErrorClassifier.hpp
 * @brief Maps rejected attendance submissions to codes, types and user text.
 *
 * The server does not always send an `errorCode`, so the code is inferred
 * from the message text when it is missing. That inference is string
 * sniffing and breaks as soon as the server rewords a message; a server
 * supplied code always wins.
 */

#include <string>
#include <string_view>

#include "core/Result.hpp"
#include "core/Types.hpp"

namespace vitco {

    struct ClassifiedError {
        std::string errorCode{};
        ErrorType type{ErrorType::System};
        std::string userMessage{};
    };

    namespace classifier {
        [[nodiscard]] std::string inferCheckInCode(std::string_view message);
        [[nodiscard]] std::string inferCheckOutCode(std::string_view message);

        [[nodiscard]] ErrorType checkInErrorType(std::string_view code, std::string_view message);
        [[nodiscard]] ErrorType checkOutErrorType(std::string_view code, std::string_view message);

        /**
         * @brief Fixed sentence for a check-in code, `fallback` for unknown codes.
         */
        [[nodiscard]] std::string checkInMessage(std::string_view code, const std::string& fallback);
        [[nodiscard]] std::string checkOutMessage(std::string_view code, const std::string& fallback);

        [[nodiscard]] ClassifiedError classifyCheckIn(const Status& error);
        [[nodiscard]] ClassifiedError classifyCheckOut(const Status& error);

        /**
         * @brief True for transport failures (refused, unresolved, timed out).
         */
        [[nodiscard]] bool isConnectionFailure(const Status& error) noexcept;

        /**
         * @brief True when a failed check-out only means the server already
         *        considers the user checked out.
         */
        [[nodiscard]] bool isStatusConflict(std::string_view errorCode, std::string_view reason);

        /**
         * @brief True when a check-out attempt leaves nothing pending: it
         *        succeeded, there was nothing to check out, or the server
         *        already has the user checked out.
         */
        [[nodiscard]] bool settlesPendingCheckout(const AttemptResult& result);
    }

}

#endif  // VITCO_MODULES_ERRORCLASSIFIER_HPP
