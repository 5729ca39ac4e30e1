#include "modules/Eligibility.hpp"

#include "core/Logger.hpp"
#include "modules/ErrorClassifier.hpp"

namespace vitco {
    namespace {
        constexpr auto* ELIG_TAG{"Eligibility"};

        EligibilityResult ineligible(std::string reason, const ErrorType type, const bool benign = false) {
            EligibilityResult out{};
            out.reason = std::move(reason);
            out.errorType = type;
            out.benign = benign;
            return out;
        }
    }

    EligibilityEvaluator::EligibilityEvaluator(IAttendanceApi& api, ISessionProvider& session)
        : m_api(api), m_session(session) {
    }

    EligibilityResult EligibilityEvaluator::evaluateCheckIn(const AttendanceConfig& cfg, const NetworkInfo& network) {
        if (!cfg.autoCheckInEnabled) {
            return ineligible("Auto check-in is disabled", ErrorType::Validation);
        }

        if (!m_session.isAuthenticated()) {
            return ineligible("User not authenticated", ErrorType::Authentication);
        }

        const auto status{m_api.getStatus()};
        if (!status.ok()) {
            if (classifier::isConnectionFailure(status.status)) {
                LOG_WARNING(ELIG_TAG, "Server connection failed: %s", status.status.message.c_str());
                return ineligible("Server connection failed. Please ensure the server is running.", ErrorType::Network);
            }
            return ineligible("Failed to check attendance status: " + status.status.message, ErrorType::System);
        }

        if (status.value != AttendanceStatus::NotStarted) {
            auto out{ineligible("Already checked in today", ErrorType::Validation, true)};
            out.status = status.value;
            return out;
        }

        const auto validation{m_api.validateNetwork(network)};
        if (!validation.ok()) {
            return ineligible("Failed to validate network: " + validation.status.message, ErrorType::Network);
        }
        if (!validation.value.allowed) {
            auto reason{validation.value.reason.empty() ? std::string{"Network not approved for attendance"} : validation.value.reason};
            return ineligible(std::move(reason), ErrorType::Network);
        }

        LOG_DEBUG(ELIG_TAG, "Check-in eligible on %s", describe(network).c_str());
        EligibilityResult out{};
        out.eligible = true;
        out.status = status.value;
        return out;
    }

    EligibilityResult EligibilityEvaluator::evaluateCheckOut(const CheckoutConfig& cfg) {
        if (!cfg.autoCheckoutOnShutdownEnabled) {
            return ineligible("Auto check-out is disabled", ErrorType::Validation);
        }

        if (!m_session.isAuthenticated()) {
            return ineligible("User not authenticated", ErrorType::Authentication);
        }

        const auto status{m_api.getStatus()};
        if (!status.ok()) {
            return ineligible("Failed to check attendance status: " + status.status.message,
                              classifier::isConnectionFailure(status.status) ? ErrorType::Network : ErrorType::System);
        }

        switch (status.value) {
            case AttendanceStatus::NotStarted: {
                auto out{ineligible("Not checked in today", ErrorType::None, true)};
                out.status = status.value;
                return out;
            }
            case AttendanceStatus::CheckedOut: {
                auto out{ineligible("Already checked out today", ErrorType::None, true)};
                out.status = status.value;
                return out;
            }
            default:
                break;
        }

        EligibilityResult out{};
        out.eligible = true;
        out.status = status.value;
        return out;
    }

}
