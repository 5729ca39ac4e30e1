#include "modules/RecoveryModule.hpp"

#include "core/Logger.hpp"
#include "modules/ErrorClassifier.hpp"
#include "utils/TimeFormat.hpp"

#include <chrono>

namespace vitco {
    namespace {
        constexpr auto *REC_TAG{"Recovery"};
    }

    RecoveryModule::RecoveryModule(EventBus &bus, const RecoveryContext &ctx, AttendanceModule &attendance, const AppConfig &cfg)
        : ModuleBase(bus, EventFilter::none()),
          m_ctx(ctx), m_attendance(attendance), m_warmupMs(cfg.attendance.recoveryWarmupMs) {
        setState(ModuleState::Ready);
    }

    RecoveryModule::~RecoveryModule() {
        stop();
    }

    void RecoveryModule::onStart() {
        m_cancelled.store(false);
        {
            std::lock_guard lock{m_outcomeMutex};
            m_outcome.reset();
        }
        m_thread = std::thread([this] {
            const auto outcome{runOnce()};
            LOG_INFO(REC_TAG, "Recovery finished: %s", toString(outcome));
        });
    }

    void RecoveryModule::onStop() {
        m_cancelled.store(true);
        join();
    }

    void RecoveryModule::join() {
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    bool RecoveryModule::waitIdle(const std::uint32_t timeoutMs) {
        std::unique_lock lock{m_outcomeMutex};
        if (!m_thread.joinable()) {
            return true;
        }
        return m_outcomeCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] { return m_outcome.has_value(); });
    }

    std::optional<RecoveryOutcome> RecoveryModule::lastOutcome() const {
        std::lock_guard lock{m_outcomeMutex};
        return m_outcome;
    }

    RecoveryOutcome RecoveryModule::runOnce() {
        const auto finish = [this](const RecoveryOutcome outcome) {
            {
                std::lock_guard lock{m_outcomeMutex};
                m_outcome = outcome;
            }
            m_outcomeCv.notify_all();
            return outcome;
        };

        const auto session{m_ctx.storage.sessionState()};
        if (!session || !session->pendingCheckout || !session->sessionEndTimestamp) {
            LOG_DEBUG(REC_TAG, "No pending check-out from a previous session");
            return finish(RecoveryOutcome::NothingPending);
        }

        const auto endedAt{*session->sessionEndTimestamp};
        LOG_INFO(REC_TAG, "Found pending check-out from previous session (ended %s)", utils::toIso8601(endedAt).c_str());

        // Give the session and network a moment to come up
        m_ctx.clock.sleepFor(m_warmupMs);
        if (m_cancelled.load()) {
            return finish(RecoveryOutcome::Cancelled);
        }

        if (!m_ctx.session.isAuthenticated()) {
            LOG_INFO(REC_TAG, "User not authenticated, skipping recovery");
            return finish(RecoveryOutcome::NotAuthenticated);
        }

        const auto status{m_ctx.api.getStatus()};
        if (!status.ok()) {
            LOG_ERROR(REC_TAG, "Failed to check attendance status during recovery: %s", status.status.message.c_str());
            return finish(RecoveryOutcome::StatusUnavailable);
        }

        switch (status.value) {
            case AttendanceStatus::CheckedOut:
                LOG_INFO(REC_TAG, "Already checked out, clearing pending state");
                clearPending();
                return finish(RecoveryOutcome::AlreadyResolved);
            case AttendanceStatus::NotStarted:
                LOG_INFO(REC_TAG, "No attendance for today, clearing pending state");
                clearPending();
                return finish(RecoveryOutcome::AlreadyResolved);
            default:
                break;
        }

        PromptRequest req{};
        req.title = "Previous Session Check-out";
        req.message = "Do you want to check out?";
        req.detail = "You closed the system at " + utils::toLocalDisplay(endedAt) +
                     " without checking out. Would you like to check out now at that time?";
        req.options = {"Check Out", "Skip"};
        req.level = PromptLevel::Info;

        const auto choice{m_ctx.prompt.confirm(req)};
        if (!choice.ok()) {
            // Pending stays, the next start asks again
            LOG_WARNING(REC_TAG, "Recovery prompt failed: %s", choice.status.message.c_str());
            return finish(RecoveryOutcome::Cancelled);
        }

        if (choice.value != 0) {
            LOG_INFO(REC_TAG, "User chose to skip recovery check-out");
            clearPending();
            return finish(RecoveryOutcome::Skipped);
        }

        LOG_INFO(REC_TAG, "Checking out at saved time %s", utils::toIso8601(endedAt).c_str());
        const auto result{m_attendance.attemptCheckOut(Trigger::Recovery, false, session->lastNetworkInfo, endedAt)};
        if (result.success) {
            LOG_INFO(REC_TAG, "Recovery check-out successful");
            clearPending();
            return finish(RecoveryOutcome::CheckedOut);
        }
        if (classifier::settlesPendingCheckout(result)) {
            LOG_INFO(REC_TAG, "Server already has the session closed (%s), clearing pending state", result.reason.c_str());
            clearPending();
            return finish(RecoveryOutcome::AlreadyResolved);
        }

        LOG_ERROR(REC_TAG, "Recovery check-out failed: %s", result.reason.c_str());
        PromptRequest error{};
        error.title = "Check-out Failed";
        error.message = "Check-out failed: " + result.reason;
        error.options = {"OK"};
        error.level = PromptLevel::Error;
        if (const auto ack{m_ctx.prompt.confirm(error)}; !ack.ok()) {
            LOG_WARNING(REC_TAG, "Could not show failure dialog: %s", ack.status.message.c_str());
        }
        return finish(RecoveryOutcome::CheckOutFailed);
    }

    void RecoveryModule::clearPending() {
        if (const auto status{m_ctx.storage.clearPendingCheckout()}; status.failed()) {
            LOG_ERROR(REC_TAG, "Failed to clear pending check-out: %s", status.message.c_str());
            return;
        }

        const Event evt{
            .type = EventType::PendingCheckoutChanged,
            .payload = PendingCheckoutEvent{
                .pending = false,
            },
            .timestampMs = m_ctx.clock.nowMs(),
        };
        (void)publish(evt);
    }

}
