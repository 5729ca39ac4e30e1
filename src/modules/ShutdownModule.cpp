#include "modules/ShutdownModule.hpp"

#include "core/Logger.hpp"
#include "modules/ErrorClassifier.hpp"

#include <chrono>
#include <future>

namespace vitco {
    namespace {
        constexpr auto *SHUT_TAG{"Shutdown"};
        constexpr auto *SLEEP_LOCK_NAME{"auto-checkout-sleep"};
        constexpr std::uint32_t IDLE_POLL_MS{10};

        PromptRequest checkOutQuestion(std::string detail, std::string continueLabel) {
            PromptRequest req{};
            req.title = "Check Out";
            req.message = "Are you checking out?";
            req.detail = std::move(detail);
            req.options = {"Check Out", std::move(continueLabel)};
            req.level = PromptLevel::Info;
            return req;
        }
    }

    ShutdownModule::ShutdownModule(EventBus &bus, const ShutdownContext &ctx, AttendanceModule &attendance, const AppConfig &cfg)
        : ModuleBase(bus, EventFilter::only(EventType::ShutdownRequested)
                     .include(EventType::LogoutRequested)
                     .include(EventType::ScreenLocked)
                     .include(EventType::SystemSuspending)),
          m_ctx(ctx), m_attendance(attendance), m_cfg(cfg) {
        setState(ModuleState::Ready);
    }

    ShutdownModule::~ShutdownModule() {
        stop();
    }

    void ShutdownModule::onStart() {
        m_flowState.store(ShutdownFlowState::Idle);
        LOG_INFO(SHUT_TAG, "ShutdownModule started: auto check-out=%s, timeout=%us",
                 config().checkout.autoCheckoutOnShutdownEnabled ? "on" : "off", unsigned{config().checkout.checkoutTimeoutSec});
    }

    void ShutdownModule::onStop() {
        std::thread flow{};
        std::vector<AbandonedAttempt> abandoned{};
        {
            std::lock_guard lock{m_threadMutex};
            flow = std::move(m_flowThread);
            abandoned.swap(m_abandoned);
        }

        if (flow.joinable()) {
            LOG_DEBUG(SHUT_TAG, "Waiting for running check-out flow");
            flow.join();
        }

        if (!abandoned.empty()) {
            LOG_INFO(SHUT_TAG, "Joining %zu abandoned check-out attempt(s)", abandoned.size());
        }
        for (auto &attempt: abandoned) {
            if (attempt.worker.joinable()) {
                attempt.worker.join();
            }
        }
        LOG_INFO(SHUT_TAG, "ShutdownModule stopped");
    }

    void ShutdownModule::processEvent(const Event &event) {
        switch (event.type) {
            case EventType::ShutdownRequested:
            case EventType::LogoutRequested:
            case EventType::ScreenLocked: {
                const auto trigger{event.type == EventType::ShutdownRequested ? Trigger::Shutdown : Trigger::Logout};
                // The veto must be held before this handler returns, so the
                // App's own quit handling already sees it
                if (!beginFlow(true)) {
                    return;
                }
                spawnFlow(std::thread([this, trigger] {
                    shutdownFlow(trigger);
                    endFlow(true);
                }));
                break;
            }
            case EventType::SystemSuspending: {
                ScopedWakeLock wakeLock{m_ctx.wakeLocks, SLEEP_LOCK_NAME};
                if (!beginFlow(false)) {
                    return;
                }
                spawnFlow(std::thread([this, wakeLock = std::move(wakeLock)]() mutable {
                    LOG_DEBUG(SHUT_TAG, "Sleep flow running (wake lock %s)", wakeLock.isValid() ? "held" : "unavailable");
                    sleepFlow();
                    endFlow(false);
                }));
                break;
            }
            default:
                break;
        }
    }

    void ShutdownModule::onConfigUpdate(const AppConfig &config) {
        std::lock_guard lock{m_cfgMutex};
        m_cfg = config;
    }

    AppConfig ShutdownModule::config() const {
        std::lock_guard lock{m_cfgMutex};
        return m_cfg;
    }

    // ==================== Flow Bookkeeping ====================

    void ShutdownModule::handleShutdown(const Trigger trigger) {
        if (!beginFlow(true)) {
            return;
        }
        shutdownFlow(trigger);
        endFlow(true);
    }

    void ShutdownModule::handleSleep() {
        ScopedWakeLock wakeLock{m_ctx.wakeLocks, SLEEP_LOCK_NAME};
        if (!beginFlow(false)) {
            return;
        }
        sleepFlow();
        endFlow(false);
    }

    bool ShutdownModule::beginFlow(const bool holdVeto) {
        if (holdVeto) {
            m_ctx.veto.hold(VETO_REASON);
        }

        if (m_checkingOut.exchange(true)) {
            LOG_INFO(SHUT_TAG, "Check-out flow already running");
            if (holdVeto) {
                m_ctx.veto.release(VETO_REASON);
            }
            return false;
        }
        return true;
    }

    void ShutdownModule::endFlow(const bool releaseVeto) {
        setFlowState(ShutdownFlowState::Resolved);
        m_checkingOut.store(false);
        if (releaseVeto) {
            m_ctx.veto.release(VETO_REASON);
        }
    }

    void ShutdownModule::spawnFlow(std::thread flow) {
        std::lock_guard lock{m_threadMutex};
        // The previous flow already left endFlow(), joining only reaps the thread
        if (m_flowThread.joinable()) {
            m_flowThread.join();
        }
        m_flowThread = std::move(flow);
        reapAbandonedLocked();
    }

    void ShutdownModule::reapAbandonedLocked() {
        std::erase_if(m_abandoned, [](AbandonedAttempt &attempt) {
            {
                std::lock_guard lock{attempt.pending->mutex};
                if (!attempt.pending->done) {
                    return false;
                }
            }
            // Past the done flag the worker only returns
            if (attempt.worker.joinable()) {
                attempt.worker.join();
            }
            return true;
        });
    }

    std::size_t ShutdownModule::abandonedAttempts() const {
        std::lock_guard lock{m_threadMutex};
        return m_abandoned.size();
    }

    bool ShutdownModule::waitIdle(const std::uint32_t timeoutMs) {
        const auto deadline{std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs)};
        while (m_checkingOut.load()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(IDLE_POLL_MS));
        }
        return true;
    }

    void ShutdownModule::setFlowState(const ShutdownFlowState state) {
        const auto previous{m_flowState.exchange(state)};
        if (previous != state) {
            LOG_DEBUG(SHUT_TAG, "State: %s -> %s", toString(previous), toString(state));
        }
    }

    // ==================== Flows ====================

    void ShutdownModule::shutdownFlow(const Trigger trigger) {
        setFlowState(ShutdownFlowState::CheckingEligibility);
        const auto cfg{config()};
        LOG_INFO(SHUT_TAG, "%s requested, checking attendance", toString(trigger));

        if (!cfg.checkout.autoCheckoutOnShutdownEnabled) {
            LOG_INFO(SHUT_TAG, "Auto check-out is disabled");
            return;
        }

        if (!m_ctx.session.isAuthenticated()) {
            LOG_INFO(SHUT_TAG, "User not authenticated");
            return;
        }

        const auto status{m_ctx.api.getStatus()};
        if (!status.ok()) {
            LOG_WARNING(SHUT_TAG, "Status check failed (%s), saving pending check-out", status.status.message.c_str());
            setFlowState(ShutdownFlowState::SavingPendingState);
            (void)persistPending("status unknown at shutdown");
            return;
        }

        if (status.value != AttendanceStatus::CheckedIn) {
            LOG_INFO(SHUT_TAG, "Attendance status %s, nothing to check out", toString(status.value));
            return;
        }

        setFlowState(ShutdownFlowState::Blocking);
        if (!persistPending("checked in at shutdown")) {
            LOG_ERROR(SHUT_TAG, "Pending check-out not saved, asking anyway");
        }

        setFlowState(ShutdownFlowState::AwaitingUserChoice);
        const auto choice{m_ctx.prompt.confirm(checkOutQuestion(
            "You are currently checked in. Would you like to check out before shutting down?", "Continue Anyway"))};
        if (!choice.ok()) {
            LOG_WARNING(SHUT_TAG, "Check-out prompt failed (%s), pending check-out kept", choice.status.message.c_str());
            return;
        }
        if (choice.value != 0) {
            LOG_INFO(SHUT_TAG, "User chose to continue, pending check-out kept");
            return;
        }

        setFlowState(ShutdownFlowState::Submitting);
        resolveCheckOut(raceCheckOut(trigger, trigger == Trigger::Shutdown, cfg.checkout.checkoutTimeoutSec), true);
    }

    void ShutdownModule::sleepFlow() {
        setFlowState(ShutdownFlowState::CheckingEligibility);
        const auto cfg{config()};
        LOG_INFO(SHUT_TAG, "System is going to sleep, checking attendance");

        if (!cfg.checkout.autoCheckoutOnShutdownEnabled) {
            LOG_INFO(SHUT_TAG, "Auto check-out is disabled");
            return;
        }

        if (!m_ctx.session.isAuthenticated()) {
            LOG_INFO(SHUT_TAG, "User not authenticated");
            return;
        }

        const auto status{m_ctx.api.getStatus()};
        if (!status.ok()) {
            LOG_WARNING(SHUT_TAG, "Status check failed (%s), saving pending check-out", status.status.message.c_str());
            setFlowState(ShutdownFlowState::SavingPendingState);
            (void)persistPending("status unknown at sleep");
            return;
        }

        if (status.value != AttendanceStatus::CheckedIn) {
            LOG_INFO(SHUT_TAG, "Attendance status %s, nothing to check out", toString(status.value));
            return;
        }

        setFlowState(ShutdownFlowState::Blocking);
        setFlowState(ShutdownFlowState::AwaitingUserChoice);
        const auto choice{m_ctx.prompt.confirm(checkOutQuestion(
            "Your system is trying to sleep. Would you like to check out before sleeping?", "Continue"))};
        if (!choice.ok() || choice.value != 0) {
            LOG_INFO(SHUT_TAG, "Sleeping without check-out%s", choice.ok() ? "" : " (prompt failed)");
            (void)persistPending("sleep without check-out");
            return;
        }

        setFlowState(ShutdownFlowState::Submitting);
        // Sleep submits as a shutdown check-out; a failure is only recorded, the machine is already suspending
        resolveCheckOut(raceCheckOut(Trigger::Shutdown, true, cfg.checkout.checkoutTimeoutSec), false);
    }

    // ==================== Check-out Race ====================

    ShutdownModule::RaceResult ShutdownModule::raceCheckOut(const Trigger trigger, const bool fastMode, const std::uint32_t timeoutSec) {
        auto pending{std::make_shared<PendingAttempt>()};

        std::packaged_task<AttemptResult()> task{[this, trigger, fastMode, pending] {
            auto result{m_attendance.attemptCheckOut(trigger, fastMode)};

            std::lock_guard lock{pending->mutex};
            pending->done = true;
            if (pending->abandoned) {
                // Too late for the user, still good for the stored outcome
                if (classifier::settlesPendingCheckout(result)) {
                    clearPending("late check-out completed");
                } else {
                    LOG_WARNING(SHUT_TAG, "Late check-out failed: %s", result.reason.c_str());
                }
            }
            return result;
        }};
        auto future{task.get_future()};
        std::thread worker{std::move(task)};

        RaceResult race{};
        if (future.wait_for(std::chrono::seconds(timeoutSec)) != std::future_status::ready) {
            std::unique_lock lock{pending->mutex};
            if (!pending->done) {
                pending->abandoned = true;
                LOG_WARNING(SHUT_TAG, "Check-out timed out after %us", unsigned{timeoutSec});
                (void)persistPending("check-out timed out");
                lock.unlock();

                std::lock_guard threads{m_threadMutex};
                m_abandoned.push_back(AbandonedAttempt{.worker = std::move(worker), .pending = pending});
                race.outcome = CheckOutOutcome::TimedOut;
                return race;
            }
        }

        worker.join();
        try {
            race.attempt = future.get();
        } catch (const std::exception &e) {
            LOG_ERROR(SHUT_TAG, "Check-out attempt threw: %s", e.what());
            race.attempt.reason = e.what();
            race.outcome = CheckOutOutcome::Failed;
            return race;
        }

        if (race.attempt.success) {
            race.outcome = CheckOutOutcome::Success;
        } else if (classifier::settlesPendingCheckout(race.attempt)) {
            race.outcome = CheckOutOutcome::StatusConflict;
        } else {
            race.outcome = CheckOutOutcome::Failed;
        }
        return race;
    }

    void ShutdownModule::resolveCheckOut(const RaceResult &race, const bool warnOnFailure) {
        switch (race.outcome) {
            case CheckOutOutcome::Success:
                clearPending("checked out");
                break;
            case CheckOutOutcome::StatusConflict:
                clearPending("already checked out");
                break;
            case CheckOutOutcome::Failed: {
                (void)persistPending("check-out failed");
                if (warnOnFailure) {
                    PromptRequest req{};
                    req.title = "Check-out Failed";
                    req.message = "Check-out failed: " + race.attempt.reason;
                    req.detail = "The system will shut down anyway. You may need to manually check out later.";
                    req.options = {"OK"};
                    req.level = PromptLevel::Warning;
                    if (const auto ack{m_ctx.prompt.confirm(req)}; !ack.ok()) {
                        LOG_WARNING(SHUT_TAG, "Could not show failure dialog: %s", ack.status.message.c_str());
                    }
                }
                break;
            }
            case CheckOutOutcome::TimedOut:
                // Pending marker was refreshed when the attempt was abandoned
                break;
        }
    }

    // ==================== Pending Marker ====================

    bool ShutdownModule::persistPending(const char *why) {
        const auto now{m_ctx.clock.nowMs()};
        if (const auto status{m_ctx.storage.markSessionEnd(now)}; status.failed()) {
            LOG_ERROR(SHUT_TAG, "Failed to save pending check-out (%s): %s", why, status.message.c_str());
            return false;
        }

        LOG_INFO(SHUT_TAG, "Pending check-out saved (%s)", why);
        const Event evt{
            .type = EventType::PendingCheckoutChanged,
            .payload = PendingCheckoutEvent{
                .pending = true,
                .sessionEndTimestampMs = now,
            },
            .timestampMs = now,
        };
        (void)publish(evt);
        return true;
    }

    void ShutdownModule::clearPending(const char *why) {
        if (const auto status{m_ctx.storage.clearPendingCheckout()}; status.failed()) {
            LOG_ERROR(SHUT_TAG, "Failed to clear pending check-out (%s): %s", why, status.message.c_str());
            return;
        }

        LOG_INFO(SHUT_TAG, "Pending check-out cleared (%s)", why);
        const Event evt{
            .type = EventType::PendingCheckoutChanged,
            .payload = PendingCheckoutEvent{
                .pending = false,
            },
            .timestampMs = m_ctx.clock.nowMs(),
        };
        (void)publish(evt);
    }

    Status ShutdownModule::finalizeOnQuit() {
        if (!m_ctx.session.isAuthenticated()) {
            return Status::OK();
        }
        if (m_ctx.storage.isPendingCheckout()) {
            LOG_DEBUG(SHUT_TAG, "Pending check-out already recorded");
            return Status::OK();
        }

        const auto status{m_ctx.api.getStatus()};
        if (!status.ok()) {
            LOG_WARNING(SHUT_TAG, "Status check on quit failed: %s", status.status.message.c_str());
            return status.status;
        }
        if (status.value != AttendanceStatus::CheckedIn) {
            return Status::OK();
        }

        if (!persistPending("still checked in on quit")) {
            return Status::Error(ErrorCode::StorageError, "Failed to save pending check-out");
        }
        return Status::OK();
    }

}
