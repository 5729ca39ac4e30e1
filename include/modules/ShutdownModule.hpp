#ifndef VITCO_MODULES_SHUTDOWNMODULE_HPP
#define VITCO_MODULES_SHUTDOWNMODULE_HPP

/**
 * @file ShutdownModule.hpp
 * @brief Check-out coordinator for shutdown, logout, lock and sleep.
 *
 * The pending check-out marker is always written before the user is asked
 * anything, so a machine that powers off under the dialog still leaves
 * enough state behind for the recovery flow on the next start.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "AppConfig.hpp"
#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/IAttendanceApi.hpp"
#include "core/IModule.hpp"
#include "core/IQuitVeto.hpp"
#include "core/ISessionProvider.hpp"
#include "core/IUserPrompt.hpp"
#include "core/IWakeLockProvider.hpp"
#include "core/Result.hpp"
#include "modules/AttendanceModule.hpp"
#include "services/StorageService.hpp"

namespace vitco {

    enum class ShutdownFlowState : std::uint8_t {
        Idle,
        CheckingEligibility,
        Blocking,            // checked in: the OS is held while the user decides
        SavingPendingState,  // status unknown: only the pending marker is written
        AwaitingUserChoice,
        Submitting,
        Resolved,
    };
    [[nodiscard]] constexpr const char* toString(const ShutdownFlowState state) noexcept {
        switch (state) {
            case ShutdownFlowState::Idle:                return "idle";
            case ShutdownFlowState::CheckingEligibility: return "checking_eligibility";
            case ShutdownFlowState::Blocking:            return "blocking";
            case ShutdownFlowState::SavingPendingState:  return "saving_pending_state";
            case ShutdownFlowState::AwaitingUserChoice:  return "awaiting_user_choice";
            case ShutdownFlowState::Submitting:          return "submitting";
            case ShutdownFlowState::Resolved:            return "resolved";
            default:                                     return "unknown";
        }
    }

    struct ShutdownContext {
        IClock& clock;
        IAttendanceApi& api;
        ISessionProvider& session;
        IUserPrompt& prompt;
        StorageService& storage;
        IQuitVeto& veto;
        IWakeLockProvider& wakeLocks;
    };

    class ShutdownModule : public ModuleBase {
    public:
        ShutdownModule(EventBus& bus, const ShutdownContext& ctx, AttendanceModule& attendance, const AppConfig& cfg);
        ~ShutdownModule() override;

        [[nodiscard]] ModuleInfo getInfo() const override {
            return ModuleInfo{
                .name = "Shutdown",
                .description = "Check-out on shutdown, logout and sleep",
                .startOrder = 1
            };
        }

        // ==================== Flows ====================

        /**
         * @brief Run the shutdown/logout flow on the calling thread.
         *        Holds the quit veto for the whole flow.
         */
        void handleShutdown(Trigger trigger);

        /**
         * @brief Run the sleep flow on the calling thread under a wake lock.
         */
        void handleSleep();

        /**
         * @brief Last-chance marker written while the process exits.
         *
         * When the user is still checked in and no pending check-out is
         * recorded yet, record one ending now.
         */
        [[nodiscard]] Status finalizeOnQuit();

        [[nodiscard]] ShutdownFlowState state() const noexcept { return m_flowState.load(); }

        [[nodiscard]] bool isCheckingOut() const noexcept { return m_checkingOut.load(); }

        /**
         * @brief Block until no flow thread is running.
         */
        bool waitIdle(std::uint32_t timeoutMs) override;

        /**
         * @brief Timed-out check-out workers not joined yet.
         */
        [[nodiscard]] std::size_t abandonedAttempts() const;

        static constexpr const char* VETO_REASON = "auto-checkout";

    protected:
        void onStart() override;
        void onStop() override;
        void processEvent(const Event& event) override;
        void onConfigUpdate(const AppConfig& config) override;

    private:
        enum class CheckOutOutcome : std::uint8_t {
            Success,
            StatusConflict,
            Failed,
            TimedOut,
        };

        struct RaceResult {
            CheckOutOutcome outcome{CheckOutOutcome::Failed};
            AttemptResult attempt{};
        };

        // Shared between a check-out worker and the flow that may abandon it
        struct PendingAttempt {
            std::mutex mutex{};
            bool done{false};
            bool abandoned{false};
        };

        struct AbandonedAttempt {
            std::thread worker;
            std::shared_ptr<PendingAttempt> pending;
        };

        [[nodiscard]] bool beginFlow(bool holdVeto);
        void endFlow(bool releaseVeto);
        void spawnFlow(std::thread flow);
        void reapAbandonedLocked();

        void shutdownFlow(Trigger trigger);
        void sleepFlow();

        [[nodiscard]] RaceResult raceCheckOut(Trigger trigger, bool fastMode, std::uint32_t timeoutSec);
        void resolveCheckOut(const RaceResult& race, bool warnOnFailure);

        bool persistPending(const char* why);
        void clearPending(const char* why);

        void setFlowState(ShutdownFlowState state);
        [[nodiscard]] AppConfig config() const;

        ShutdownContext m_ctx;
        AttendanceModule& m_attendance;

        mutable std::mutex m_cfgMutex{};
        AppConfig m_cfg;

        std::atomic<ShutdownFlowState> m_flowState{ShutdownFlowState::Idle};
        std::atomic<bool> m_checkingOut{false};

        mutable std::mutex m_threadMutex{};
        std::thread m_flowThread{};
        std::vector<AbandonedAttempt> m_abandoned{};
    };

}  // namespace vitco

#endif  // VITCO_MODULES_SHUTDOWNMODULE_HPP
