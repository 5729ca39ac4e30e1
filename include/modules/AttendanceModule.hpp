#ifndef VITCO_MODULES_ATTENDANCEMODULE_HPP
#define VITCO_MODULES_ATTENDANCEMODULE_HPP

/**
 * @file AttendanceModule.hpp
 * @brief Attendance lifecycle orchestrator.
 *
 * Decides at every trigger whether the user should be checked in or out,
 * submits the decision and records the outcome.
 */

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "AppConfig.hpp"
#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/IAttendanceApi.hpp"
#include "core/IFingerprintProvider.hpp"
#include "core/IModule.hpp"
#include "core/INetworkObserver.hpp"
#include "core/ISessionProvider.hpp"
#include "core/IUserPrompt.hpp"
#include "core/TaskTimer.hpp"
#include "core/Types.hpp"
#include "modules/Eligibility.hpp"
#include "services/AuditLogService.hpp"
#include "services/StorageService.hpp"

namespace vitco {

    /**
     * @brief Collaborators of the orchestrator, all owned by the App.
     */
    struct AttendanceContext {
        IClock& clock;
        IAttendanceApi& api;
        ISessionProvider& session;
        INetworkObserver& network;
        IFingerprintProvider& fingerprint;
        IUserPrompt& prompt;
        StorageService& storage;
        AuditLogService& audit;
    };

    /**
     * @brief Attendance lifecycle orchestrator.
     *
     * Architecture:
     * - Check-in triggers arrive as events (app start, login, network change,
     *   resume) and are queued for the module's worker thread
     * - Check-out attempts are requested directly by the shutdown and recovery flows
     * - Both attempt kinds share one mutex, so the trigger ledger and the
     *   session state have a single writer
     * - Only a successful check-in updates the trigger ledger; a failure never
     *   blocks the next retry
     */
    class AttendanceModule : public ModuleBase {
    public:
        /**
         * @param developmentBuild Allow check-in without a device fingerprint
         */
        AttendanceModule(EventBus& bus, const AttendanceContext& ctx, const AppConfig& cfg, bool developmentBuild = false);
        ~AttendanceModule() override;

        [[nodiscard]] ModuleInfo getInfo() const override {
            return ModuleInfo{
                .name = "Attendance",
                .description = "Automatic check-in and check-out",
                .startOrder = 0
            };
        }

        // ==================== Attempts ====================

        [[nodiscard]] AttemptResult attemptCheckIn(Trigger trigger);

        /**
         * @param fastMode Submit even without a device fingerprint (shutdown path)
         * @param networkHint Network to report instead of probing the current one
         * @param explicitTimeMs Check-out time to record instead of "now"
         */
        [[nodiscard]] AttemptResult attemptCheckOut(Trigger trigger,
                                                    bool fastMode = false,
                                                    std::optional<NetworkInfo> networkHint = std::nullopt,
                                                    std::optional<std::uint64_t> explicitTimeMs = std::nullopt);

        /**
         * @brief Queue a check-in attempt for the worker thread.
         * @return false when the module is not running or the queue is full
         */
        bool enqueueCheckIn(Trigger trigger);

        /**
         * @brief Block until the job queue is drained and no attempt is running.
         */
        bool waitIdle(std::uint32_t timeoutMs) override;

        [[nodiscard]] AppConfig config() const;

    protected:
        void onStart() override;
        void onStop() override;
        void processEvent(const Event& event) override;
        void onConfigUpdate(const AppConfig& config) override;

    private:
        void workerTask();

        AttemptResult failCheckIn(Trigger trigger, const Status& error, const NetworkInfo& network);
        AttemptResult failCheckOut(Trigger trigger, const Status& error, const NetworkInfo& network, const AppConfig& cfg);

        void publishAttempt(Trigger trigger, AttendanceIntent intent, const AttemptResult& result);
        void checkStored(const Status& status, const char* what) const;

        AttendanceContext m_ctx;
        EligibilityEvaluator m_eligibility;
        const bool m_developmentBuild;

        mutable std::mutex m_cfgMutex{};
        AppConfig m_cfg;

        // Single writer for ledger and session state
        std::mutex m_attemptMutex{};

        // Event-driven check-in jobs
        std::thread m_worker{};
        std::mutex m_jobMutex{};
        std::condition_variable m_jobCv{};
        std::condition_variable m_idleCv{};
        std::deque<Trigger> m_jobs{};
        bool m_busy{false};
        bool m_stopping{false};

        TaskTimer m_wakeTimer{"wake_checkin"};

        static constexpr std::size_t JOB_QUEUE_SIZE = 16;
    };

}  // namespace vitco

#endif  // VITCO_MODULES_ATTENDANCEMODULE_HPP
