#ifndef VITCO_MODULES_RECOVERYMODULE_HPP
#define VITCO_MODULES_RECOVERYMODULE_HPP

/**
 * @file RecoveryModule.hpp
 * @brief Reconciles a check-out left pending by the previous run.
 *
 * Runs once shortly after start. When the stored session says the machine
 * went down while checked in, the user is offered a check-out at the time
 * the session ended.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

#include "AppConfig.hpp"
#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/IAttendanceApi.hpp"
#include "core/IModule.hpp"
#include "core/ISessionProvider.hpp"
#include "core/IUserPrompt.hpp"
#include "modules/AttendanceModule.hpp"
#include "services/StorageService.hpp"

namespace vitco {

    enum class RecoveryOutcome : std::uint8_t {
        NothingPending,
        NotAuthenticated,
        CheckedOut,
        CheckOutFailed,
        Skipped,
        AlreadyResolved,
        StatusUnavailable,
        Cancelled,
    };
    [[nodiscard]] constexpr const char* toString(const RecoveryOutcome outcome) noexcept {
        switch (outcome) {
            case RecoveryOutcome::NothingPending:    return "nothing_pending";
            case RecoveryOutcome::NotAuthenticated:  return "not_authenticated";
            case RecoveryOutcome::CheckedOut:        return "checked_out";
            case RecoveryOutcome::CheckOutFailed:    return "check_out_failed";
            case RecoveryOutcome::Skipped:           return "skipped";
            case RecoveryOutcome::AlreadyResolved:   return "already_resolved";
            case RecoveryOutcome::StatusUnavailable: return "status_unavailable";
            case RecoveryOutcome::Cancelled:         return "cancelled";
            default:                                 return "unknown";
        }
    }

    struct RecoveryContext {
        IClock& clock;
        IAttendanceApi& api;
        ISessionProvider& session;
        IUserPrompt& prompt;
        StorageService& storage;
    };

    class RecoveryModule : public ModuleBase {
    public:
        RecoveryModule(EventBus& bus, const RecoveryContext& ctx, AttendanceModule& attendance, const AppConfig& cfg);
        ~RecoveryModule() override;

        [[nodiscard]] ModuleInfo getInfo() const override {
            return ModuleInfo{
                .name = "Recovery",
                .description = "Pending check-out recovery",
                .startOrder = 2
            };
        }

        /**
         * @brief Run the reconciliation on the calling thread.
         */
        RecoveryOutcome runOnce();

        /**
         * @brief Outcome of the background run, once it finished.
         */
        [[nodiscard]] std::optional<RecoveryOutcome> lastOutcome() const;

        /**
         * @brief Block until the background run finished.
         */
        void join();

        /**
         * @brief Block until the background run has produced an outcome.
         */
        bool waitIdle(std::uint32_t timeoutMs) override;

    protected:
        void onStart() override;
        void onStop() override;

    private:
        void clearPending();

        RecoveryContext m_ctx;
        AttendanceModule& m_attendance;
        const std::uint32_t m_warmupMs;

        std::atomic<bool> m_cancelled{false};
        std::thread m_thread{};

        mutable std::mutex m_outcomeMutex{};
        std::condition_variable m_outcomeCv{};
        std::optional<RecoveryOutcome> m_outcome{};
    };

}  // namespace vitco

#endif  // VITCO_MODULES_RECOVERYMODULE_HPP
