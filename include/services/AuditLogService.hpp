#ifndef VITCO_SERVICES_AUDITLOGSERVICE_HPP
#define VITCO_SERVICES_AUDITLOGSERVICE_HPP

/**
 * @file AuditLogService.hpp
 * @brief Append-only record of every automatic attendance attempt.
 *
 * One line per attempt in `<dataDir>/logs/auto-attendance.log`:
 * `[<ISO-8601>] [<trigger>] [success|failed|skipped] - <reason> <json>`
 */

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "core/Clock.hpp"
#include "core/Result.hpp"

namespace vitco {

    enum class AuditOutcome : std::uint8_t {
        Success,
        Failed,
        Skipped,
    };
    [[nodiscard]] constexpr const char* toString(const AuditOutcome outcome) noexcept {
        switch (outcome) {
            case AuditOutcome::Success: return "success";
            case AuditOutcome::Failed:  return "failed";
            case AuditOutcome::Skipped: return "skipped";
            default:                    return "unknown";
        }
    }

    class AuditLogService {
    public:
        AuditLogService(IClock& clock, std::string dataDir);
        AuditLogService(const AuditLogService&) = delete;
        AuditLogService& operator=(const AuditLogService&) = delete;
        ~AuditLogService() = default;

        [[nodiscard]] Status begin();

        /**
         * @brief Append one attempt line.
         * @param label Trigger name, or `checkout_<trigger>` for check-outs
         * @param details Serialized JSON object, empty for none
         */
        void record(const std::string& label, AuditOutcome outcome, const std::string& reason, const std::string& details = "");

        /**
         * @brief Delete `auto-attendance*.log` files older than `retentionDays`.
         * @return Number of files removed
         */
        std::size_t cleanOldLogs(std::uint32_t retentionDays);

        /**
         * @brief Last `count` non-empty lines, oldest first.
         */
        [[nodiscard]] std::vector<std::string> readRecentLogs(std::size_t count = 100) const;

        [[nodiscard]] const std::string& path() const noexcept {
            return m_path;
        }

    private:
        IClock& m_clock;
        std::string m_logDir;
        std::string m_path;
        mutable std::mutex m_mutex{};
    };

}

#endif  // VITCO_SERVICES_AUDITLOGSERVICE_HPP
