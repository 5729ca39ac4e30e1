#include "services/AuditLogService.hpp"

#include "core/Logger.hpp"
#include "utils/FileUtils.hpp"
#include "utils/TimeFormat.hpp"

#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>

namespace vitco {
    namespace {
        constexpr auto* AUDIT_TAG{"AuditLog"};
        constexpr auto* AUDIT_FILE_NAME{"auto-attendance.log"};
        constexpr std::string_view AUDIT_FILE_PREFIX{"auto-attendance"};
        constexpr std::string_view AUDIT_FILE_SUFFIX{".log"};

        bool isAuditFile(const std::string& name) {
            return name.size() >= AUDIT_FILE_PREFIX.size() + AUDIT_FILE_SUFFIX.size()
                && name.compare(0, AUDIT_FILE_PREFIX.size(), AUDIT_FILE_PREFIX) == 0
                && name.compare(name.size() - AUDIT_FILE_SUFFIX.size(), AUDIT_FILE_SUFFIX.size(), AUDIT_FILE_SUFFIX) == 0;
        }
    }

    AuditLogService::AuditLogService(IClock& clock, std::string dataDir) : m_clock(clock) {
        m_logDir = std::move(dataDir) + "/logs";
        m_path = m_logDir + "/" + AUDIT_FILE_NAME;
    }

    Status AuditLogService::begin() {
        return utils::ensureDirectory(m_logDir);
    }

    void AuditLogService::record(const std::string& label, const AuditOutcome outcome, const std::string& reason, const std::string& details) {
        std::string line{"[" + utils::toIso8601(m_clock.nowMs()) + "] [" + label + "] [" + toString(outcome) + "] - " + reason};
        if (!details.empty()) {
            line += " " + details;
        }
        line += "\n";

        std::lock_guard lock{m_mutex};
        std::ofstream out{m_path, std::ios::app};
        if (!out) {
            LOG_ERROR(AUDIT_TAG, "Cannot open %s for append", m_path.c_str());
            return;
        }
        out << line;
        if (!out.flush()) {
            LOG_ERROR(AUDIT_TAG, "Write to %s failed", m_path.c_str());
        }
    }

    std::size_t AuditLogService::cleanOldLogs(const std::uint32_t retentionDays) {
        namespace fs = std::filesystem;

        const auto cutoff{fs::file_time_type::clock::now() - std::chrono::hours{24} * retentionDays};
        std::size_t removed{0};

        std::lock_guard lock{m_mutex};
        std::error_code ec{};
        fs::directory_iterator it{m_logDir, ec};
        if (ec) {
            LOG_WARNING(AUDIT_TAG, "Cannot list %s: %s", m_logDir.c_str(), ec.message().c_str());
            return 0;
        }

        for (; it != fs::directory_iterator{}; it.increment(ec)) {
            if (ec) {
                break;
            }
            const auto& entry{*it};
            const auto name{entry.path().filename().string()};
            std::error_code entryEc{};
            if (!isAuditFile(name) || !entry.is_regular_file(entryEc)) {
                continue;
            }
            const auto mtime{entry.last_write_time(entryEc)};
            if (entryEc || mtime >= cutoff) {
                continue;
            }
            if (fs::remove(entry.path(), entryEc) && !entryEc) {
                ++removed;
                LOG_INFO(AUDIT_TAG, "Removed old audit log %s", name.c_str());
            } else {
                LOG_WARNING(AUDIT_TAG, "Could not remove %s: %s", name.c_str(), entryEc.message().c_str());
            }
        }

        return removed;
    }

    std::vector<std::string> AuditLogService::readRecentLogs(const std::size_t count) const {
        std::lock_guard lock{m_mutex};
        std::ifstream in{m_path};
        if (!in) {
            return {};
        }

        std::deque<std::string> tail{};
        std::string line{};
        while (std::getline(in, line)) {
            if (line.empty()) {
                continue;
            }
            tail.push_back(std::move(line));
            if (tail.size() > count) {
                tail.pop_front();
            }
        }
        return {tail.begin(), tail.end()};
    }

}
