#ifndef VITCO_SERVICES_STORAGESERVICE_HPP
#define VITCO_SERVICES_STORAGESERVICE_HPP

/**
 * @file StorageService.hpp
 * @brief Durable attendance state: ledger, last attempts, session state.
 *
 * Backed by `attendance-storage.json` in the data directory. Every mutator
 * persists before returning and only updates the in-memory copy once the
 * file was replaced, so memory never runs ahead of disk.
 */

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "core/Result.hpp"
#include "core/Types.hpp"

namespace vitco {

    class StorageService {
    public:
        explicit StorageService(std::string dataDir);
        StorageService(const StorageService&) = delete;
        StorageService& operator=(const StorageService&) = delete;
        ~StorageService() = default;

        /**
         * @brief Load the state file. A missing file starts empty; a corrupt
         *        one is moved aside to `<file>.corrupt` and also starts empty.
         */
        [[nodiscard]] Status begin();

        // ==================== Trigger Ledger ====================

        [[nodiscard]] std::optional<std::uint64_t> lastTriggerSuccess(Trigger trigger) const;
        [[nodiscard]] Status recordTriggerSuccess(Trigger trigger, std::uint64_t timestampMs);

        // ==================== Last Attempts ====================

        [[nodiscard]] Status setLastCheckInAttempt(std::uint64_t timestampMs, const std::string& sessionId);
        [[nodiscard]] Status setLastCheckOutAttempt(std::uint64_t timestampMs, const std::string& sessionId);
        [[nodiscard]] std::optional<std::uint64_t> lastCheckInAttempt() const;
        [[nodiscard]] std::optional<std::uint64_t> lastCheckOutAttempt() const;

        [[nodiscard]] Status setLastNetworkUsed(const NetworkInfo& network);
        [[nodiscard]] std::optional<NetworkInfo> lastNetworkUsed() const;

        // ==================== Session State ====================

        /**
         * @brief Merge the set fields of `update` into the stored session state.
         *
         * Rejects an update that would leave `pendingCheckout == true`
         * without a `sessionEndTimestamp`.
         */
        [[nodiscard]] Status saveSessionState(const SessionStateUpdate& update);

        /**
         * @brief Record that the session may end now: pending=true, end=timestampMs.
         */
        [[nodiscard]] Status markSessionEnd(std::uint64_t timestampMs);

        [[nodiscard]] Status clearPendingCheckout();

        [[nodiscard]] std::optional<SessionState> sessionState() const;

        [[nodiscard]] bool isPendingCheckout() const;

        [[nodiscard]] const std::string& path() const noexcept {
            return m_path;
        }

    private:
        struct StoredAttempt {
            std::optional<std::uint64_t> timestampMs{};
            std::string sessionId{};
        };

        struct StorageData {
            StoredAttempt lastCheckIn{};
            StoredAttempt lastCheckOut{};
            std::optional<NetworkInfo> lastNetworkUsed{};
            std::map<Trigger, std::uint64_t> triggerAttempts{};
            std::optional<SessionState> sessionState{};
        };

        [[nodiscard]] Status persist(const StorageData& data) const;
        [[nodiscard]] Status commit(StorageData next);
        [[nodiscard]] static Result<StorageData> parse(const std::string& json);
        [[nodiscard]] static std::string serialize(const StorageData& data);

        std::string m_dataDir;
        std::string m_path;
        StorageData m_data{};
        mutable std::mutex m_mutex{};
    };

}

#endif  // VITCO_SERVICES_STORAGESERVICE_HPP
