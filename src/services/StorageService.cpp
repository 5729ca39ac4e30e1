#include "services/StorageService.hpp"

#include "core/Logger.hpp"
#include "utils/FileUtils.hpp"
#include "utils/NetworkJson.hpp"
#include "utils/TimeFormat.hpp"

#include <ArduinoJson.h>

#include <cstdio>

namespace vitco {
    namespace {
        constexpr auto* STORAGE_TAG{"Storage"};
        constexpr auto* STORAGE_FILE_NAME{"attendance-storage.json"};

        std::optional<std::uint64_t> readTimestamp(JsonVariantConst value) {
            if (!value.is<const char*>()) {
                return std::nullopt;
            }
            return utils::parseIso8601(value.as<const char*>());
        }

        void writeTimestamp(JsonObject obj, const char* key, const std::optional<std::uint64_t>& ts) {
            if (ts) {
                obj[key] = utils::toIso8601(*ts);
            }
        }
    }

    StorageService::StorageService(std::string dataDir) : m_dataDir(std::move(dataDir)) {
        m_path = m_dataDir + "/" + STORAGE_FILE_NAME;
    }

    Status StorageService::begin() {
        if (auto status = utils::ensureDirectory(m_dataDir); status.failed()) {
            return status;
        }

        const auto file{utils::readTextFile(m_path)};
        if (file.status.code == ErrorCode::NotFound) {
            LOG_INFO(STORAGE_TAG, "No attendance state yet at %s", m_path.c_str());
            return Status::OK();
        }
        if (file.failed()) {
            LOG_ERROR(STORAGE_TAG, "Cannot read state: %s", file.status.message.c_str());
            return file.status;
        }

        auto parsed{parse(file.value)};
        if (parsed.failed()) {
            const auto corruptPath{m_path + ".corrupt"};
            LOG_WARNING(STORAGE_TAG, "State file unreadable (%s), moving it to %s", parsed.status.message.c_str(), corruptPath.c_str());
            if (std::rename(m_path.c_str(), corruptPath.c_str()) != 0) {
                LOG_ERROR(STORAGE_TAG, "Could not move corrupt state file aside");
            }
            return Status::OK();
        }

        std::lock_guard lock{m_mutex};
        m_data = std::move(parsed.value);

        const auto pending{m_data.sessionState && m_data.sessionState->pendingCheckout};
        LOG_INFO(STORAGE_TAG, "State loaded: triggers=%zu, pendingCheckout=%s", m_data.triggerAttempts.size(), pending ? "yes" : "no");
        return Status::OK();
    }

    // ==================== Trigger Ledger ====================

    std::optional<std::uint64_t> StorageService::lastTriggerSuccess(const Trigger trigger) const {
        std::lock_guard lock{m_mutex};
        if (const auto it = m_data.triggerAttempts.find(trigger); it != m_data.triggerAttempts.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    Status StorageService::recordTriggerSuccess(const Trigger trigger, const std::uint64_t timestampMs) {
        std::lock_guard lock{m_mutex};
        auto next{m_data};
        next.triggerAttempts[trigger] = timestampMs;
        return commit(std::move(next));
    }

    // ==================== Last Attempts ====================

    Status StorageService::setLastCheckInAttempt(const std::uint64_t timestampMs, const std::string& sessionId) {
        std::lock_guard lock{m_mutex};
        auto next{m_data};
        next.lastCheckIn = StoredAttempt{timestampMs, sessionId};
        return commit(std::move(next));
    }

    Status StorageService::setLastCheckOutAttempt(const std::uint64_t timestampMs, const std::string& sessionId) {
        std::lock_guard lock{m_mutex};
        auto next{m_data};
        next.lastCheckOut = StoredAttempt{timestampMs, sessionId};
        return commit(std::move(next));
    }

    std::optional<std::uint64_t> StorageService::lastCheckInAttempt() const {
        std::lock_guard lock{m_mutex};
        return m_data.lastCheckIn.timestampMs;
    }

    std::optional<std::uint64_t> StorageService::lastCheckOutAttempt() const {
        std::lock_guard lock{m_mutex};
        return m_data.lastCheckOut.timestampMs;
    }

    Status StorageService::setLastNetworkUsed(const NetworkInfo& network) {
        std::lock_guard lock{m_mutex};
        auto next{m_data};
        next.lastNetworkUsed = network;
        return commit(std::move(next));
    }

    std::optional<NetworkInfo> StorageService::lastNetworkUsed() const {
        std::lock_guard lock{m_mutex};
        return m_data.lastNetworkUsed;
    }

    // ==================== Session State ====================

    Status StorageService::saveSessionState(const SessionStateUpdate& update) {
        std::lock_guard lock{m_mutex};
        auto next{m_data};
        auto state{next.sessionState.value_or(SessionState{})};

        if (update.lastCheckInTimestamp) state.lastCheckInTimestamp = update.lastCheckInTimestamp;
        if (update.lastCheckOutTimestamp) state.lastCheckOutTimestamp = update.lastCheckOutTimestamp;
        if (update.lastNetworkInfo) state.lastNetworkInfo = update.lastNetworkInfo;
        if (update.systemFingerprint) state.systemFingerprint = update.systemFingerprint;
        if (update.sessionEndTimestamp) state.sessionEndTimestamp = update.sessionEndTimestamp;
        if (update.pendingCheckout) state.pendingCheckout = *update.pendingCheckout;

        if (state.pendingCheckout && !state.sessionEndTimestamp) {
            LOG_ERROR(STORAGE_TAG, "Refusing pendingCheckout without sessionEndTimestamp");
            return Status::Error(ErrorCode::InvalidArgument, "pendingCheckout requires sessionEndTimestamp");
        }

        next.sessionState = state;
        return commit(std::move(next));
    }

    Status StorageService::markSessionEnd(const std::uint64_t timestampMs) {
        return saveSessionState(SessionStateUpdate{.sessionEndTimestamp = timestampMs, .pendingCheckout = true});
    }

    Status StorageService::clearPendingCheckout() {
        return saveSessionState(SessionStateUpdate{.pendingCheckout = false});
    }

    std::optional<SessionState> StorageService::sessionState() const {
        std::lock_guard lock{m_mutex};
        return m_data.sessionState;
    }

    bool StorageService::isPendingCheckout() const {
        std::lock_guard lock{m_mutex};
        return m_data.sessionState && m_data.sessionState->pendingCheckout;
    }

    // ==================== Persistence ====================

    Status StorageService::commit(StorageData next) {
        if (auto status = persist(next); status.failed()) {
            LOG_ERROR(STORAGE_TAG, "Persist failed: %s", status.message.c_str());
            return status;
        }
        m_data = std::move(next);
        return Status::OK();
    }

    Status StorageService::persist(const StorageData& data) const {
        return utils::writeTextFileAtomic(m_path, serialize(data));
    }

    std::string StorageService::serialize(const StorageData& data) {
        JsonDocument doc{};
        const auto root{doc.to<JsonObject>()};

        if (data.lastCheckIn.timestampMs) {
            root["lastCheckInAttemptTimestamp"] = utils::toIso8601(*data.lastCheckIn.timestampMs);
            root["lastCheckInSessionId"] = data.lastCheckIn.sessionId;
        }
        if (data.lastCheckOut.timestampMs) {
            root["lastCheckOutAttemptTimestamp"] = utils::toIso8601(*data.lastCheckOut.timestampMs);
            root["lastCheckOutSessionId"] = data.lastCheckOut.sessionId;
        }
        if (data.lastNetworkUsed) {
            utils::writeNetwork(root["lastNetworkUsed"].to<JsonObject>(), *data.lastNetworkUsed);
        }

        const auto ledger{root["lastTriggerAttempts"].to<JsonObject>()};
        for (const auto& [trigger, ts] : data.triggerAttempts) {
            ledger[toString(trigger)] = utils::toIso8601(ts);
        }

        if (data.sessionState) {
            const auto& state{*data.sessionState};
            const auto session{root["sessionState"].to<JsonObject>()};
            writeTimestamp(session, "lastCheckInTimestamp", state.lastCheckInTimestamp);
            writeTimestamp(session, "lastCheckOutTimestamp", state.lastCheckOutTimestamp);
            if (state.lastNetworkInfo) {
                utils::writeNetwork(session["lastNetworkInfo"].to<JsonObject>(), *state.lastNetworkInfo);
            }
            if (state.systemFingerprint) {
                session["systemFingerprint"] = *state.systemFingerprint;
            }
            writeTimestamp(session, "sessionEndTimestamp", state.sessionEndTimestamp);
            session["pendingCheckout"] = state.pendingCheckout;
        }

        std::string json{};
        serializeJsonPretty(doc, json);
        return json;
    }

    Result<StorageService::StorageData> StorageService::parse(const std::string& json) {
        JsonDocument doc{};
        if (const auto err = deserializeJson(doc, json); err) {
            return Result<StorageData>::Error(ErrorCode::JsonError, err.c_str());
        }

        const auto root{doc.as<JsonObjectConst>()};
        if (!root) {
            return Result<StorageData>::Error(ErrorCode::JsonError, "root is not an object");
        }

        StorageData data{};
        data.lastCheckIn.timestampMs = readTimestamp(root["lastCheckInAttemptTimestamp"]);
        data.lastCheckIn.sessionId = root["lastCheckInSessionId"] | std::string{};
        data.lastCheckOut.timestampMs = readTimestamp(root["lastCheckOutAttemptTimestamp"]);
        data.lastCheckOut.sessionId = root["lastCheckOutSessionId"] | std::string{};

        if (const auto network = root["lastNetworkUsed"].as<JsonObjectConst>()) {
            data.lastNetworkUsed = utils::readNetwork(network);
        }

        if (const auto ledger = root["lastTriggerAttempts"].as<JsonObjectConst>()) {
            for (const auto kv : ledger) {
                const auto trigger{parseTrigger(kv.key().c_str())};
                const auto ts{readTimestamp(kv.value())};
                if (trigger && ts) {
                    data.triggerAttempts[*trigger] = *ts;
                }
            }
        }

        if (const auto session = root["sessionState"].as<JsonObjectConst>()) {
            SessionState state{};
            state.lastCheckInTimestamp = readTimestamp(session["lastCheckInTimestamp"]);
            state.lastCheckOutTimestamp = readTimestamp(session["lastCheckOutTimestamp"]);
            if (const auto network = session["lastNetworkInfo"].as<JsonObjectConst>()) {
                state.lastNetworkInfo = utils::readNetwork(network);
            }
            if (session["systemFingerprint"].is<const char*>()) {
                state.systemFingerprint = session["systemFingerprint"].as<std::string>();
            }
            state.sessionEndTimestamp = readTimestamp(session["sessionEndTimestamp"]);
            state.pendingCheckout = session["pendingCheckout"] | false;

            // A pending flag without a time cannot be recovered from.
            if (state.pendingCheckout && !state.sessionEndTimestamp) {
                state.pendingCheckout = false;
            }
            data.sessionState = state;
        }

        return Result<StorageData>::Ok(std::move(data));
    }

}
