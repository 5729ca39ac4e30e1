#include "services/ConfigService.hpp"

#include "core/Logger.hpp"
#include "utils/FileUtils.hpp"

#include <ArduinoJson.h>

namespace vitco {
    namespace {
        constexpr auto *CONFIG_SERVICE_TAG{"ConfigService"};
        constexpr auto *CONFIG_FILE_NAME{"config.json"};

        void applyJson(const JsonObjectConst root, AppConfig &cfg) {
            // Attendance
            if (const auto att = root["attendance"].as<JsonObjectConst>()) {
                cfg.attendance.autoCheckInEnabled = att["autoCheckInEnabled"] | cfg.attendance.autoCheckInEnabled;
                cfg.attendance.autoStartEnabled = att["autoStartEnabled"] | cfg.attendance.autoStartEnabled;
                cfg.attendance.showNotifications = att["showNotifications"] | cfg.attendance.showNotifications;
                cfg.attendance.debounceMs = att["debounceMs"] | cfg.attendance.debounceMs;
                cfg.attendance.wakeCheckInDelayMs = att["wakeCheckInDelayMs"] | cfg.attendance.wakeCheckInDelayMs;
                cfg.attendance.networkPollIntervalMs = att["networkPollIntervalMs"] | cfg.attendance.networkPollIntervalMs;
                cfg.attendance.networkSettleMs = att["networkSettleMs"] | cfg.attendance.networkSettleMs;
                cfg.attendance.recoveryWarmupMs = att["recoveryWarmupMs"] | cfg.attendance.recoveryWarmupMs;
            }

            // Check-out
            if (const auto co = root["checkout"].as<JsonObjectConst>()) {
                cfg.checkout.autoCheckoutOnShutdownEnabled = co["autoCheckoutOnShutdownEnabled"] | cfg.checkout.autoCheckoutOnShutdownEnabled;
                cfg.checkout.checkoutTimeoutSec = co["checkoutTimeout"] | cfg.checkout.checkoutTimeoutSec;
                cfg.checkout.checkoutNotificationsEnabled = co["checkoutNotificationsEnabled"] | cfg.checkout.checkoutNotificationsEnabled;
            }

            // API
            if (const auto api = root["api"].as<JsonObjectConst>()) {
                cfg.api.baseUrl = api["baseUrl"] | cfg.api.baseUrl;
                cfg.api.timeoutMs = api["timeoutMs"] | cfg.api.timeoutMs;
                cfg.api.refreshTimeoutMs = api["refreshTimeoutMs"] | cfg.api.refreshTimeoutMs;
            }

            // Proxy
            if (const auto proxy = root["proxy"].as<JsonObjectConst>()) {
                cfg.proxy.autoStartEnabled = proxy["autoStartEnabled"] | cfg.proxy.autoStartEnabled;
                cfg.proxy.port = proxy["port"] | cfg.proxy.port;
                cfg.proxy.heartbeatIntervalMs = proxy["heartbeatIntervalMs"] | cfg.proxy.heartbeatIntervalMs;
                cfg.proxy.reregisterIntervalMs = proxy["reregisterIntervalMs"] | cfg.proxy.reregisterIntervalMs;
                cfg.proxy.maxRetries = proxy["maxRetries"] | cfg.proxy.maxRetries;
                cfg.proxy.backoffMinMs = proxy["backoffMinMs"] | cfg.proxy.backoffMinMs;
                cfg.proxy.backoffMaxMs = proxy["backoffMaxMs"] | cfg.proxy.backoffMaxMs;
                cfg.proxy.backoffMultiplier = proxy["backoffMultiplier"] | cfg.proxy.backoffMultiplier;
            }

            // Log
            if (const auto log = root["log"].as<JsonObjectConst>()) {
                cfg.log.level = log["level"] | cfg.log.level;
                cfg.log.fileEnabled = log["fileEnabled"] | cfg.log.fileEnabled;
                cfg.log.auditRetentionDays = log["auditRetentionDays"] | cfg.log.auditRetentionDays;
            }
        }
    }

    ConfigService::ConfigService(EventBus &bus, std::string dataDir) : m_bus(bus), m_dataDir(std::move(dataDir)) {
        m_path = m_dataDir + "/" + CONFIG_FILE_NAME;
    }

    Status ConfigService::begin() {
        if (auto status = utils::ensureDirectory(m_dataDir); status.failed()) {
            LOG_ERROR(CONFIG_SERVICE_TAG, "Data directory unavailable: %s", status.message.c_str());
            m_config = AppConfig::makeDefault();
            return status;
        }

        if (const auto status = load(); !status.ok()) {
            LOG_WARNING(CONFIG_SERVICE_TAG, "Load failed (%s), using defaults", status.message.c_str());
            m_config = AppConfig::makeDefault();
        }

        notifyUpdated();
        return Status::OK();
    }

    Status ConfigService::load() {
        const auto file{utils::readTextFile(m_path)};

        if (file.status.code == ErrorCode::NotFound) {
            LOG_INFO(CONFIG_SERVICE_TAG, "No config at %s, writing defaults", m_path.c_str());
            m_config = AppConfig::makeDefault();
            return save();
        }
        if (file.failed()) {
            return file.status;
        }

        JsonDocument doc{};
        if (const auto err = deserializeJson(doc, file.value); err) {
            LOG_ERROR(CONFIG_SERVICE_TAG, "JSON parse error: %s", err.c_str());
            return Status::Error(ErrorCode::JsonError, "Deserialize failed");
        }

        auto cfg = AppConfig::makeDefault();
        applyJson(doc.as<JsonObjectConst>(), cfg);

        if (!cfg.validate()) {
            LOG_WARNING(CONFIG_SERVICE_TAG, "Loaded config fails validation, using defaults");
            cfg = AppConfig::makeDefault();
        }

        std::lock_guard lock{m_mutex};
        m_config = cfg;
        LOG_INFO(CONFIG_SERVICE_TAG, "Config loaded from %s", m_path.c_str());
        return Status::OK();
    }

    Status ConfigService::updateFromJson(const std::string &json) {
        JsonDocument doc{};
        if (const auto err = deserializeJson(doc, json); err) {
            LOG_ERROR(CONFIG_SERVICE_TAG, "Update JSON parse error: %s", err.c_str());
            return Status::Error(ErrorCode::JsonError, "Deserialize failed");
        }

        if (!doc.is<JsonObjectConst>()) {
            return Status::Error(ErrorCode::InvalidArgument, "Config update must be a JSON object");
        }

        {
            std::lock_guard lock{m_mutex};
            auto cfg{m_config};
            applyJson(doc.as<JsonObjectConst>(), cfg);

            if (!cfg.validate()) {
                LOG_WARNING(CONFIG_SERVICE_TAG, "Rejected config update: validation failed");
                return Status::Error(ErrorCode::ConfigError, "Config validation failed");
            }
            m_config = cfg;
        }

        if (auto status = save(); status.failed()) {
            return status;
        }

        notifyUpdated();
        LOG_INFO(CONFIG_SERVICE_TAG, "Config updated");
        return Status::OK();
    }

    Status ConfigService::save() {
        JsonDocument doc{};
        const auto root{doc.to<JsonObject>()};

        std::unique_lock lock{m_mutex};

        // Attendance
        {
            const auto att{root["attendance"].to<JsonObject>()};
            att["autoCheckInEnabled"] = m_config.attendance.autoCheckInEnabled;
            att["autoStartEnabled"] = m_config.attendance.autoStartEnabled;
            att["showNotifications"] = m_config.attendance.showNotifications;
            att["debounceMs"] = m_config.attendance.debounceMs;
            att["wakeCheckInDelayMs"] = m_config.attendance.wakeCheckInDelayMs;
            att["networkPollIntervalMs"] = m_config.attendance.networkPollIntervalMs;
            att["networkSettleMs"] = m_config.attendance.networkSettleMs;
            att["recoveryWarmupMs"] = m_config.attendance.recoveryWarmupMs;
        }

        // Check-out
        {
            const auto co{root["checkout"].to<JsonObject>()};
            co["autoCheckoutOnShutdownEnabled"] = m_config.checkout.autoCheckoutOnShutdownEnabled;
            co["checkoutTimeout"] = m_config.checkout.checkoutTimeoutSec;
            co["checkoutNotificationsEnabled"] = m_config.checkout.checkoutNotificationsEnabled;
        }

        // API
        {
            const auto api{root["api"].to<JsonObject>()};
            api["baseUrl"] = m_config.api.baseUrl;
            api["timeoutMs"] = m_config.api.timeoutMs;
            api["refreshTimeoutMs"] = m_config.api.refreshTimeoutMs;
        }

        // Proxy
        {
            const auto proxy{root["proxy"].to<JsonObject>()};
            proxy["autoStartEnabled"] = m_config.proxy.autoStartEnabled;
            proxy["port"] = m_config.proxy.port;
            proxy["heartbeatIntervalMs"] = m_config.proxy.heartbeatIntervalMs;
            proxy["reregisterIntervalMs"] = m_config.proxy.reregisterIntervalMs;
            proxy["maxRetries"] = m_config.proxy.maxRetries;
            proxy["backoffMinMs"] = m_config.proxy.backoffMinMs;
            proxy["backoffMaxMs"] = m_config.proxy.backoffMaxMs;
            proxy["backoffMultiplier"] = m_config.proxy.backoffMultiplier;
        }

        // Log
        {
            const auto log{root["log"].to<JsonObject>()};
            log["level"] = m_config.log.level;
            log["fileEnabled"] = m_config.log.fileEnabled;
            log["auditRetentionDays"] = m_config.log.auditRetentionDays;
        }

        lock.unlock();

        std::string json{};
        serializeJsonPretty(doc, json);

        if (auto status = utils::writeTextFileAtomic(m_path, json); status.failed()) {
            LOG_ERROR(CONFIG_SERVICE_TAG, "Failed to save config: %s", status.message.c_str());
            return status;
        }

        LOG_DEBUG(CONFIG_SERVICE_TAG, "Config saved (%zu bytes)", json.size());
        return Status::OK();
    }

    void ConfigService::notifyUpdated() {
        const Event evt{
            .type = EventType::ConfigUpdated,
            .payload = ConfigUpdatedEvent{.config = &m_config},
        };
        (void)m_bus.publish(evt);
    }
}
