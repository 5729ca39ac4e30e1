#ifndef VITCO_SERVICES_CONFIGSERVICE_HPP
#define VITCO_SERVICES_CONFIGSERVICE_HPP

/**
 * @file ConfigService.hpp
 * @brief Configuration management service backed by `config.json`.
 *
 * @note Provides persistent storage and runtime updates for application
 * configuration in the agent's data directory.
 */

#include <mutex>
#include <string>

#include "AppConfig.hpp"
#include "core/Result.hpp"
#include "core/EventBus.hpp"

namespace vitco {
    /**
     * @brief Configuration management service.
     *
     * Responsibilities:
     * - Load configuration from disk at startup (defaults for missing keys)
     * - Save configuration changes atomically
     * - Parse and apply partial JSON configuration updates
     * - Notify other components of configuration changes
     */
    class ConfigService {
    public:
        ConfigService(EventBus& bus, std::string dataDir);
        ConfigService(const ConfigService&) = delete;
        ConfigService& operator=(const ConfigService&) = delete;
        ~ConfigService() = default;

        /**
         * @brief Load configuration, writing defaults when no file exists.
         * @return Status indicating success or failure
         */
        [[nodiscard]] Status begin();

        /**
         * @brief Get the current configuration (read-only).
         * @return Reference to the current configuration
         */
        [[nodiscard]] const AppConfig& get() const noexcept {
            return m_config;
        }

        /**
         * @brief Overlay a (partial) JSON document on the current configuration.
         * @param json JSON configuration string
         * @return Status indicating success or failure
         */
        [[nodiscard]] Status updateFromJson(const std::string& json);

        /**
         * @brief Save current configuration to persistent storage.
         * @return Status indicating success or failure
         */
        [[nodiscard]] Status save();

        [[nodiscard]] const std::string& path() const noexcept {
            return m_path;
        }

    private:
        Status load();
        void notifyUpdated();

        EventBus& m_bus;
        std::string m_dataDir;
        std::string m_path;
        AppConfig m_config{};
        std::mutex m_mutex{};
    };
}

#endif  // VITCO_SERVICES_CONFIGSERVICE_HPP
