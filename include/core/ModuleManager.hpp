#ifndef VITCO_CORE_MODULEMANAGER_HPP
#define VITCO_CORE_MODULEMANAGER_HPP

/**
 * @file ModuleManager.hpp
 * @brief Owns the start/stop order of the attendance flows.
 *
 * Flows depend on each other (shutdown and recovery both check out through
 * the attendance flow), so they start by `startOrder` and stop in reverse.
 * Before stopping, `drain()` gives in-flight check-outs a chance to finish.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "core/EventBus.hpp"
#include "core/IModule.hpp"

namespace vitco {

    class ModuleManager : public IEventListener {
    public:
        explicit ModuleManager(EventBus& bus);
        ModuleManager(const ModuleManager&) = delete;
        ModuleManager& operator=(const ModuleManager&) = delete;
        ~ModuleManager() override;

        /**
         * @return false for a second module with the same name
         */
        bool addModule(IModule& module);

        void startAll();

        void stopAll();

        /**
         * @brief Wait for every module to go idle, sharing one deadline.
         * @return false if some module was still busy at the deadline
         */
        bool drain(std::uint32_t timeoutMs);

        /**
         * @brief One-line state report, e.g. `Attendance=running Shutdown=stopped`.
         */
        [[nodiscard]] std::string summary() const;

        [[nodiscard]] std::size_t size() const noexcept { return m_modules.size(); }

        // ==================== IEventListener ====================
        void onEvent(const Event& event) override;

    private:
        EventBus& m_bus;
        std::vector<IModule*> m_modules{};
        EventBus::ListenerId m_subscriptionId{0};
    };

}  // namespace vitco

#endif  // VITCO_CORE_MODULEMANAGER_HPP
