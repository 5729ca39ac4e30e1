#ifndef VITCO_CORE_IMODULE_HPP
#define VITCO_CORE_IMODULE_HPP

/**
 * @file IModule.hpp
 * @brief Attendance flow modules and their lifecycle.
 *
 * A module owns one flow end to end: check-in orchestration, the shutdown
 * check-out, the startup recovery. Flows react to bus events and may run
 * work on their own threads; `waitIdle()` lets the agent drain that work
 * before it stops the modules.
 */

#include <atomic>
#include <cstdint>
#include <string_view>

#include "AppConfig.hpp"
#include "core/EventBus.hpp"
#include "core/Events.hpp"

namespace vitco {

    struct ModuleInfo {
        std::string_view name{};
        std::string_view description{};
        std::uint8_t startOrder{0};  // Lower = started first, stopped last
    };

    enum class ModuleState : std::uint8_t {
        Created,
        Ready,
        Running,
        Stopping,
        Stopped,
    };

    [[nodiscard]] inline constexpr const char* toString(ModuleState state) noexcept {
        switch (state) {
            case ModuleState::Created:  return "created";
            case ModuleState::Ready:    return "ready";
            case ModuleState::Running:  return "running";
            case ModuleState::Stopping: return "stopping";
            case ModuleState::Stopped:  return "stopped";
            default:                    return "unknown";
        }
    }

    class IModule {
    public:
        virtual ~IModule() = default;

        virtual void start() = 0;

        /**
         * @brief Stop the flow. Must join every thread the module owns.
         */
        virtual void stop() = 0;

        virtual void handleConfigUpdate(const AppConfig& config) = 0;

        /**
         * @brief Block until no attempt or prompt of this module is in flight.
         * @return false if work was still running after `timeoutMs`
         */
        virtual bool waitIdle(std::uint32_t timeoutMs) {
            (void)timeoutMs;
            return true;
        }

        [[nodiscard]] virtual ModuleInfo getInfo() const = 0;

        [[nodiscard]] ModuleState getState() const noexcept { return m_state.load(); }

        [[nodiscard]] bool isRunning() const noexcept {
            return m_state.load() == ModuleState::Running;
        }

    protected:
        void setState(ModuleState state) noexcept { m_state.store(state); }

    private:
        std::atomic<ModuleState> m_state{ModuleState::Created};
    };

    /**
     * @brief Module bound to the EventBus.
     *
     * Subscribes with the module's filter for its whole lifetime, but only
     * hands events to `processEvent()` while running. Config updates are
     * also accepted before start so a module starts with current settings.
     *
     * Subclasses mark themselves `Ready` once their context is wired.
     */
    class ModuleBase : public IModule, public IEventListener {
    public:
        ModuleBase(EventBus& bus, EventFilter filter) : m_bus(bus) {
            m_subscriptionId = m_bus.subscribe(this, filter);
        }

        ~ModuleBase() override {
            m_bus.unsubscribe(m_subscriptionId);
        }

        ModuleBase(const ModuleBase&) = delete;
        ModuleBase& operator=(const ModuleBase&) = delete;
        ModuleBase(ModuleBase&&) = delete;
        ModuleBase& operator=(ModuleBase&&) = delete;

        void start() final {
            if (isRunning()) {
                return;
            }
            onStart();
            setState(ModuleState::Running);
        }

        void stop() final {
            if (!isRunning()) {
                return;
            }
            setState(ModuleState::Stopping);
            onStop();
            setState(ModuleState::Stopped);
        }

        void handleConfigUpdate(const AppConfig& config) override {
            const auto state{getState()};
            if (state == ModuleState::Running || state == ModuleState::Ready) {
                onConfigUpdate(config);
            }
        }

        void onEvent(const Event& event) final {
            if (isRunning()) {
                processEvent(event);
            }
        }

    protected:
        virtual void onStart() {}

        virtual void onStop() {}

        /**
         * @brief Runs on the EventBus thread; anything that talks to the
         *        server or the user belongs on a worker.
         */
        virtual void processEvent(const Event& event) { (void)event; }

        virtual void onConfigUpdate(const AppConfig& config) { (void)config; }

        [[nodiscard]] bool publish(const Event& event) const {
            return m_bus.publish(event);
        }

    private:
        EventBus& m_bus;
        EventBus::ListenerId m_subscriptionId{0};
    };

}  // namespace vitco

#endif  // VITCO_CORE_IMODULE_HPP
