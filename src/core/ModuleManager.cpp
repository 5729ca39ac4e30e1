#include "core/ModuleManager.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>

namespace vitco {
    namespace {
        constexpr auto *MGR_TAG{"ModuleManager"};

        int nameLength(const ModuleInfo &info) {
            return static_cast<int>(info.name.size());
        }
    }

    ModuleManager::ModuleManager(EventBus &bus) : m_bus(bus) {
        m_subscriptionId = m_bus.subscribe(this, EventFilter::only(EventType::ConfigUpdated));
    }

    ModuleManager::~ModuleManager() {
        m_bus.unsubscribe(m_subscriptionId);
        stopAll();
    }

    bool ModuleManager::addModule(IModule &module) {
        const auto info{module.getInfo()};
        const auto duplicate = std::any_of(m_modules.begin(), m_modules.end(), [&info](const IModule *m) {
            return m->getInfo().name == info.name;
        });
        if (duplicate) {
            LOG_WARNING(MGR_TAG, "Module already registered: %.*s", nameLength(info), info.name.data());
            return false;
        }

        // Keep the list in start order; equal orders keep registration order
        const auto pos = std::upper_bound(m_modules.begin(), m_modules.end(), info.startOrder,
                                          [](const std::uint8_t order, const IModule *m) { return order < m->getInfo().startOrder; });
        m_modules.insert(pos, &module);

        LOG_DEBUG(MGR_TAG, "Registered %.*s (order %u): %.*s", nameLength(info), info.name.data(), unsigned{info.startOrder},
                  static_cast<int>(info.description.size()), info.description.data());
        return true;
    }

    void ModuleManager::startAll() {
        for (auto *module: m_modules) {
            module->start();
            if (!module->isRunning()) {
                const auto info{module->getInfo()};
                LOG_WARNING(MGR_TAG, "Module did not start: %.*s", nameLength(info), info.name.data());
            }
        }
        LOG_INFO(MGR_TAG, "Modules: %s", summary().c_str());
    }

    void ModuleManager::stopAll() {
        for (auto it = m_modules.rbegin(); it != m_modules.rend(); ++it) {
            (*it)->stop();
        }
    }

    bool ModuleManager::drain(const std::uint32_t timeoutMs) {
        using Clock = std::chrono::steady_clock;
        const auto deadline{Clock::now() + std::chrono::milliseconds(timeoutMs)};

        bool idle{true};
        for (auto *module: m_modules) {
            const auto left{std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count()};
            if (!module->waitIdle(static_cast<std::uint32_t>(std::max<decltype(left)>(left, 0)))) {
                const auto info{module->getInfo()};
                LOG_WARNING(MGR_TAG, "%.*s still busy after %u ms", nameLength(info), info.name.data(), unsigned{timeoutMs});
                idle = false;
            }
        }
        return idle;
    }

    std::string ModuleManager::summary() const {
        std::string out{};
        for (const auto *module: m_modules) {
            if (!out.empty()) {
                out += ' ';
            }
            out += module->getInfo().name;
            out += '=';
            out += toString(module->getState());
        }
        return out;
    }

    void ModuleManager::onEvent(const Event &event) {
        const auto *cfgEvt{std::get_if<ConfigUpdatedEvent>(&event.payload)};
        if (!cfgEvt || !cfgEvt->config) {
            return;
        }
        for (auto *module: m_modules) {
            module->handleConfigUpdate(*cfgEvt->config);
        }
    }
}
