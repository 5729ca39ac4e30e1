#include "core/EventBus.hpp"
#include "core/Logger.hpp"

#include <chrono>

namespace vitco {
    namespace {
        constexpr auto *EVENT_TAG{"EventBus"};
        constexpr std::size_t MAX_SUBSCRIPTIONS{32};
    }

    EventBus::EventBus(const Config &cfg)
        : m_urgent{"urgent", cfg.highPriorityQueueLength}, m_normal{"normal", cfg.queueLength} {
        m_subscriptions.reserve(MAX_SUBSCRIPTIONS);
    }

    EventBus::~EventBus() {
        stop();
    }

    void EventBus::start() {
        if (m_thread.joinable()) {
            return;
        }
        m_running.store(true);
        m_thread = std::thread(&EventBus::run, this);
        LOG_INFO(EVENT_TAG, "Started (normal=%u, urgent=%u)", unsigned{m_normal.capacity}, unsigned{m_urgent.capacity});
    }

    void EventBus::stop() {
        {
            std::lock_guard lock{m_queueMutex};
            m_running.store(false);
        }
        m_queueCv.notify_all();
        if (m_thread.joinable()) {
            m_thread.join();
        }

        std::size_t discarded{0};
        {
            std::lock_guard lock{m_queueMutex};
            discarded = m_urgent.events.size() + m_normal.events.size();
            m_urgent.events.clear();
            m_normal.events.clear();
        }
        if (discarded > 0) {
            LOG_DEBUG(EVENT_TAG, "Discarded %zu queued events", discarded);
        }
        m_idleCv.notify_all();
    }

    EventBus::ListenerId EventBus::subscribe(IEventListener *listener, const EventFilter filter) {
        if (!listener) {
            return 0;
        }

        std::lock_guard lock{m_subscriptionsMutex};
        if (m_subscriptions.size() >= MAX_SUBSCRIPTIONS) {
            LOG_ERROR(EVENT_TAG, "Subscription refused, limit of %zu reached", MAX_SUBSCRIPTIONS);
            return 0;
        }
        const auto id{m_nextId++};
        m_subscriptions.push_back(Subscription{id, listener, filter});
        return id;
    }

    void EventBus::unsubscribe(const ListenerId id) {
        if (id == 0) {
            return;
        }
        std::lock_guard lock{m_subscriptionsMutex};
        std::erase_if(m_subscriptions, [id](const Subscription &s) { return s.id == id; });
    }

    bool EventBus::publish(std::unique_ptr<Event> event) {
        if (!event) {
            return false;
        }
        auto &lane{event->priority >= EventPriority::E_HIGH ? m_urgent : m_normal};
        return enqueue(lane, std::move(event));
    }

    bool EventBus::publishHighPriority(std::unique_ptr<Event> event) {
        if (!event) {
            return false;
        }
        return enqueue(m_urgent, std::move(event));
    }

    bool EventBus::enqueue(Lane &lane, std::unique_ptr<Event> event) {
        {
            std::lock_guard lock{m_queueMutex};
            if (lane.events.size() >= lane.capacity) {
                LOG_WARNING(EVENT_TAG, "%s lane full, dropped %s", lane.name, toString(event->type));
                return false;
            }
            lane.events.push_back(std::move(event));
        }
        m_queueCv.notify_one();
        return true;
    }

    bool EventBus::idleLocked() const {
        return m_urgent.events.empty() && m_normal.events.empty() && !m_delivering;
    }

    bool EventBus::waitIdle(const std::uint32_t timeoutMs) {
        std::unique_lock lock{m_queueMutex};
        return m_idleCv.wait_for(lock, std::chrono::milliseconds{timeoutMs}, [this] {
            return !m_running.load() || idleLocked();
        });
    }

    void EventBus::run() {
        while (true) {
            std::unique_ptr<Event> event{};
            {
                std::unique_lock lock{m_queueMutex};
                m_queueCv.wait(lock, [this] {
                    return !m_running.load() || !m_urgent.events.empty() || !m_normal.events.empty();
                });
                if (!m_running.load()) {
                    break;
                }
                auto &lane{m_urgent.events.empty() ? m_normal : m_urgent};
                event = std::move(lane.events.front());
                lane.events.pop_front();
                m_delivering = true;
            }

            deliver(*event);
            event.reset();

            {
                std::lock_guard lock{m_queueMutex};
                m_delivering = false;
            }
            m_idleCv.notify_all();
        }
        LOG_DEBUG(EVENT_TAG, "Dispatch thread exiting");
    }

    void EventBus::deliver(const Event &event) {
        // Listeners may (un)subscribe from inside onEvent
        std::vector<Subscription> targets{};
        {
            std::lock_guard lock{m_subscriptionsMutex};
            targets = m_subscriptions;
        }
        for (const auto &sub: targets) {
            if (sub.filter.accepts(event.type)) {
                sub.listener->onEvent(event);
            }
        }
    }
}
