#ifndef VITCO_CORE_EVENTBUS_HPP
#define VITCO_CORE_EVENTBUS_HPP

/**
 * @file EventBus.hpp
 * @brief Single-threaded dispatcher between the OS watchers and the flows.
 *
 * Signal handlers, the network poller and the session watcher only enqueue.
 * Every listener runs on the one bus thread, in publish order, except that
 * urgent events (shutdown, suspend) jump ahead through a second lane.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "core/Events.hpp"

namespace vitco {

    class IEventListener {
    public:
        virtual ~IEventListener() = default;
        virtual void onEvent(const Event& event) = 0;
    };

    /**
     * @brief Set of event types a listener wants, one bit per EventType.
     */
    struct EventFilter {
        std::uint64_t eventTypeMask{~0ULL};

        [[nodiscard]] static constexpr std::uint64_t bit(EventType type) noexcept {
            return 1ULL << static_cast<std::uint8_t>(type);
        }

        [[nodiscard]] constexpr bool accepts(EventType type) const noexcept {
            return (eventTypeMask & bit(type)) != 0;
        }

        [[nodiscard]] static constexpr EventFilter all() noexcept { return EventFilter{~0ULL}; }
        [[nodiscard]] static constexpr EventFilter none() noexcept { return EventFilter{0}; }
        [[nodiscard]] static constexpr EventFilter only(EventType type) noexcept { return EventFilter{bit(type)}; }

        constexpr EventFilter& include(EventType type) noexcept {
            eventTypeMask |= bit(type);
            return *this;
        }

        constexpr EventFilter& exclude(EventType type) noexcept {
            eventTypeMask &= ~bit(type);
            return *this;
        }
    };

    class EventBus {
    public:
        using ListenerId = std::uint32_t;

        struct Config {
            std::uint32_t queueLength{64};
            std::uint32_t highPriorityQueueLength{16};
        };

        explicit EventBus(const Config& cfg);
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;
        EventBus(EventBus&&) = delete;
        EventBus& operator=(EventBus&&) = delete;
        ~EventBus();

        void start();

        /**
         * @brief Join the bus thread. Whatever is still queued is discarded.
         */
        void stop();

        /**
         * @return id for `unsubscribe()`, 0 if the listener was refused
         */
        [[nodiscard]] ListenerId subscribe(IEventListener* listener, EventFilter filter = EventFilter::all());

        void unsubscribe(ListenerId id);

        /**
         * @brief Enqueue without blocking. Priority E_HIGH and above takes
         *        the urgent lane.
         * @return false if the lane was full (the event is dropped)
         */
        [[nodiscard]] bool publish(std::unique_ptr<Event> event);

        [[nodiscard]] bool publish(const Event& event) {
            return publish(std::make_unique<Event>(event));
        }

        /**
         * @brief Enqueue on the urgent lane regardless of `event->priority`.
         */
        [[nodiscard]] bool publishHighPriority(std::unique_ptr<Event> event);

        /**
         * @brief Wait until both lanes are empty and no listener is running.
         *        Returns true straight away on a stopped bus.
         */
        bool waitIdle(std::uint32_t timeoutMs);

        [[nodiscard]] bool isRunning() const noexcept { return m_running.load(); }

    private:
        struct Lane {
            const char* name;
            std::uint32_t capacity;
            std::deque<std::unique_ptr<Event>> events{};
        };

        struct Subscription {
            ListenerId id{0};
            IEventListener* listener{nullptr};
            EventFilter filter{};
        };

        bool enqueue(Lane& lane, std::unique_ptr<Event> event);

        void run();

        void deliver(const Event& event);

        [[nodiscard]] bool idleLocked() const;

        std::vector<Subscription> m_subscriptions{};
        std::mutex m_subscriptionsMutex{};
        ListenerId m_nextId{1};

        Lane m_urgent;
        Lane m_normal;
        std::mutex m_queueMutex{};
        std::condition_variable m_queueCv{};
        std::condition_variable m_idleCv{};
        bool m_delivering{false};

        std::thread m_thread{};
        std::atomic<bool> m_running{false};
    };

}  // namespace vitco

#endif  // VITCO_CORE_EVENTBUS_HPP
