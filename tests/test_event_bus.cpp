#include <doctest/doctest.h>

#include <memory>
#include <mutex>
#include <vector>

#include "core/EventBus.hpp"

using namespace vitco;

namespace {
    class Recorder final : public IEventListener {
    public:
        void onEvent(const Event& event) override {
            std::lock_guard lock{m_mutex};
            m_types.push_back(event.type);
        }

        [[nodiscard]] std::vector<EventType> types() const {
            std::lock_guard lock{m_mutex};
            return m_types;
        }

    private:
        mutable std::mutex m_mutex{};
        std::vector<EventType> m_types{};
    };
}

TEST_CASE("Filters decide which events a listener sees") {
    EventBus bus{EventBus::Config{}};
    Recorder network{};
    Recorder power{};
    Recorder everything{};

    REQUIRE(bus.subscribe(&network, EventFilter::only(EventType::NetworkChanged)) != 0);
    REQUIRE(bus.subscribe(&power, EventFilter::none().include(EventType::ShutdownRequested).include(EventType::SystemSuspending)) != 0);
    REQUIRE(bus.subscribe(&everything, EventFilter::all().exclude(EventType::ConfigUpdated)) != 0);
    bus.start();

    CHECK(bus.publish(Event{.type = EventType::NetworkChanged}));
    CHECK(bus.publish(Event{.type = EventType::ShutdownRequested}));
    CHECK(bus.publish(Event{.type = EventType::ConfigUpdated}));
    CHECK(bus.publish(Event{.type = EventType::SystemSuspending}));
    REQUIRE(bus.waitIdle(2000));

    CHECK(network.types() == std::vector{EventType::NetworkChanged});
    CHECK(power.types() == std::vector{EventType::ShutdownRequested, EventType::SystemSuspending});
    CHECK(everything.types() == std::vector{EventType::NetworkChanged, EventType::ShutdownRequested, EventType::SystemSuspending});

    bus.stop();
}

TEST_CASE("High priority events overtake queued ones") {
    EventBus bus{EventBus::Config{}};
    Recorder recorder{};
    REQUIRE(bus.subscribe(&recorder) != 0);

    CHECK(bus.publish(Event{.type = EventType::NetworkChanged}));
    CHECK(bus.publish(Event{.type = EventType::UserLoggedIn}));
    CHECK(bus.publish(Event{.type = EventType::ShutdownRequested, .priority = EventPriority::E_CRITICAL}));

    bus.start();
    REQUIRE(bus.waitIdle(2000));

    CHECK(recorder.types() == std::vector{EventType::ShutdownRequested, EventType::NetworkChanged, EventType::UserLoggedIn});
    bus.stop();
}

TEST_CASE("A full queue drops new events") {
    EventBus bus{EventBus::Config{.queueLength = 64, .highPriorityQueueLength = 2}};

    for (int i = 0; i < 64; ++i) {
        REQUIRE(bus.publish(Event{.type = EventType::NetworkChanged}));
    }
    CHECK_FALSE(bus.publish(Event{.type = EventType::NetworkChanged}));

    CHECK(bus.publish(Event{.type = EventType::ShutdownRequested, .priority = EventPriority::E_HIGH}));
    CHECK(bus.publish(Event{.type = EventType::ShutdownRequested, .priority = EventPriority::E_HIGH}));
    CHECK_FALSE(bus.publishHighPriority(std::make_unique<Event>(Event{.type = EventType::ShutdownRequested})));
    CHECK_FALSE(bus.publish(std::unique_ptr<Event>{}));
}

TEST_CASE("Unsubscribed listeners receive nothing") {
    EventBus bus{EventBus::Config{}};
    Recorder recorder{};
    const auto id{bus.subscribe(&recorder)};
    REQUIRE(id != 0);
    CHECK(bus.subscribe(nullptr) == 0);
    bus.start();

    bus.unsubscribe(id);
    CHECK(bus.publish(Event{.type = EventType::AppStarted}));
    REQUIRE(bus.waitIdle(2000));

    CHECK(recorder.types().empty());
    bus.stop();
}

TEST_CASE("Waiting for idle returns once stopped") {
    EventBus bus{EventBus::Config{}};
    CHECK(bus.publish(Event{.type = EventType::AppStarted}));

    CHECK_FALSE(bus.isRunning());
    CHECK(bus.waitIdle(10));
}
