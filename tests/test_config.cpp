#include <doctest/doctest.h>

#include <ArduinoJson.h>

#include <atomic>
#include <filesystem>
#include <fstream>

#include "Fakes.hpp"
#include "core/EventBus.hpp"
#include "services/ConfigService.hpp"
#include "utils/FileUtils.hpp"

using namespace vitco;
using namespace vitco::test;

namespace {
    class ConfigWatcher final : public IEventListener {
    public:
        void onEvent(const Event& event) override {
            if (const auto* payload = std::get_if<ConfigUpdatedEvent>(&event.payload); payload && payload->config) {
                lastTimeoutSec.store(payload->config->checkout.checkoutTimeoutSec);
            }
            updates.fetch_add(1);
        }

        std::atomic<int> updates{0};
        std::atomic<std::uint32_t> lastTimeoutSec{0};
    };

    struct ConfigFixture {
        TempDir dir{};
        EventBus bus{EventBus::Config{}};
        ConfigWatcher watcher{};
        ConfigService config{bus, dir.str()};

        ConfigFixture() {
            REQUIRE(bus.subscribe(&watcher, EventFilter::only(EventType::ConfigUpdated)) != 0);
            bus.start();
        }

        ~ConfigFixture() {
            bus.stop();
        }

        [[nodiscard]] JsonDocument onDisk() const {
            const auto file{utils::readTextFile(config.path())};
            REQUIRE(file.ok());
            JsonDocument doc;
            REQUIRE(deserializeJson(doc, file.value) == DeserializationError::Ok);
            return doc;
        }
    };
}

TEST_CASE_FIXTURE(ConfigFixture, "First start writes the defaults") {
    REQUIRE(config.begin().ok());
    REQUIRE(bus.waitIdle(2000));

    CHECK(std::filesystem::exists(config.path()));
    CHECK(config.get().attendance.autoCheckInEnabled);
    CHECK(config.get().checkout.checkoutTimeoutSec == 30);
    CHECK(config.get().api.baseUrl == "http://127.0.0.1:3001/api/v1");
    CHECK_FALSE(config.get().proxy.autoStartEnabled);

    const auto doc{onDisk()};
    CHECK(doc["checkout"]["checkoutTimeout"].as<int>() == 30);
    CHECK(doc["proxy"]["port"].as<int>() == 3002);
    CHECK(watcher.updates.load() == 1);
}

TEST_CASE_FIXTURE(ConfigFixture, "Stored values overlay the defaults") {
    {
        std::ofstream out{config.path()};
        out << R"({"attendance":{"autoCheckInEnabled":false},"checkout":{"checkoutTimeout":45}})";
    }

    REQUIRE(config.begin().ok());

    CHECK_FALSE(config.get().attendance.autoCheckInEnabled);
    CHECK(config.get().checkout.checkoutTimeoutSec == 45);
    CHECK(config.get().attendance.debounceMs == 30000);
}

TEST_CASE_FIXTURE(ConfigFixture, "Unusable stored config falls back to defaults") {
    SUBCASE("not json") {
        std::ofstream out{config.path()};
        out << "{ broken";
    }
    SUBCASE("invalid values") {
        std::ofstream out{config.path()};
        out << R"({"checkout":{"checkoutTimeout":0}})";
    }

    REQUIRE(config.begin().ok());
    CHECK(config.get().checkout.checkoutTimeoutSec == 30);
}

TEST_CASE_FIXTURE(ConfigFixture, "Updates are validated, saved and announced") {
    REQUIRE(config.begin().ok());
    REQUIRE(bus.waitIdle(2000));

    SUBCASE("accepted") {
        REQUIRE(config.updateFromJson(R"({"checkout":{"checkoutTimeout":10},"proxy":{"autoStartEnabled":true}})").ok());
        REQUIRE(bus.waitIdle(2000));

        CHECK(config.get().checkout.checkoutTimeoutSec == 10);
        CHECK(config.get().proxy.autoStartEnabled);
        CHECK(onDisk()["checkout"]["checkoutTimeout"].as<int>() == 10);
        CHECK(watcher.updates.load() == 2);
        CHECK(watcher.lastTimeoutSec.load() == 10);
    }

    SUBCASE("failing validation") {
        const auto status{config.updateFromJson(R"({"proxy":{"backoffMinMs":5000,"backoffMaxMs":1000}})")};
        CHECK(status.code == ErrorCode::ConfigError);
        CHECK(status.message == "Config validation failed");
        CHECK(config.get().proxy.backoffMinMs == 1000);
    }

    SUBCASE("not an object") {
        CHECK(config.updateFromJson("[1,2,3]").code == ErrorCode::InvalidArgument);
    }

    SUBCASE("not json") {
        CHECK(config.updateFromJson("{").code == ErrorCode::JsonError);
    }
}
