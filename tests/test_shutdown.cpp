#include <doctest/doctest.h>

#include <memory>

#include "Fakes.hpp"
#include "core/EventBus.hpp"
#include "modules/AttendanceModule.hpp"
#include "modules/ShutdownModule.hpp"
#include "services/AuditLogService.hpp"
#include "services/StorageService.hpp"

using namespace vitco;
using namespace vitco::test;

namespace {
    constexpr std::size_t CHECK_OUT = 0;
    constexpr std::size_t CONTINUE = 1;

    struct ShutdownFixture {
        TempDir dir{};
        FakeClock clock{};
        FakeAttendanceApi api{};
        FakeSession session{};
        FakeNetwork network{};
        FakeFingerprint fingerprint{};
        FakePrompt prompt{};
        FakeVeto veto{};
        FakeWakeLocks wakeLocks{};
        StorageService storage{dir.str()};
        AuditLogService audit{clock, dir.str()};
        EventBus bus{EventBus::Config{}};
        AppConfig cfg{AppConfig::makeDefault()};
        std::unique_ptr<AttendanceModule> attendance{};
        std::unique_ptr<ShutdownModule> shutdown{};

        ShutdownFixture() {
            REQUIRE(storage.begin().ok());
            REQUIRE(audit.begin().ok());
            api.setStatus(AttendanceStatus::CheckedIn);
        }

        ~ShutdownFixture() {
            if (shutdown) {
                shutdown->stop();
            }
            if (attendance) {
                attendance->stop();
            }
            bus.stop();
        }

        ShutdownModule& make() {
            attendance = std::make_unique<AttendanceModule>(bus, AttendanceContext{
                .clock = clock,
                .api = api,
                .session = session,
                .network = network,
                .fingerprint = fingerprint,
                .prompt = prompt,
                .storage = storage,
                .audit = audit,
            }, cfg);
            shutdown = std::make_unique<ShutdownModule>(bus, ShutdownContext{
                .clock = clock,
                .api = api,
                .session = session,
                .prompt = prompt,
                .storage = storage,
                .veto = veto,
                .wakeLocks = wakeLocks,
            }, *attendance, cfg);
            attendance->start();
            shutdown->start();
            return *shutdown;
        }

        void answer(const std::size_t choice) {
            prompt.answers.push_back(Result<std::size_t>(choice));
        }
    };
}

TEST_CASE_FIXTURE(ShutdownFixture, "Pending check-out is on disk before the user is asked") {
    auto& module{make()};
    const auto shutdownAt{clock.nowMs()};

    bool pendingWhileAsking{false};
    std::optional<std::uint64_t> endWhileAsking{};
    prompt.onConfirm = [&](const PromptRequest& request) {
        if (request.title != "Check Out") {
            return;
        }
        // A fresh reader sees what a power cut would leave behind
        StorageService reader{dir.str()};
        REQUIRE(reader.begin().ok());
        pendingWhileAsking = reader.isPendingCheckout();
        if (const auto state{reader.sessionState()}) {
            endWhileAsking = state->sessionEndTimestamp;
        }
    };
    answer(CONTINUE);

    module.handleShutdown(Trigger::Shutdown);

    CHECK(pendingWhileAsking);
    CHECK(endWhileAsking == std::optional<std::uint64_t>{shutdownAt});

    const auto requests{prompt.requests()};
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].message == "Are you checking out?");
    CHECK(requests[0].detail == "You are currently checked in. Would you like to check out before shutting down?");
    REQUIRE(requests[0].options.size() == 2);
    CHECK(requests[0].options[0] == "Check Out");
    CHECK(requests[0].options[1] == "Continue Anyway");
}

TEST_CASE_FIXTURE(ShutdownFixture, "Continuing without check-out keeps the pending marker") {
    auto& module{make()};
    answer(CONTINUE);

    module.handleShutdown(Trigger::Shutdown);

    CHECK(storage.isPendingCheckout());
    CHECK(api.checkOutCount() == 0);
    CHECK(module.state() == ShutdownFlowState::Resolved);
    CHECK_FALSE(module.isCheckingOut());
}

TEST_CASE_FIXTURE(ShutdownFixture, "A prompt that cannot be shown keeps the pending marker") {
    auto& module{make()};
    prompt.answers.push_back(Result<std::size_t>(ErrorCode::OperationFailed, "no dialog tool"));

    module.handleShutdown(Trigger::Shutdown);

    CHECK(storage.isPendingCheckout());
    CHECK(api.checkOutCount() == 0);
}

TEST_CASE_FIXTURE(ShutdownFixture, "Confirmed check-out clears the pending marker") {
    auto& module{make()};
    answer(CHECK_OUT);

    module.handleShutdown(Trigger::Shutdown);

    CHECK(api.checkOutCount() == 1);
    CHECK_FALSE(storage.isPendingCheckout());
    const auto state{storage.sessionState()};
    REQUIRE(state.has_value());
    CHECK(state->lastCheckOutTimestamp == std::optional<std::uint64_t>{clock.nowMs()});
    CHECK(prompt.requests().size() == 1);
}

TEST_CASE_FIXTURE(ShutdownFixture, "Check-out that the server already considers done clears the marker") {
    auto& module{make()};
    api.checkOutResult = Result<AttendanceRecord>(Status::HttpError(400, "User has already checked out today"));
    answer(CHECK_OUT);

    module.handleShutdown(Trigger::Shutdown);

    CHECK_FALSE(storage.isPendingCheckout());
    CHECK(prompt.requests().size() == 1);
}

TEST_CASE_FIXTURE(ShutdownFixture, "Failed check-out keeps the marker and warns the user") {
    auto& module{make()};
    api.checkOutResult = Result<AttendanceRecord>(Status::HttpError(500, "Internal server error"));
    answer(CHECK_OUT);

    module.handleShutdown(Trigger::Shutdown);

    CHECK(storage.isPendingCheckout());
    const auto requests{prompt.requests()};
    REQUIRE(requests.size() == 2);
    CHECK(requests[1].title == "Check-out Failed");
    CHECK(requests[1].message == "Check-out failed: Internal server error");
    CHECK(requests[1].detail == "The system will shut down anyway. You may need to manually check out later.");
    CHECK(requests[1].level == PromptLevel::Warning);
}

TEST_CASE_FIXTURE(ShutdownFixture, "Slow check-out is abandoned at the timeout and finished in the background") {
    cfg.checkout.checkoutTimeoutSec = 1;
    auto& module{make()};
    api.holdCheckOut = true;
    answer(CHECK_OUT);

    module.handleShutdown(Trigger::Shutdown);

    CHECK(storage.isPendingCheckout());
    CHECK(veto.active() == 0);
    CHECK(prompt.requests().size() == 1);

    api.releaseCheckOut();
    module.stop();

    CHECK(api.checkOutCount() == 1);
    CHECK_FALSE(storage.isPendingCheckout());
}

TEST_CASE_FIXTURE(ShutdownFixture, "Finished background check-outs are joined when the next flow starts") {
    cfg.checkout.checkoutTimeoutSec = 1;
    auto& module{make()};
    bus.start();
    api.holdCheckOut = true;
    answer(CHECK_OUT);

    module.handleShutdown(Trigger::Shutdown);
    CHECK(module.abandonedAttempts() == 1);

    api.releaseCheckOut();
    REQUIRE(eventually([&] { return !storage.isPendingCheckout(); }));
    CHECK(module.abandonedAttempts() == 1);

    api.setStatus(AttendanceStatus::CheckedOut);
    REQUIRE(bus.publish(Event{.type = EventType::ScreenLocked}));
    REQUIRE(eventually([&] { return veto.holds() == 2; }));
    REQUIRE(bus.waitIdle(2000));
    REQUIRE(module.waitIdle(5000));

    CHECK(module.abandonedAttempts() == 0);
    CHECK(api.checkOutCount() == 1);
    CHECK(prompt.requests().size() == 1);
}

TEST_CASE_FIXTURE(ShutdownFixture, "Unknown attendance status still records a pending check-out") {
    auto& module{make()};
    api.status = Result<AttendanceStatus>(ErrorCode::NetworkError, "connect: Network is unreachable");

    module.handleShutdown(Trigger::Shutdown);

    CHECK(storage.isPendingCheckout());
    CHECK(prompt.requests().empty());
}

TEST_CASE_FIXTURE(ShutdownFixture, "Nothing is asked or stored when the user is not checked in") {
    auto& module{make()};

    SUBCASE("not started") {
        api.setStatus(AttendanceStatus::NotStarted);
    }
    SUBCASE("already out") {
        api.setStatus(AttendanceStatus::CheckedOut);
    }
    SUBCASE("signed out") {
        session.authenticated = false;
    }
    SUBCASE("auto check-out disabled") {
        cfg.checkout.autoCheckoutOnShutdownEnabled = false;
        module.handleConfigUpdate(cfg);
    }

    module.handleShutdown(Trigger::Shutdown);

    CHECK(prompt.requests().empty());
    CHECK_FALSE(storage.isPendingCheckout());
    CHECK(veto.holds() == 1);
    CHECK(veto.releases() == 1);
}

TEST_CASE_FIXTURE(ShutdownFixture, "A second shutdown request during a flow is ignored") {
    auto& module{make()};
    prompt.onConfirm = [&](const PromptRequest&) {
        module.handleShutdown(Trigger::Logout);
    };
    answer(CONTINUE);

    module.handleShutdown(Trigger::Shutdown);

    CHECK(prompt.requests().size() == 1);
    CHECK(veto.holds() == 2);
    CHECK(veto.releases() == 2);
    CHECK(veto.active() == 0);
}

TEST_CASE_FIXTURE(ShutdownFixture, "Shutdown and lock events hold the quit veto until the flow ends") {
    auto& module{make()};
    bus.start();
    answer(CHECK_OUT);

    SUBCASE("shutdown") {
        REQUIRE(bus.publish(Event{.type = EventType::ShutdownRequested}));
    }
    SUBCASE("screen lock") {
        REQUIRE(bus.publish(Event{.type = EventType::ScreenLocked}));
    }

    REQUIRE(eventually([&] { return veto.holds() == 1; }));
    REQUIRE(bus.waitIdle(2000));
    REQUIRE(module.waitIdle(5000));

    CHECK(veto.releases() == 1);
    CHECK(veto.active() == 0);
    CHECK(api.checkOutCount() == 1);
    CHECK_FALSE(storage.isPendingCheckout());
}

TEST_CASE_FIXTURE(ShutdownFixture, "Sleep flow runs under a wake lock") {
    auto& module{make()};

    SUBCASE("continue sleeping") {
        answer(CONTINUE);
        module.handleSleep();

        CHECK(storage.isPendingCheckout());
        CHECK(api.checkOutCount() == 0);
        const auto requests{prompt.requests()};
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].detail == "Your system is trying to sleep. Would you like to check out before sleeping?");
        CHECK(requests[0].options[1] == "Continue");
    }

    SUBCASE("check out before sleeping") {
        answer(CHECK_OUT);
        module.handleSleep();

        CHECK(api.checkOutCount() == 1);
        CHECK_FALSE(storage.isPendingCheckout());
    }

    SUBCASE("failed check-out is recorded without a dialog") {
        api.checkOutResult = Result<AttendanceRecord>(Status::HttpError(500, "Internal server error"));
        answer(CHECK_OUT);
        module.handleSleep();

        CHECK(storage.isPendingCheckout());
        CHECK(prompt.requests().size() == 1);
    }

    CHECK(wakeLocks.acquired() == 1);
    CHECK(wakeLocks.active() == 0);
    CHECK(veto.holds() == 0);
}

TEST_CASE_FIXTURE(ShutdownFixture, "Suspend event keeps the wake lock until the sleep flow ends") {
    auto& module{make()};
    bus.start();
    answer(CONTINUE);

    REQUIRE(bus.publish(Event{.type = EventType::SystemSuspending}));
    REQUIRE(eventually([&] { return wakeLocks.acquired() == 1; }));
    REQUIRE(bus.waitIdle(2000));
    REQUIRE(module.waitIdle(5000));
    REQUIRE(eventually([&] { return wakeLocks.active() == 0; }));

    CHECK(storage.isPendingCheckout());
}

TEST_CASE_FIXTURE(ShutdownFixture, "Quitting while checked in leaves a pending check-out") {
    auto& module{make()};

    SUBCASE("checked in") {
        REQUIRE(module.finalizeOnQuit().ok());
        CHECK(storage.isPendingCheckout());
        const auto state{storage.sessionState()};
        REQUIRE(state.has_value());
        CHECK(state->sessionEndTimestamp == std::optional<std::uint64_t>{clock.nowMs()});
    }

    SUBCASE("marker already present") {
        const auto earlier{clock.nowMs() - 60'000};
        REQUIRE(storage.markSessionEnd(earlier).ok());
        REQUIRE(module.finalizeOnQuit().ok());
        CHECK(api.statusCalls == 0);
        CHECK(storage.sessionState()->sessionEndTimestamp == std::optional<std::uint64_t>{earlier});
    }

    SUBCASE("status unavailable") {
        api.status = Result<AttendanceStatus>(ErrorCode::Timeout, "request timed out");
        const auto status{module.finalizeOnQuit()};
        CHECK(status.code == ErrorCode::Timeout);
        CHECK_FALSE(storage.isPendingCheckout());
    }

    SUBCASE("checked out") {
        api.setStatus(AttendanceStatus::CheckedOut);
        REQUIRE(module.finalizeOnQuit().ok());
        CHECK_FALSE(storage.isPendingCheckout());
    }
}
