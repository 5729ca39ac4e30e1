#include <doctest/doctest.h>

#include <algorithm>
#include <memory>

#include "Fakes.hpp"
#include "core/EventBus.hpp"
#include "modules/AttendanceModule.hpp"
#include "services/AuditLogService.hpp"
#include "services/StorageService.hpp"

using namespace vitco;
using namespace vitco::test;

namespace {
    struct AttendanceFixture {
        TempDir dir{};
        FakeClock clock{};
        FakeAttendanceApi api{};
        FakeSession session{};
        FakeNetwork network{};
        FakeFingerprint fingerprint{};
        FakePrompt prompt{};
        StorageService storage{dir.str()};
        AuditLogService audit{clock, dir.str()};
        EventBus bus{EventBus::Config{}};
        AppConfig cfg{AppConfig::makeDefault()};
        std::unique_ptr<AttendanceModule> module{};

        AttendanceFixture() {
            REQUIRE(storage.begin().ok());
            REQUIRE(audit.begin().ok());
            bus.start();
        }

        ~AttendanceFixture() {
            if (module) {
                module->stop();
            }
            bus.stop();
        }

        AttendanceModule& make(const bool developmentBuild = false) {
            const AttendanceContext ctx{
                .clock = clock,
                .api = api,
                .session = session,
                .network = network,
                .fingerprint = fingerprint,
                .prompt = prompt,
                .storage = storage,
                .audit = audit,
            };
            module = std::make_unique<AttendanceModule>(bus, ctx, cfg, developmentBuild);
            return *module;
        }

        [[nodiscard]] bool auditHas(const std::string& needle) const {
            const auto lines{audit.readRecentLogs()};
            return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
                return line.find(needle) != std::string::npos;
            });
        }
    };
}

TEST_CASE_FIXTURE(AttendanceFixture, "Successful check-in updates the ledger, the session state and the audit log") {
    auto& attendance{make()};
    const auto now{clock.nowMs()};

    const auto result{attendance.attemptCheckIn(Trigger::AppStart)};

    CHECK(result.success);
    CHECK(result.attendanceId == "att-1");
    CHECK(api.checkInCount() == 1);
    REQUIRE(api.lastCheckIn.has_value());
    CHECK(api.lastCheckIn->systemFingerprint == std::optional<std::string>{"fp_0123456789abcdef"});
    CHECK(api.lastCheckIn->network == network.network);

    CHECK(storage.lastTriggerSuccess(Trigger::AppStart) == std::optional<std::uint64_t>{now});
    CHECK(storage.lastCheckInAttempt() == std::optional<std::uint64_t>{now});

    const auto session{storage.sessionState()};
    REQUIRE(session.has_value());
    CHECK(session->lastCheckInTimestamp == std::optional<std::uint64_t>{now});
    CHECK_FALSE(session->pendingCheckout);
    CHECK(session->systemFingerprint == std::optional<std::string>{"fp_0123456789abcdef"});

    CHECK(auditHas("[app_start] [success] - "));
    CHECK(auditHas("\"attendanceId\":\"att-1\""));

    const auto notes{prompt.notifications()};
    REQUIRE(notes.size() == 1);
    CHECK(notes[0].title == "Attendance Marked");
    CHECK(notes[0].body == "You have been automatically checked in (Office detected)");
}

TEST_CASE_FIXTURE(AttendanceFixture, "A repeated trigger inside the debounce window is skipped without a remote call") {
    auto& attendance{make()};
    REQUIRE(attendance.attemptCheckIn(Trigger::Login).success);
    const auto statusCallsAfterFirst{api.statusCalls};

    clock.advance(10'000);
    const auto second{attendance.attemptCheckIn(Trigger::Login)};

    CHECK_FALSE(second.success);
    CHECK(second.reason == "Skipped due to debouncing (recent successful attempt within 30 seconds)");
    CHECK(api.checkInCount() == 1);
    CHECK(api.statusCalls == statusCallsAfterFirst);
    CHECK(auditHas("[login] [skipped] - Skipped due to debouncing"));

    SUBCASE("another trigger is not debounced by it") {
        api.setStatus(AttendanceStatus::CheckedIn);
        const auto other{attendance.attemptCheckIn(Trigger::NetworkChange)};
        CHECK(other.reason == "Already checked in today");
        CHECK(api.statusCalls == statusCallsAfterFirst + 1);
    }

    SUBCASE("the window expires") {
        clock.advance(20'001);
        api.setStatus(AttendanceStatus::CheckedIn);
        const auto later{attendance.attemptCheckIn(Trigger::Login)};
        CHECK(later.reason == "Already checked in today");
        CHECK(api.statusCalls == statusCallsAfterFirst + 1);
    }
}

TEST_CASE_FIXTURE(AttendanceFixture, "A failed attempt does not block an immediate retry") {
    auto& attendance{make()};
    api.checkInResult = Result<AttendanceRecord>(Status::HttpError(400, "Too early to check in"));

    const auto failed{attendance.attemptCheckIn(Trigger::AppStart)};
    CHECK_FALSE(failed.success);
    CHECK(failed.errorCode == "TOO_EARLY");
    CHECK(failed.errorType == ErrorType::Validation);
    CHECK(failed.reason == "It is too early to check in. Please check in during your assigned shift time window.");
    CHECK_FALSE(storage.lastTriggerSuccess(Trigger::AppStart).has_value());
    CHECK(auditHas("[app_start] [failed]"));
    CHECK(auditHas("\"statusCode\":400"));

    const auto notes{prompt.notifications()};
    REQUIRE(notes.size() == 1);
    CHECK(notes[0].title == "Check-In Failed");

    api.checkInResult = Result<AttendanceRecord>(AttendanceRecord{.id = "att-2", .status = "CHECKED_IN"});
    clock.advance(1'000);
    const auto retried{attendance.attemptCheckIn(Trigger::AppStart)};
    CHECK(retried.success);
    CHECK(retried.attendanceId == "att-2");
    CHECK(api.checkInCount() == 2);
}

TEST_CASE_FIXTURE(AttendanceFixture, "Check-in without a network fails before contacting the server") {
    auto& attendance{make()};
    network.setNetwork(std::monostate{});

    const auto result{attendance.attemptCheckIn(Trigger::SystemWake)};

    CHECK_FALSE(result.success);
    CHECK(result.reason == "No network connection");
    CHECK(result.errorType == ErrorType::Network);
    CHECK(api.statusCalls == 0);
    CHECK(auditHas("[system_wake] [failed] - No network connection"));
}

TEST_CASE_FIXTURE(AttendanceFixture, "An unapproved network is reported with the server's reason") {
    auto& attendance{make()};
    api.validation = Result<NetworkValidation>(NetworkValidation{.allowed = false, .reason = "Network not in approved list"});

    const auto result{attendance.attemptCheckIn(Trigger::Login)};

    CHECK_FALSE(result.success);
    CHECK(result.reason == "Network not in approved list");
    CHECK(result.errorType == ErrorType::Network);
    CHECK(api.checkInCount() == 0);
    CHECK(auditHas("[login] [skipped] - Network not in approved list"));
}

TEST_CASE_FIXTURE(AttendanceFixture, "Disabled auto check-in and a signed-out user are both ineligible") {
    SUBCASE("disabled") {
        cfg.attendance.autoCheckInEnabled = false;
        auto& attendance{make()};
        CHECK(attendance.attemptCheckIn(Trigger::Login).reason == "Auto check-in is disabled");
    }
    SUBCASE("signed out") {
        session.authenticated = false;
        auto& attendance{make()};
        const auto result{attendance.attemptCheckIn(Trigger::Login)};
        CHECK(result.reason == "User not authenticated");
        CHECK(result.errorType == ErrorType::Authentication);
    }
    CHECK(api.checkInCount() == 0);
}

TEST_CASE_FIXTURE(AttendanceFixture, "Unreachable server is reported as a connection problem") {
    auto& attendance{make()};
    api.status = Result<AttendanceStatus>(ErrorCode::NetworkError, "connect: Connection refused");

    const auto result{attendance.attemptCheckIn(Trigger::AppStart)};

    CHECK(result.reason == "Server connection failed. Please ensure the server is running.");
    CHECK(result.errorType == ErrorType::Network);
}

TEST_CASE_FIXTURE(AttendanceFixture, "Missing fingerprint blocks check-in unless running a development build") {
    fingerprint.value = Result<std::string>(ErrorCode::OperationFailed, "no hardware identifiers");

    SUBCASE("release build") {
        auto& attendance{make()};
        const auto result{attendance.attemptCheckIn(Trigger::AppStart)};
        CHECK_FALSE(result.success);
        CHECK(result.errorCode == "DEVICE_FINGERPRINT_REQUIRED");
        CHECK(result.errorType == ErrorType::System);
        CHECK(api.checkInCount() == 0);

        const auto notes{prompt.notifications()};
        REQUIRE(notes.size() == 1);
        CHECK(notes[0].body == "Unable to mark attendance. Please try again or contact support.");
    }

    SUBCASE("development build") {
        auto& attendance{make(true)};
        const auto result{attendance.attemptCheckIn(Trigger::AppStart)};
        CHECK(result.success);
        REQUIRE(api.lastCheckIn.has_value());
        CHECK_FALSE(api.lastCheckIn->systemFingerprint.has_value());
    }
}

TEST_CASE_FIXTURE(AttendanceFixture, "Authentication failures are logged without a notification") {
    auto& attendance{make()};
    api.checkInResult = Result<AttendanceRecord>(Status::HttpError(401, "Unauthorized"));

    const auto result{attendance.attemptCheckIn(Trigger::Login)};

    CHECK(result.errorType == ErrorType::Authentication);
    CHECK(prompt.notifications().empty());
}

TEST_CASE_FIXTURE(AttendanceFixture, "Joining an approved network checks the user in once") {
    auto& attendance{make()};
    network.setNetwork(std::monostate{});
    attendance.start();
    REQUIRE(attendance.isRunning());

    SUBCASE("connect") {
        const WifiNetwork office{.ssid = "Office", .bssid = "AA:BB:CC:DD:EE:FF"};
        network.setNetwork(office);
        REQUIRE(bus.publish(Event{
            .type = EventType::NetworkChanged,
            .payload = NetworkChangedEvent{.previous = std::monostate{}, .current = office},
        }));

        REQUIRE(eventually([&] { return api.checkInCount() == 1; }));
        REQUIRE(attendance.waitIdle(2000));

        CHECK(storage.lastTriggerSuccess(Trigger::NetworkChange).has_value());
        CHECK(auditHas("[network_change] [success]"));
        REQUIRE(api.lastValidated.has_value());
        CHECK(*api.lastValidated == NetworkInfo{office});
    }

    SUBCASE("disconnect") {
        REQUIRE(bus.publish(Event{
            .type = EventType::NetworkChanged,
            .payload = NetworkChangedEvent{.previous = WifiNetwork{.ssid = "Office"}, .current = std::monostate{}},
        }));
        REQUIRE(bus.waitIdle(2000));
        REQUIRE(attendance.waitIdle(2000));
        CHECK(api.statusCalls == 0);
    }
}

TEST_CASE_FIXTURE(AttendanceFixture, "Offline check-out reports the last used network and the requested time") {
    auto& attendance{make()};
    api.setStatus(AttendanceStatus::CheckedIn);
    network.setNetwork(std::monostate{});
    const EthernetNetwork desk{.macAddress = "00:11:22:33:44:55", .adapterName = "enp3s0"};
    REQUIRE(storage.setLastNetworkUsed(desk).ok());
    const std::uint64_t endedAt{clock.nowMs() - 3'600'000};

    const auto result{attendance.attemptCheckOut(Trigger::Recovery, false, std::nullopt, endedAt)};

    CHECK(result.success);
    const auto request{api.lastCheckOutRequest()};
    REQUIRE(request.has_value());
    CHECK(request->network == NetworkInfo{desk});
    CHECK(request->checkOutTimeMs == std::optional<std::uint64_t>{endedAt});
    CHECK(auditHas("[checkout_recovery] [success]"));

    const auto notes{prompt.notifications()};
    REQUIRE(notes.size() == 1);
    CHECK(notes[0].title == "Check-out Successful");
    CHECK(notes[0].body == "You have been checked out successfully (Office Network)");
}

TEST_CASE_FIXTURE(AttendanceFixture, "Check-out with nothing to check out is quiet") {
    auto& attendance{make()};

    SUBCASE("not checked in today") {
        const auto result{attendance.attemptCheckOut(Trigger::Shutdown, true)};
        CHECK(result.reason == "Not checked in today");
        CHECK(result.errorType == ErrorType::None);
    }

    SUBCASE("server says already checked out") {
        api.setStatus(AttendanceStatus::CheckedIn);
        api.checkOutResult = Result<AttendanceRecord>(Status::HttpError(400, "User has already checked out today"));
        const auto result{attendance.attemptCheckOut(Trigger::Shutdown, true)};
        CHECK_FALSE(result.success);
        CHECK(result.errorCode == "ALREADY_CHECKED_OUT");
        CHECK(result.reason == "Already checked out or invalid status");
    }

    CHECK_FALSE(auditHas("checkout_shutdown"));
    CHECK(prompt.notifications().empty());
}

TEST_CASE_FIXTURE(AttendanceFixture, "A failed check-out is audited and notified") {
    auto& attendance{make()};
    api.setStatus(AttendanceStatus::CheckedIn);
    api.checkOutResult = Result<AttendanceRecord>(Status::HttpError(403, "Network not approved"));

    const auto result{attendance.attemptCheckOut(Trigger::Logout)};

    CHECK_FALSE(result.success);
    CHECK(result.errorCode == "NETWORK_NOT_APPROVED");
    CHECK(result.errorType == ErrorType::Network);
    CHECK(result.reason == "The network you are connected to is not approved for attendance.");
    CHECK(auditHas("[checkout_logout] [failed]"));

    const auto notes{prompt.notifications()};
    REQUIRE(notes.size() == 1);
    CHECK(notes[0].title == "Check-out Failed");
}
