#include <doctest/doctest.h>

#include <algorithm>
#include <csignal>

#include "core/Logger.hpp"
#include "core/Types.hpp"
#include "services/FingerprintService.hpp"
#include "services/PowerService.hpp"
#include "services/UserFeedbackService.hpp"
#include "utils/TimeFormat.hpp"

using namespace vitco;

TEST_CASE("Timestamps render as UTC ISO 8601") {
    CHECK(utils::toIso8601(0) == "1970-01-01T00:00:00.000Z");
    CHECK(utils::toIso8601(1'700'000'000'123ULL) == "2023-11-14T22:13:20.123Z");
}

TEST_CASE("ISO 8601 parsing handles fractions and offsets") {
    CHECK(utils::parseIso8601("2023-11-14T22:13:20.123Z") == std::optional<std::uint64_t>{1'700'000'000'123ULL});
    CHECK(utils::parseIso8601("2023-11-14T22:13:20Z") == std::optional<std::uint64_t>{1'700'000'000'000ULL});
    CHECK(utils::parseIso8601("2023-11-14T22:13:20.5Z") == std::optional<std::uint64_t>{1'700'000'000'500ULL});
    CHECK(utils::parseIso8601("2023-11-15T00:13:20+02:00") == std::optional<std::uint64_t>{1'700'000'000'000ULL});
    CHECK(utils::parseIso8601("2023-11-14T17:13:20-05:00") == std::optional<std::uint64_t>{1'700'000'000'000ULL});
    CHECK(utils::parseIso8601("2024-02-29T00:00:00Z") == std::optional<std::uint64_t>{1'709'164'800'000ULL});

    CHECK_FALSE(utils::parseIso8601("").has_value());
    CHECK_FALSE(utils::parseIso8601("yesterday").has_value());
    CHECK_FALSE(utils::parseIso8601("2023-13-14T22:13:20Z").has_value());
    CHECK_FALSE(utils::parseIso8601("2023-11-14T22:13:20Zjunk").has_value());
    CHECK_FALSE(utils::parseIso8601("2023-11-14T22:13:20+0200").has_value());
}

TEST_CASE("Local display has minute precision") {
    const auto text{utils::toLocalDisplay(1'700'000'000'000ULL)};
    CHECK(text.size() == 16);
    CHECK(text.substr(0, 4) == "2023");
    CHECK(text[10] == ' ');
}

TEST_CASE("Fingerprints hash the joined components") {
    const auto empty{FingerprintService::fromComponents({})};
    REQUIRE(empty.ok());
    CHECK(empty.value == "fp_e3b0c44298fc1c14");

    const auto abc{FingerprintService::fromComponents({"abc"})};
    REQUIRE(abc.ok());
    CHECK(abc.value == "fp_ba7816bf8f01cfea");

    const auto split{FingerprintService::fromComponents({"a", "bc"})};
    REQUIRE(split.ok());
    CHECK(split.value != abc.value);
    CHECK(split.value.size() == 19);
}

// ==================== Dialogs ====================

TEST_CASE("Two-option prompts become zenity questions") {
    const PromptRequest request{
        .title = "Check Out",
        .message = "Are you checking out?",
        .detail = "Sessions <8h> & overtime",
        .options = {"Check Out", "Continue Anyway"},
        .level = PromptLevel::Warning,
    };

    const auto argv{UserFeedbackService::dialogCommand(request)};

    REQUIRE(argv.size() == 7);
    CHECK(argv[0] == "zenity");
    CHECK(argv[1] == "--question");
    CHECK(argv[2] == "--title=Check Out");
    CHECK(argv[3] == "--text=<b>Are you checking out?</b>\n\nSessions &lt;8h&gt; &amp; overtime");
    CHECK(argv[4] == "--icon-name=dialog-warning");
    CHECK(argv[5] == "--ok-label=Check Out");
    CHECK(argv[6] == "--cancel-label=Continue Anyway");
}

TEST_CASE("Single-option prompts become message boxes") {
    const PromptRequest request{
        .title = "Check-out Failed",
        .message = "Check-out failed: timeout",
        .options = {"OK"},
        .level = PromptLevel::Error,
    };

    const auto argv{UserFeedbackService::dialogCommand(request)};

    REQUIRE(argv.size() == 5);
    CHECK(argv[1] == "--error");
    CHECK(argv[4] == "--ok-label=OK");

    CHECK(UserFeedbackService::interpretDialogResult(request, 1, "").value == 0);
}

TEST_CASE("Dialog exit codes map to option indexes") {
    const PromptRequest request{
        .title = "Previous Session Check-out",
        .options = {"Check Out", "Skip", "Later"},
    };

    const auto argv{UserFeedbackService::dialogCommand(request)};
    CHECK(std::find(argv.begin(), argv.end(), "--extra-button=Later") != argv.end());

    CHECK(UserFeedbackService::interpretDialogResult(request, 0, "").value == 0);
    CHECK(UserFeedbackService::interpretDialogResult(request, 1, "").value == 1);
    CHECK(UserFeedbackService::interpretDialogResult(request, 1, "Later\n").value == 2);
    CHECK(UserFeedbackService::interpretDialogResult(request, 5, "").status.code == ErrorCode::Cancelled);
    CHECK(UserFeedbackService::interpretDialogResult(request, -1, "").status.code == ErrorCode::Cancelled);
}

// ==================== Types ====================

TEST_CASE("Wire names round through the parsers") {
    CHECK(parseAttendanceStatus("CHECKED_IN") == std::optional<AttendanceStatus>{AttendanceStatus::CheckedIn});
    CHECK(parseAttendanceStatus("NOT_STARTED") == std::optional<AttendanceStatus>{AttendanceStatus::NotStarted});
    CHECK_FALSE(parseAttendanceStatus("checked_in").has_value());

    CHECK(parseTrigger("network_change") == std::optional<Trigger>{Trigger::NetworkChange});
    CHECK(parseTrigger("system_wake") == std::optional<Trigger>{Trigger::SystemWake});
    CHECK_FALSE(parseTrigger("reboot").has_value());

    CHECK(std::string{toString(ErrorType::Authentication)} == "authentication");
}

TEST_CASE("Networks describe themselves for logs") {
    CHECK(describe(WifiNetwork{.ssid = "Office"}) == "wifi:Office");
    CHECK(describe(EthernetNetwork{.macAddress = "00:11:22:33:44:55"}) == "ethernet:00:11:22:33:44:55");
    CHECK(describe(std::monostate{}) == "none");
}

TEST_CASE("Log level names") {
    CHECK(logging::parseLevel("debug") == std::optional<LogLevel>{LogLevel::Debug});
    CHECK(logging::parseLevel("warning") == std::optional<LogLevel>{LogLevel::Warn});
    CHECK_FALSE(logging::parseLevel("loud").has_value());
}

TEST_CASE("OS signals map to power events") {
    CHECK(PowerService::eventForSignal(SIGTERM) == std::optional<EventType>{EventType::ShutdownRequested});
    CHECK(PowerService::eventForSignal(SIGINT) == std::optional<EventType>{EventType::ShutdownRequested});
    CHECK(PowerService::eventForSignal(SIGHUP) == std::optional<EventType>{EventType::LogoutRequested});
    CHECK(PowerService::eventForSignal(SIGUSR1) == std::optional<EventType>{EventType::SystemSuspending});
    CHECK(PowerService::eventForSignal(SIGUSR2) == std::optional<EventType>{EventType::ScreenLocked});
    CHECK_FALSE(PowerService::eventForSignal(SIGPIPE).has_value());
}
