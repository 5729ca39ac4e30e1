/**
 * @file main.cpp
 * @brief vitco-agent - desktop attendance companion entry point.
 *
 * Keeps the remote attendance record in step with the user's presence:
 * check-in on login, start, wake and network change, check-out on
 * shutdown, logout and sleep, and reconciliation of a check-out that
 * the previous run could not finish. Optionally relays the main server
 * to mobile devices on the LAN.
 *
 * Signals:
 * - SIGTERM / SIGINT: shutdown (check-out flow, then exit)
 * - SIGHUP: session logout
 * - SIGUSR1: system about to sleep
 * - SIGUSR2: screen locked
 */

#include <CLI/CLI.hpp>

#include <cstdio>
#include <optional>
#include <string>

#include "App.hpp"
#include "AppConfig.hpp"
#include "core/Logger.hpp"
#include "platform/PlatformSystem.hpp"
#include "services/AuditLogService.hpp"
#include "services/StorageService.hpp"
#include "utils/TimeFormat.hpp"

namespace {
    constexpr auto* MAIN_TAG = "Main";
    constexpr std::size_t STATUS_AUDIT_LINES = 20;

    std::string formatTimestamp(const std::optional<std::uint64_t>& ms) {
        return ms ? vitco::utils::toLocalDisplay(*ms) : std::string{"-"};
    }

    /**
     * @brief Print the stored session state and the latest audit lines.
     */
    int printStatus(const std::optional<std::string>& dataDirOverride) {
        const auto dataDir = vitco::platform::resolveDataDir(dataDirOverride);
        if (dataDir.failed()) {
            std::fprintf(stderr, "Data directory unavailable: %s\n", dataDir.status.message.c_str());
            return 1;
        }

        vitco::StorageService storage{dataDir.value};
        if (const auto status = storage.begin(); status.failed()) {
            std::fprintf(stderr, "Cannot read stored state: %s\n", status.message.c_str());
            return 1;
        }

        std::printf("Data directory:   %s\n", dataDir.value.c_str());
        if (const auto session = storage.sessionState()) {
            std::printf("Last check-in:    %s\n", formatTimestamp(session->lastCheckInTimestamp).c_str());
            std::printf("Last check-out:   %s\n", formatTimestamp(session->lastCheckOutTimestamp).c_str());
            std::printf("Session ended:    %s\n", formatTimestamp(session->sessionEndTimestamp).c_str());
            std::printf("Pending checkout: %s\n", session->pendingCheckout ? "yes" : "no");
            if (session->lastNetworkInfo) {
                std::printf("Last network:     %s\n", vitco::describe(*session->lastNetworkInfo).c_str());
            }
        } else {
            std::printf("No session recorded yet\n");
        }

        vitco::SystemClock clock{};
        const vitco::AuditLogService audit{clock, dataDir.value};
        const auto lines = audit.readRecentLogs(STATUS_AUDIT_LINES);
        std::printf("\nRecent attempts (%s):\n", audit.path().c_str());
        if (lines.empty()) {
            std::printf("  none\n");
        }
        for (const auto& line : lines) {
            std::printf("  %s\n", line.c_str());
        }
        return 0;
    }
}

int main(int argc, char** argv) {
    std::string dataDirArg;
    std::string logLevelArg;
    bool developmentBuild{false};
    bool showStatus{false};
    bool showVersion{false};

    CLI::App cli{"vitco-agent - desktop attendance companion"};
    auto* dataDirOpt = cli.add_option("--data-dir", dataDirArg, "Override the data directory");
    auto* logLevelOpt = cli.add_option("--log-level", logLevelArg, "Minimum log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    cli.add_flag("--dev", developmentBuild, "Development build: allow check-in without a device fingerprint");
    cli.add_flag("--status", showStatus, "Print stored session state and recent attempts, then exit");
    cli.add_flag("--version", showVersion, "Print the version and exit");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e);
    }

    std::optional<std::string> dataDir;
    if (dataDirOpt->count() > 0) {
        dataDir = dataDirArg;
    }
    std::optional<std::string> logLevel;
    if (logLevelOpt->count() > 0) {
        logLevel = logLevelArg;
    }

    if (showVersion) {
        std::printf("%.*s %.*s\n",
                    static_cast<int>(vitco::defaults::APP_NAME.size()), vitco::defaults::APP_NAME.data(),
                    static_cast<int>(vitco::defaults::AGENT_VERSION.size()), vitco::defaults::AGENT_VERSION.data());
        return 0;
    }

    if (logLevel) {
        if (const auto level = vitco::logging::parseLevel(*logLevel)) {
            vitco::logging::setLevel(*level);
        }
    }

    if (showStatus) {
        return printStatus(dataDir);
    }

    vitco::App app{vitco::App::Options{
        .dataDir = dataDir,
        .logLevel = logLevel,
        .developmentBuild = developmentBuild,
    }};

    if (const auto status = app.begin(); status.failed()) {
        LOG_ERROR(MAIN_TAG, "Agent initialization failed: %s", status.message.c_str());
        app.shutdown();
        return 1;
    }

    app.run();
    app.shutdown();
    return 0;
}
