#include "core/Logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace vitco::logging {
    namespace {
        constexpr std::size_t LOG_LINE_MAX{1024};

        std::atomic<LogLevel> g_level{LogLevel::Info};
        std::mutex g_writeMutex{};
        std::FILE* g_file{nullptr};

        void formatTimestamp(char* out, std::size_t size) {
            const auto now{std::chrono::system_clock::now()};
            const auto secs{std::chrono::system_clock::to_time_t(now)};
            const auto ms{std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000};

            std::tm local{};
            localtime_r(&secs, &local);

            char base[32]{};
            std::strftime(base, sizeof(base), "%Y-%m-%d %H:%M:%S", &local);
            std::snprintf(out, size, "%s.%03d", base, static_cast<int>(ms));
        }
    }

    std::optional<LogLevel> parseLevel(std::string_view name) noexcept {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info")  return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        return std::nullopt;
    }

    void setLevel(LogLevel level) noexcept {
        g_level.store(level);
    }

    LogLevel level() noexcept {
        return g_level.load();
    }

    bool attachFile(const std::string& path) {
        std::lock_guard lock{g_writeMutex};
        if (g_file) {
            std::fclose(g_file);
            g_file = nullptr;
        }

        g_file = std::fopen(path.c_str(), "a");
        return g_file != nullptr;
    }

    void detachFile() {
        std::lock_guard lock{g_writeMutex};
        if (g_file) {
            std::fclose(g_file);
            g_file = nullptr;
        }
    }

    void write(LogLevel lvl, const char* tag, const char* fmt, ...) {
        char message[LOG_LINE_MAX]{};

        va_list args;
        va_start(args, fmt);
        std::vsnprintf(message, sizeof(message), fmt, args);
        va_end(args);

        char timestamp[48]{};
        formatTimestamp(timestamp, sizeof(timestamp));

        std::lock_guard lock{g_writeMutex};
        std::fprintf(stderr, "%s [%s][%s] %s\n", timestamp, toString(lvl), tag, message);

        if (g_file) {
            std::fprintf(g_file, "%s [%s][%s] %s\n", timestamp, toString(lvl), tag, message);
            std::fflush(g_file);
        }
    }
}
