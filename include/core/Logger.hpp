#ifndef VITCO_CORE_LOGGER_HPP
#define VITCO_CORE_LOGGER_HPP

/**
 * @file Logger.hpp
 * @brief Logging utilities for the vitco agent.
 *
 * Provides compile-time log level selection, a runtime level filter and
 * printf-style logging macros. Lines go to stderr and, once a log file is
 * attached, are appended to that file as well.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#ifndef VITCO_LOG_LEVEL
#define VITCO_LOG_LEVEL 0  // Trace
#endif

namespace vitco {

    /**
     * @brief Log severity levels.
     */
    enum class LogLevel : std::uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error,

        Count  // Sentinel for iteration
    };

    /**
     * @brief Convert log level to single-character string.
     * @param lvl Log level to convert
     * @return Single character string representation
     */
    [[nodiscard]] inline constexpr const char* toString(LogLevel lvl) noexcept {
        switch (lvl) {
            case LogLevel::Trace: return "T";
            case LogLevel::Debug: return "D";
            case LogLevel::Info:  return "I";
            case LogLevel::Warn:  return "W";
            case LogLevel::Error: return "E";
            default:              return "?";
        }
    }

    namespace logging {
        /**
         * @brief Parse a level name (`trace`, `debug`, `info`, `warn`, `error`).
         */
        [[nodiscard]] std::optional<LogLevel> parseLevel(std::string_view name) noexcept;

        void setLevel(LogLevel level) noexcept;
        [[nodiscard]] LogLevel level() noexcept;

        [[nodiscard]] inline bool enabled(LogLevel lvl) noexcept {
            return static_cast<int>(lvl) >= VITCO_LOG_LEVEL && lvl >= level();
        }

        /**
         * @brief Mirror every log line into the given file (append mode).
         * @return false if the file could not be opened
         */
        bool attachFile(const std::string& path);
        void detachFile();

        void write(LogLevel lvl, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    }

}

/**
 * @brief Core logging macro - filters by level and writes one line.
 *
 * @note Uses do-while(0) idiom for safe macro expansion.
 */
#define LOG_PRINT(level, tag, fmt, ...) \
    do { \
        if (vitco::logging::enabled(level)) { \
            vitco::logging::write(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

// Convenience logging macros with level prefix
#define LOG_TRACE(tag, fmt, ...)   LOG_PRINT(vitco::LogLevel::Trace, tag, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(tag, fmt, ...)   LOG_PRINT(vitco::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)    LOG_PRINT(vitco::LogLevel::Info,  tag, fmt, ##__VA_ARGS__)
#define LOG_WARNING(tag, fmt, ...) LOG_PRINT(vitco::LogLevel::Warn,  tag, fmt, ##__VA_ARGS__)
#define LOG_ERROR(tag, fmt, ...)   LOG_PRINT(vitco::LogLevel::Error, tag, fmt, ##__VA_ARGS__)

#endif  // VITCO_CORE_LOGGER_HPP
