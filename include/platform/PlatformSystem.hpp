#ifndef VITCO_PLATFORM_SYSTEM_HPP
#define VITCO_PLATFORM_SYSTEM_HPP

/**
 * @file PlatformSystem.hpp
 * @brief Host identity and desktop integration helpers for Linux
 */

#include <cstdint>
#include <optional>
#include <string>

#include "core/Result.hpp"

namespace vitco::platform
{
/**
 * @brief Static facts about the host used for the device fingerprint
 */
struct HostInfo
{
    std::string hostname{};
    std::string platform{"linux"};
    std::string arch{};
    std::string cpuModel{};
    std::uint32_t cpuCores{0};
    std::uint64_t totalMemoryBytes{0};
    std::string userName{};
};

[[nodiscard]] HostInfo collectHostInfo();

/**
 * @brief gethostname(), empty on failure
 */
[[nodiscard]] std::string hostName();

/**
 * @brief Data directory: override, else $XDG_CONFIG_HOME/<app>, else $HOME/.config/<app>
 */
[[nodiscard]] Result<std::string> resolveDataDir(const std::optional<std::string> &overrideDir);

/**
 * @brief Path of the XDG autostart entry for the agent
 */
[[nodiscard]] Result<std::string> autostartEntryPath();

/**
 * @brief Create or remove the XDG autostart entry
 *
 * @param enabled Write the entry when true, delete it otherwise
 * @param executablePath Absolute path written to `Exec=`
 */
[[nodiscard]] Status setAutostart(bool enabled, const std::string &executablePath);

/**
 * @brief Absolute path of the running executable (/proc/self/exe)
 */
[[nodiscard]] std::string currentExecutablePath();
} // namespace vitco::platform

#endif // VITCO_PLATFORM_SYSTEM_HPP
