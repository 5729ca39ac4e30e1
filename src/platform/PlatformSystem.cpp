#include "platform/PlatformSystem.hpp"

#include "AppConfig.hpp"
#include "core/Logger.hpp"
#include "utils/FileUtils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <limits.h>
#include <pwd.h>
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace vitco::platform
{
namespace
{
constexpr auto *SYS_TAG{"PlatformSystem"};
constexpr auto *AUTOSTART_FILE_NAME{"vitco-agent.desktop"};

std::optional<std::string> envVar(const char *name)
{
    const char *value{std::getenv(name)};
    if (!value || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string{value};
}

Result<std::string> configHome()
{
    if (auto xdg{envVar("XDG_CONFIG_HOME")})
    {
        return Result<std::string>::Ok(*xdg);
    }
    if (auto home{envVar("HOME")})
    {
        return Result<std::string>::Ok(*home + "/.config");
    }
    return Result<std::string>::Error(ErrorCode::ConfigError, "neither XDG_CONFIG_HOME nor HOME is set");
}

std::string readCpuModel()
{
    std::ifstream in{"/proc/cpuinfo"};
    std::string line{};
    while (std::getline(in, line))
    {
        if (line.rfind("model name", 0) != 0)
        {
            continue;
        }
        if (const auto colon{line.find(':')}; colon != std::string::npos)
        {
            const auto start{line.find_first_not_of(' ', colon + 1)};
            return start == std::string::npos ? std::string{} : line.substr(start);
        }
    }
    return {};
}

std::string readUserName()
{
    if (auto user{envVar("USER")})
    {
        return *user;
    }
    if (const passwd *pw{getpwuid(getuid())}; pw && pw->pw_name)
    {
        return pw->pw_name;
    }
    return {};
}
} // namespace

std::string hostName()
{
    char buffer[HOST_NAME_MAX + 1]{};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0)
    {
        return {};
    }
    return buffer;
}

HostInfo collectHostInfo()
{
    HostInfo info{};
    info.hostname = hostName();

    if (utsname uts{}; uname(&uts) == 0)
    {
        info.arch = uts.machine;
    }

    info.cpuModel = readCpuModel();
    if (const long cores{sysconf(_SC_NPROCESSORS_ONLN)}; cores > 0)
    {
        info.cpuCores = static_cast<std::uint32_t>(cores);
    }

    if (struct sysinfo si{}; sysinfo(&si) == 0)
    {
        info.totalMemoryBytes = static_cast<std::uint64_t>(si.totalram) * si.mem_unit;
    }

    info.userName = readUserName();
    return info;
}

Result<std::string> resolveDataDir(const std::optional<std::string> &overrideDir)
{
    if (overrideDir && !overrideDir->empty())
    {
        return Result<std::string>::Ok(*overrideDir);
    }

    auto base{configHome()};
    if (base.failed())
    {
        return base;
    }
    return Result<std::string>::Ok(base.value + "/" + std::string{defaults::APP_NAME});
}

Result<std::string> autostartEntryPath()
{
    auto base{configHome()};
    if (base.failed())
    {
        return base;
    }
    return Result<std::string>::Ok(base.value + "/autostart/" + AUTOSTART_FILE_NAME);
}

Status setAutostart(const bool enabled, const std::string &executablePath)
{
    const auto path{autostartEntryPath()};
    if (path.failed())
    {
        return path.status;
    }

    if (!enabled)
    {
        std::error_code ec{};
        if (std::filesystem::remove(path.value, ec))
        {
            LOG_INFO(SYS_TAG, "Autostart entry removed");
        }
        if (ec)
        {
            return Status::Error(ErrorCode::StorageError, ec.message());
        }
        return Status::OK();
    }

    const auto dir{std::filesystem::path{path.value}.parent_path().string()};
    if (auto status{utils::ensureDirectory(dir)}; status.failed())
    {
        return status;
    }

    std::string entry{};
    entry += "[Desktop Entry]\n";
    entry += "Type=Application\n";
    entry += "Name=" + std::string{defaults::APP_NAME} + "\n";
    entry += "Comment=Automatic attendance check-in and check-out\n";
    entry += "Exec=" + executablePath + "\n";
    entry += "Terminal=false\n";
    entry += "X-GNOME-Autostart-enabled=true\n";

    if (auto status{utils::writeTextFileAtomic(path.value, entry)}; status.failed())
    {
        return status;
    }
    LOG_DEBUG(SYS_TAG, "Autostart entry written to %s", path.value.c_str());
    return Status::OK();
}

std::string currentExecutablePath()
{
    std::error_code ec{};
    const auto exe{std::filesystem::read_symlink("/proc/self/exe", ec)};
    if (ec)
    {
        return {};
    }
    return exe.string();
}
} // namespace vitco::platform
