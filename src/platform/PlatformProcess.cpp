#include "platform/PlatformProcess.hpp"

#include "core/Logger.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vitco::platform
{
namespace
{
constexpr auto *PROC_TAG{"Process"};
constexpr int EXEC_FAILED_EXIT{127};
constexpr std::size_t READ_CHUNK{4096};

std::vector<char *> toArgv(const std::vector<std::string> &argv)
{
    std::vector<char *> out{};
    out.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
        out.push_back(const_cast<char *>(arg.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

// Runs in the forked child only: async-signal-safe calls.
[[noreturn]] void execChild(std::vector<char *> &args, const int stdoutFd)
{
    sigset_t none{};
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    const int devNull{open("/dev/null", O_RDWR)};
    if (devNull >= 0)
    {
        dup2(devNull, STDIN_FILENO);
        dup2(devNull, STDERR_FILENO);
        if (stdoutFd < 0)
        {
            dup2(devNull, STDOUT_FILENO);
        }
    }
    if (stdoutFd >= 0)
    {
        dup2(stdoutFd, STDOUT_FILENO);
    }

    execvp(args[0], args.data());
    _exit(EXEC_FAILED_EXIT);
}

int waitChild(const pid_t pid)
{
    int status{0};
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return -1;
        }
    }
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    return -1;
}
} // namespace

Result<CommandOutput> runCommand(const std::vector<std::string> &argv, const std::uint32_t timeoutMs)
{
    if (argv.empty())
    {
        return Result<CommandOutput>::Error(ErrorCode::InvalidArgument, "empty command");
    }

    int fds[2]{-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0)
    {
        return Result<CommandOutput>::Error(ErrorCode::OperationFailed, std::strerror(errno));
    }

    auto args{toArgv(argv)};
    const pid_t pid{fork()};
    if (pid < 0)
    {
        const auto err{errno};
        close(fds[0]);
        close(fds[1]);
        return Result<CommandOutput>::Error(ErrorCode::OperationFailed, std::strerror(err));
    }
    if (pid == 0)
    {
        execChild(args, fds[1]);
    }
    close(fds[1]);

    const auto deadline{std::chrono::steady_clock::now() + std::chrono::milliseconds{timeoutMs}};
    CommandOutput result{};
    bool timedOut{false};
    char buffer[READ_CHUNK];

    while (true)
    {
        const auto remaining{std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count()};
        if (remaining <= 0)
        {
            timedOut = true;
            break;
        }

        pollfd pfd{.fd = fds[0], .events = POLLIN, .revents = 0};
        const int ready{poll(&pfd, 1, static_cast<int>(remaining))};
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }
        if (ready == 0)
        {
            continue;
        }

        const auto n{read(fds[0], buffer, sizeof(buffer))};
        if (n > 0)
        {
            result.out.append(buffer, static_cast<std::size_t>(n));
        }
        else if (n == 0 || errno != EINTR)
        {
            break;
        }
    }
    close(fds[0]);

    if (timedOut)
    {
        kill(pid, SIGKILL);
        (void)waitChild(pid);
        LOG_WARNING(PROC_TAG, "'%s' killed after %u ms", argv[0].c_str(), timeoutMs);
        return Result<CommandOutput>::Error(ErrorCode::Timeout, argv[0] + " timed out");
    }

    result.exitCode = waitChild(pid);
    if (result.exitCode == EXEC_FAILED_EXIT)
    {
        LOG_DEBUG(PROC_TAG, "'%s' could not be executed", argv[0].c_str());
        return Result<CommandOutput>::Error(ErrorCode::NotFound, argv[0] + " not available");
    }

    LOG_TRACE(PROC_TAG, "'%s' exited with %d (%zu bytes)", argv[0].c_str(), result.exitCode, result.out.size());
    return Result<CommandOutput>::Ok(std::move(result));
}

Result<pid_t> spawnProcess(const std::vector<std::string> &argv)
{
    if (argv.empty())
    {
        return Result<pid_t>::Error(ErrorCode::InvalidArgument, "empty command");
    }

    auto args{toArgv(argv)};
    const pid_t pid{fork()};
    if (pid < 0)
    {
        return Result<pid_t>::Error(ErrorCode::OperationFailed, std::strerror(errno));
    }
    if (pid == 0)
    {
        execChild(args, -1);
    }

    LOG_DEBUG(PROC_TAG, "Spawned '%s' (pid=%d)", argv[0].c_str(), static_cast<int>(pid));
    return Result<pid_t>::Ok(pid);
}

void terminateProcess(const pid_t pid)
{
    if (pid <= 0)
    {
        return;
    }
    if (kill(pid, SIGTERM) != 0 && errno != ESRCH)
    {
        LOG_WARNING(PROC_TAG, "kill(%d) failed: %s", static_cast<int>(pid), std::strerror(errno));
    }
    (void)waitChild(pid);
}

bool isProcessAlive(const pid_t pid)
{
    if (pid <= 0)
    {
        return false;
    }
    int status{0};
    const pid_t res{waitpid(pid, &status, WNOHANG)};
    return res == 0;
}
} // namespace vitco::platform
