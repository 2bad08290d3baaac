//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "setup_logging.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cassert>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <initializer_list>
#include <iostream>
#include <signal.h>  // NOLINT
#include <sstream>
#include <string>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace
{

const auto* const s_init_complete = "init_complete";

constexpr const char* DaemonName = "zfsxd";

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

extern "C" void signalHandler(const int sig)
{
    if ((sig == SIGTERM) || (sig == SIGINT))
    {
        g_running = 0;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);

    // A write to a socket of a gone HTTP client must fail with `EPIPE` instead of killing the daemon.
    struct sigaction sigignore
    {};
    sigignore.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &sigignore, nullptr);
}

void exitWithFailure(const int report_fd, const char* const msg)
{
    const char* const err_txt = std::strerror(errno);
    writeString(report_fd, msg);
    writeString(report_fd, err_txt);
    ::exit(EXIT_FAILURE);
}

void exitWithStdError(const char* const msg)
{
    const char* const err_txt = std::strerror(errno);
    std::cerr << msg << err_txt << "\n";
    ::exit(EXIT_FAILURE);
}

/// Start-up report channel between the daemon and the process which has launched it.
///
/// The daemon writes either `s_init_complete`, or a description of its start-up failure.
///
struct StartupPipe
{
    int read_fd{-1};
    int write_fd{-1};
};

/// Drops everything inherited from the launching process (descriptors, signal mask and dispositions),
/// and opens the start-up pipe.
///
StartupPipe prepareForDetach()
{
    rlimit rlimit_files{};
    if (::getrlimit(RLIMIT_NOFILE, &rlimit_files) != 0)
    {
        exitWithStdError("Failed to getrlimit(RLIMIT_NOFILE): ");
    }
    for (int fd = STDERR_FILENO + 1; static_cast<rlim_t>(fd) <= rlimit_files.rlim_cur; ++fd)
    {
        (void) ::close(fd);
    }

    sigset_t all_signals{};
    ::sigemptyset(&all_signals);
    ::sigprocmask(SIG_SETMASK, &all_signals, nullptr);
    setupSignalHandlers();

    std::array<int, 2> fds{-1, -1};
    if (::pipe(fds.data()) == -1)
    {
        exitWithStdError("Failed to create pipe: ");
    }
    return StartupPipe{fds[0], fds[1]};
}

/// Becomes a session leader, and then forks once more so that the daemon never reacquires a terminal.
///
void detachFromTerminal(int& report_fd)
{
    assert(report_fd != -1);

    if (::setsid() < 0)
    {
        exitWithFailure(report_fd, "Failed to setsid: ");
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        exitWithFailure(report_fd, "Failed to fork the daemon: ");
    }
    if (pid > 0)
    {
        ::close(report_fd);
        report_fd = -1;
        ::exit(EXIT_SUCCESS);
    }
}

void setupDaemonEnvironment(const int report_fd)
{
    const int null_fd = ::open("/dev/null", O_RDWR);  // NOLINT *-vararg
    if (null_fd == -1)
    {
        exitWithFailure(report_fd, "Failed to open(/dev/null): ");
    }
    for (const int std_fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO})
    {
        ::dup2(null_fd, std_fd);
    }
    if (null_fd > STDERR_FILENO)
    {
        ::close(null_fd);
    }

    ::umask(0);
    if (::chdir("/") != 0)
    {
        exitWithFailure(report_fd, "Failed to chdir(/): ");
    }
}

/// Writes the daemon PID to `/var/run/zfsxd.pid`, and keeps the file locked while the daemon runs.
///
void lockPidFile(const int report_fd)
{
    const std::string pid_file_path = std::string{"/var/run/"} + DaemonName + ".pid";

    const int pid_fd = ::open(pid_file_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);  // NOLINT *-vararg
    if (pid_fd == -1)
    {
        exitWithFailure(report_fd, "Failed to open PID file: ");
    }
    if (::lockf(pid_fd, F_TLOCK, 0) == -1)
    {
        exitWithFailure(report_fd, "Another zfsxd instance holds the PID file lock: ");
    }
    if (::ftruncate(pid_fd, 0) != 0)
    {
        exitWithFailure(report_fd, "Failed to truncate PID file: ");
    }

    const auto pid_line = std::to_string(::getpid()) + "\n";
    if (::write(pid_fd, pid_line.data(), pid_line.size()) != static_cast<ssize_t>(pid_line.size()))
    {
        exitWithFailure(report_fd, "Failed to write PID file: ");
    }
}

void reportStartupComplete(int& report_fd)
{
    assert(report_fd != -1);

    writeString(report_fd, s_init_complete);
    ::close(report_fd);
    report_fd = -1;
}

/// Waits (in the launching process) for the daemon start-up report, and exits accordingly.
///
void exitWithStartupReport(const int read_fd)
{
    std::string           report;
    std::array<char, 256> chunk{};  // NOLINT(*-magic-numbers)
    while (true)
    {
        const auto res = ::read(read_fd, chunk.data(), chunk.size());
        if (res == 0)
        {
            break;
        }
        if (res < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            exitWithStdError("Failed to read start-up report of the daemon: ");
        }
        report.append(chunk.data(), static_cast<std::size_t>(res));
    }
    ::close(read_fd);

    if (report != s_init_complete)
    {
        std::cerr << DaemonName << " failed to start: " << (report.empty() ? "no report" : report) << "\n";
        ::exit(EXIT_FAILURE);
    }
    ::exit(EXIT_SUCCESS);
}

/// Turns the process into a SysV daemon (see `man 7 daemon`).
///
/// Environment is kept as is (the backend library may be located via `LD_LIBRARY_PATH`),
/// and so are privileges - live pools are accessible to root only.
///
/// @return Descriptor for the start-up report, to be passed to `reportStartupComplete`.
///
int daemonize()
{
    auto startup_pipe = prepareForDetach();

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        exitWithStdError("Failed to fork: ");
    }
    if (pid > 0)
    {
        ::close(startup_pipe.write_fd);
        exitWithStartupReport(startup_pipe.read_fd);
    }

    ::close(startup_pipe.read_fd);
    detachFromTerminal(startup_pipe.write_fd);
    setupDaemonEnvironment(startup_pipe.write_fd);
    lockPidFile(startup_pipe.write_fd);
    return startup_pipe.write_fd;
}

zfsx::daemon::engine::Config::Ptr loadConfig(const int          err_fd,
                                             const bool         is_daemonized,
                                             const int          argc,
                                             const char** const argv)
{
    static const std::string config_file_prefix = "CONFIG_FILE=";

    auto cfg_file_path = is_daemonized ? (std::string{"/etc/"} + DaemonName + "/" + DaemonName + ".toml")
                                       : (std::string{"./"} + DaemonName + ".toml");
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, config_file_prefix.size(), config_file_prefix))
        {
            cfg_file_path = arg_str.substr(config_file_prefix.size());
        }
    }

    try
    {
        return zfsx::daemon::engine::Config::make(cfg_file_path);

    } catch (const std::exception& ex)
    {
        std::stringstream ss;
        ss << "Failed to load configuration file (path='" << cfg_file_path << "').\n" << ex.what();
        writeString(err_fd, ss.str().c_str());
    }
    ::exit(EXIT_FAILURE);
}

}  // namespace

int main(const int argc, const char** const argv)
{
    bool should_daemonize = true;
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--dev") == 0)  // NOLINT
        {
            should_daemonize = false;
        }
    }

    // In dev mode failures go to the standard error output,
    // otherwise through the pipe to the original process.
    int pipe_write_fd = STDERR_FILENO;
    if (should_daemonize)
    {
        pipe_write_fd = daemonize();
    }
    else
    {
        setupSignalHandlers();
    }

    const auto config = loadConfig(pipe_write_fd, should_daemonize, argc, argv);
    setupLogging(pipe_write_fd, should_daemonize, argc, argv, config);

    spdlog::info("{} started (ver='{}.{}').", DaemonName, VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    {
        try
        {
            zfsx::daemon::engine::Engine engine{config};
            if (const auto failure_str = engine.init())
            {
                spdlog::critical("Failed to init engine: {}", failure_str.value());

                writeString(pipe_write_fd, "Failed to init engine: ");
                writeString(pipe_write_fd, failure_str.value().c_str());
                ::exit(EXIT_FAILURE);
            }
            if (should_daemonize)
            {
                reportStartupComplete(pipe_write_fd);
            }

            engine.runWhile([] { return g_running == 1; });

        } catch (const std::exception& ex)
        {
            spdlog::critical("Unhandled exception: {}", ex.what());
            result = EXIT_FAILURE;
        }

        // Persists runtime changes (like the pool open mode switched over HTTP).
        config->save();

        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }
    }
    spdlog::info("{} terminated.", DaemonName);

    return result;
}
