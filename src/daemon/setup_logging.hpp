//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define ZFSX_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "config.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <memory>
#include <string>
#include <sys/syslog.h>
#include <unistd.h>

namespace detail
{

/// Names of the daemon subsystem loggers (see `common::getLogger`).
///
constexpr const char* SubsystemLoggers[] = {"engine", "http", "backend", "export", "io"};  // NOLINT(*-avoid-c-arrays)

/// Applies flush levels in the `SPDLOG_LEVEL` syntax (f.e. `warn,http=debug`).
///
inline void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t MaxLevelsLength = 512;
    if (flush_levels.empty() || (flush_levels.size() > MaxLevelsLength))
    {
        return;
    }

    auto name_to_level = spdlog::cfg::helpers::extract_key_vals_(flush_levels);  // NOLINT
    for (auto& name_level : name_to_level)
    {
        auto&      level_name = spdlog::cfg::helpers::to_lower_(name_level.second);  // NOLINT
        const auto level      = spdlog::level::from_str(level_name);
        if ((level == spdlog::level::off) && (level_name != "off"))
        {
            continue;  // unknown level name
        }

        // An empty name stands for the default logger.
        const auto logger = name_level.first.empty() ? spdlog::default_logger() : spdlog::get(name_level.first);
        if (logger)
        {
            logger->flush_on(level);
        }
    }

    // Named loggers without an explicit flush level follow the default logger.
    //
    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&name_to_level, default_flush_level](const auto& logger) {
        //
        if (!logger->name().empty() && (name_to_level.find(logger->name()) == name_to_level.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Applies the last `SPDLOG_FLUSH_LEVEL=...` command line argument (if any).
///
inline void loadArgvFlushLevels(const int argc, const char** const argv)
{
    const std::string prefix = "SPDLOG_FLUSH_LEVEL=";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.compare(0, prefix.size(), prefix) == 0)
        {
            loadFlushLevels(arg.substr(prefix.size()));
        }
    }
}

}  // namespace detail

inline bool writeString(const int fd, const char* const str)
{
    const auto str_len = std::strlen(str);
    return static_cast<ssize_t>(str_len) == ::write(fd, str, str_len);
}

/// Sets up the logging system.
///
/// All loggers write to the rotating log file; the default logger also goes to syslog.
/// Levels come from the `[logging]` configuration section, and could be overridden
/// by `SPDLOG_LEVEL=...` and `SPDLOG_FLUSH_LEVEL=...` command line arguments.
///
/// Failures are reported to the given descriptor, and terminate the process.
///
inline void setupLogging(const int                                err_fd,
                         const bool                               is_daemonized,
                         const int                                argc,
                         const char** const                       argv,
                         const zfsx::daemon::engine::Config::Ptr& config)
{
    using spdlog::sinks::rotating_file_sink_st;
    using spdlog::sinks::syslog_sink_st;

    try
    {
        constexpr std::size_t MaxLogFiles    = 4;
        constexpr std::size_t MaxLogFileSize = 16UL * 1024UL * 1024UL;

        const std::string ident         = "zfsxd";
        const auto        log_file_path = config->getLoggingFile().value_or(  //
            std::string{is_daemonized ? "/var/log/" : "./"} + ident + ".log");

        // Loggers created before (f.e. while loading the configuration) are recreated with the final sinks.
        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(log_file_path, MaxLogFileSize, MaxLogFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto syslog_sink =
            std::make_shared<syslog_sink_st>(ident, LOG_PID, is_daemonized ? LOG_DAEMON : LOG_USER, true);
        syslog_sink->set_pattern("[%l] '%n' | %v");

        const auto default_logger =
            std::make_shared<spdlog::logger>("", std::initializer_list<spdlog::sink_ptr>{syslog_sink, file_sink});
        spdlog::register_logger(default_logger);
        spdlog::set_default_logger(default_logger);

        for (const auto* const name : detail::SubsystemLoggers)
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(name, file_sink));
        }

        if (const auto logging_level = config->getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config->getLoggingFlushLevel())
        {
            detail::loadFlushLevels(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevels(argc, argv);

        // Separates runs of the daemon in the log file (syslog is not involved).
        if (default_logger->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        writeString(err_fd, "Failed to setup logging: ");
        writeString(err_fd, ex.what());
        ::exit(EXIT_FAILURE);
    }
}

#endif  // ZFSX_DAEMON_SETUP_LOGGING_HPP_INCLUDED
