//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_LOGGING_HPP_INCLUDED
#define ZFSX_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include <cetl/cetl.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace zfsx
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Gets (or lazily creates) a named subsystem logger.
///
/// A logger which was not registered by the logging setup is cloned from the default one,
/// so it shares the default sinks, and gets its level from the `SPDLOG_LEVEL` environment.
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    spdlog::apply_logger_env_levels(logger);

    performWithoutThrowing([&logger] {
        //
        spdlog::register_logger(logger);
    });

    return logger;
}

}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_LOGGING_HPP_INCLUDED
