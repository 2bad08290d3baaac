//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_BACKEND_POOL_OPEN_MODE_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_BACKEND_POOL_OPEN_MODE_HPP_INCLUDED

#include "common_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace backend
{

/// Defines how pools are opened by the backend.
///
enum class PoolOpenMode
{
    Live,     ///< Imported pools of the running kernel.
    Offline,  ///< Exported pools, found by scanning device/image search paths.
};

inline const char* poolOpenModeName(const PoolOpenMode mode) noexcept
{
    return (mode == PoolOpenMode::Offline) ? "offline" : "live";
}

/// Parses `live` or `offline` (case-insensitive, surrounding whitespace ignored).
///
inline cetl::optional<PoolOpenMode> parsePoolOpenMode(const std::string& str)
{
    const auto mode = common::toLowerAscii(common::trimWhitespace(str));
    if (mode == "live")
    {
        return PoolOpenMode::Live;
    }
    if (mode == "offline")
    {
        return PoolOpenMode::Offline;
    }
    return cetl::nullopt;
}

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_BACKEND_POOL_OPEN_MODE_HPP_INCLUDED
