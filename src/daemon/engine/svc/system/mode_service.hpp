//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_SVC_SYSTEM_MODE_SERVICE_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_SVC_SYSTEM_MODE_SERVICE_HPP_INCLUDED

#include "svc/svc_helpers.hpp"

#include <nlohmann/json.hpp>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace svc
{
namespace system
{

/// `GET /api/mode` and `PUT /api/mode` - inspects and switches the pool open mode.
///
class ModeService
{
public:
    ModeService() = delete;
    static void registerWithContext(const SvcContext& context);

};  // ModeService

/// Describes current pool open settings: `{mode, offline_search_paths, offline_pools}`.
///
nlohmann::json describePoolOpen(const SvcContext& context);

}  // namespace system
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_SVC_SYSTEM_MODE_SERVICE_HPP_INCLUDED
