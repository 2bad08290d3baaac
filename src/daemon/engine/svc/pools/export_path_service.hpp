//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_SVC_POOLS_EXPORT_PATH_SERVICE_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_SVC_POOLS_EXPORT_PATH_SERVICE_HPP_INCLUDED

#include "svc/svc_helpers.hpp"

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace svc
{
namespace pools
{

/// `GET /api/pools/{pool}/zpl/path/{*path}` - downloads (a byte range of) a file of a pool dataset.
///
class ExportPathService
{
public:
    ExportPathService() = delete;
    static void registerWithContext(const SvcContext& context);

};  // ExportPathService

}  // namespace pools
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_SVC_POOLS_EXPORT_PATH_SERVICE_HPP_INCLUDED
