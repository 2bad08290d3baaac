//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_SVC_SYSTEM_VERSION_SERVICE_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_SVC_SYSTEM_VERSION_SERVICE_HPP_INCLUDED

#include "svc/svc_helpers.hpp"

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

class VersionService
{
public:
    VersionService() = delete;
    static void registerWithContext(const SvcContext& context);

};  // VersionService

}  // namespace system
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_SVC_SYSTEM_VERSION_SERVICE_HPP_INCLUDED
