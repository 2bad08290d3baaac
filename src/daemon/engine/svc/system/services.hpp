//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_SVC_SYSTEM_SERVICES_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_SVC_SYSTEM_SERVICES_HPP_INCLUDED

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

void registerAllServices(const SvcContext& context);

}  // namespace system
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_SVC_SYSTEM_SERVICES_HPP_INCLUDED
