//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "services.hpp"

#include "mode_service.hpp"
#include "svc/svc_helpers.hpp"
#include "version_service.hpp"

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

void registerAllServices(const SvcContext& context)
{
    VersionService::registerWithContext(context);
    ModeService::registerWithContext(context);
}

}  // namespace system
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
