//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "services.hpp"

#include "export_path_service.hpp"
#include "list_pools_service.hpp"
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

void registerAllServices(const SvcContext& context)
{
    ListPoolsService::registerWithContext(context);
    ExportPathService::registerWithContext(context);
}

}  // namespace pools
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
