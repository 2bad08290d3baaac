//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "version_service.hpp"

#include "http/request.hpp"
#include "http/response.hpp"
#include "mode_service.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
#include "svc/svc_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

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
namespace
{

class VersionServiceImpl final
{
public:
    explicit VersionServiceImpl(const SvcContext& context)
        : context_{context}
    {
    }

    cetl::optional<common::http::Response> operator()(const common::http::Request&,
                                                      const server::Router::Params&,
                                                      const server::HttpServer::KeepGoing&) const
    {
        const nlohmann::json payload{
            {"project", "zfsx"},
            {"backend", {{"name", "zfsxd"}, {"version", fmt::format("{}.{}", VERSION_MAJOR, VERSION_MINOR)}}},
            {"openzfs", {{"commit", context_.raw_api.version()}}},
            {"pool_open", describePoolOpen(context_)},
        };
        return makeJsonResponse(payload);
    }

private:
    const SvcContext context_;

};  // VersionServiceImpl

}  // namespace

void VersionService::registerWithContext(const SvcContext& context)
{
    context.router.add("GET", "/api/version", VersionServiceImpl{context});
}

}  // namespace system
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
