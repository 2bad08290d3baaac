//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "list_pools_service.hpp"

#include "backend/pool_open_mode.hpp"
#include "http/http_status.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "logging.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
#include "svc/svc_helpers.hpp"
#include "zpl_export/fault.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <string>
#include <utility>

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
namespace
{

class ListPoolsServiceImpl final
{
public:
    explicit ListPoolsServiceImpl(const SvcContext& context)
        : context_{context}
    {
    }

    /// Lists names of the pools available in the current mode.
    ///
    /// In offline mode the configured offline pool names (if any) are listed as is;
    /// otherwise the backend is asked for the pools it sees.
    ///
    cetl::optional<common::http::Response> operator()(const common::http::Request&,
                                                      const server::Router::Params&,
                                                      const server::HttpServer::KeepGoing&) const
    {
        if (context_.session_cache.mode() == backend::PoolOpenMode::Offline)
        {
            const auto offline_pools = context_.config.getPoolOpenOfflinePools();
            if (!offline_pools.empty())
            {
                return makeJsonResponse(offline_pools);
            }
        }

        const auto raw = context_.raw_api.listPools();
        if (!raw.isOk())
        {
            const auto message = raw.errmsg.empty() ? std::string{"Unknown error"} : raw.errmsg;
            logger_->error("Failed to list pools: {}", message);
            return failure(message);
        }
        if (raw.json.empty())
        {
            return failure("Missing JSON in result");
        }

        try
        {
            return makeJsonResponse(nlohmann::json::parse(raw.json));

        } catch (const nlohmann::json::parse_error& ex)
        {
            logger_->error("Failed to parse JSON: {}", ex.what());
            return failure(fmt::format("JSON parse error: {}", ex.what()));
        }
    }

private:
    static common::http::Response failure(std::string message)
    {
        return zpl_export::makeErrorResponse(
            zpl_export::Fault::http(common::http::Status::InternalServerError, std::move(message)));
    }

    const SvcContext        context_;
    const common::LoggerPtr logger_{common::getLogger("engine")};

};  // ListPoolsServiceImpl

}  // namespace

void ListPoolsService::registerWithContext(const SvcContext& context)
{
    context.router.add("GET", "/api/pools", ListPoolsServiceImpl{context});
}

}  // namespace pools
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
