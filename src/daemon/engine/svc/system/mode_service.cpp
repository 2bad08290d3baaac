//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mode_service.hpp"

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
namespace system
{
namespace
{

using common::http::Status;

class GetModeServiceImpl final
{
public:
    explicit GetModeServiceImpl(const SvcContext& context)
        : context_{context}
    {
    }

    cetl::optional<common::http::Response> operator()(const common::http::Request&,
                                                      const server::Router::Params&,
                                                      const server::HttpServer::KeepGoing&) const
    {
        return makeJsonResponse(describePoolOpen(context_));
    }

private:
    const SvcContext context_;

};  // GetModeServiceImpl

class SetModeServiceImpl final
{
public:
    explicit SetModeServiceImpl(const SvcContext& context)
        : context_{context}
    {
    }

    /// Switches the pool open mode by `{"mode": "live"|"offline"}` request body.
    ///
    /// On an actual change cached pool sessions are dropped, and the new mode is stored to the configuration
    /// (which is written to its file on daemon exit).
    ///
    cetl::optional<common::http::Response> operator()(const common::http::Request& request,
                                                      const server::Router::Params&,
                                                      const server::HttpServer::KeepGoing&) const
    {
        nlohmann::json body;
        try
        {
            body = nlohmann::json::parse(request.body);

        } catch (const nlohmann::json::parse_error& ex)
        {
            return badRequest(fmt::format("invalid JSON body: {}", ex.what()));
        }

        const auto mode_field = body.is_object() ? body.find("mode") : body.end();
        if ((mode_field == body.end()) || !mode_field->is_string())
        {
            return badRequest("request body must be a JSON object with 'mode' string");
        }

        const auto mode = backend::parsePoolOpenMode(mode_field->get<std::string>());
        if (!mode)
        {
            return badRequest("mode must be 'live' or 'offline'");
        }

        if (context_.session_cache.setMode(*mode))
        {
            context_.config.setPoolOpenMode(backend::poolOpenModeName(*mode));
            logger_->info("Pool open mode is set to '{}'.", backend::poolOpenModeName(*mode));
        }
        return makeJsonResponse(describePoolOpen(context_));
    }

private:
    static common::http::Response badRequest(std::string message)
    {
        return zpl_export::makeErrorResponse(zpl_export::Fault::http(Status::BadRequest, std::move(message)));
    }

    const SvcContext        context_;
    const common::LoggerPtr logger_{common::getLogger("engine")};

};  // SetModeServiceImpl

}  // namespace

nlohmann::json describePoolOpen(const SvcContext& context)
{
    const auto search_paths = context.session_cache.offlineSearchPaths();
    return nlohmann::json{
        {"mode", backend::poolOpenModeName(context.session_cache.mode())},
        {"offline_search_paths", search_paths ? nlohmann::json(*search_paths) : nlohmann::json(nullptr)},
        {"offline_pools", context.config.getPoolOpenOfflinePools()},
    };
}

void ModeService::registerWithContext(const SvcContext& context)
{
    context.router.add("GET", "/api/mode", GetModeServiceImpl{context});
    context.router.add("PUT", "/api/mode", SetModeServiceImpl{context});
}

}  // namespace system
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
