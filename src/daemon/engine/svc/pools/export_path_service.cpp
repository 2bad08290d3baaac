//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "export_path_service.hpp"

#include "http/request.hpp"
#include "http/response.hpp"
#include "logging.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
#include "svc/svc_helpers.hpp"
#include "zpl_export/export_service.hpp"
#include "zpl_export/fault.hpp"

#include <cetl/pf17/cetlpf.hpp>

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

class ExportPathServiceImpl final
{
public:
    explicit ExportPathServiceImpl(const SvcContext& context)
        : context_{context}
    {
    }

    /// Handles the request by the export pipeline.
    ///
    /// Faults become JSON error responses, except for a gone client - such request is just abandoned.
    ///
    cetl::optional<common::http::Response> operator()(const common::http::Request&         request,
                                                      const server::Router::Params&        params,
                                                      const server::HttpServer::KeepGoing& keep_going) const
    {
        using Export = zpl_export::ExportService::Export;

        const zpl_export::ExportService::Request export_request{params.at("pool"),
                                                                params.at("path"),
                                                                request.headers.find("Range")};

        auto result = context_.export_service.exportFile(export_request, keep_going);
        if (auto* const response = cetl::get_if<Export::Success>(&result))
        {
            return std::move(*response);
        }

        const auto& fault = cetl::get<Export::Failure>(result);
        if (fault.kind == zpl_export::FaultKind::ClientGone)
        {
            logger_->debug("Export of '{}' (pool='{}') is abandoned by the client.",
                           export_request.path,
                           export_request.pool);
            return cetl::nullopt;
        }
        return zpl_export::makeErrorResponse(fault);
    }

private:
    const SvcContext        context_;
    const common::LoggerPtr logger_{common::getLogger("engine")};

};  // ExportPathServiceImpl

}  // namespace

void ExportPathService::registerWithContext(const SvcContext& context)
{
    context.router.add("GET", "/api/pools/{pool}/zpl/path/{*path}", ExportPathServiceImpl{context});
}

}  // namespace pools
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
