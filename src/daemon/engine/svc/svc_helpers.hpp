//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED

#include "backend/raw_pool_api.hpp"
#include "backend/session_cache.hpp"
#include "config.hpp"
#include "http/http_status.hpp"
#include "http/response.hpp"
#include "server/router.hpp"
#include "zpl_export/export_service.hpp"

#include <nlohmann/json.hpp>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace svc
{

struct SvcContext
{
    server::Router&            router;
    Config&                    config;
    backend::RawPoolApi&       raw_api;
    backend::SessionCache&     session_cache;
    zpl_export::ExportService& export_service;

};  // SvcContext

inline common::http::Response makeJsonResponse(const nlohmann::json& payload)
{
    return common::http::Response::json(common::http::Status::Ok,
                                        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED
