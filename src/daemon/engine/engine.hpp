//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_HPP_INCLUDED

#include "backend/raw_pool_api.hpp"
#include "backend/session_cache.hpp"
#include "config.hpp"
#include "io/poller.hpp"
#include "logging.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
#include "zpl_export/export_service.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    explicit Engine(Config::Ptr config);

    CETL_NODISCARD cetl::optional<std::string> init();
    void                                       runWhile(const std::function<bool()>& loop_predicate);

private:
    CETL_NODISCARD cetl::optional<std::string> initBackend();
    CETL_NODISCARD cetl::optional<std::string> initHttpServer();

    Config::Ptr                                config_;
    common::LoggerPtr                          logger_{common::getLogger("engine")};
    common::io::Poller::Ptr                    poller_;
    backend::RawPoolApi::Ptr                   raw_api_;
    std::unique_ptr<backend::SessionCache>     session_cache_;
    std::unique_ptr<zpl_export::ExportService> export_service_;
    std::unique_ptr<server::Router>            router_;
    std::unique_ptr<server::HttpServer>        http_server_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_HPP_INCLUDED
