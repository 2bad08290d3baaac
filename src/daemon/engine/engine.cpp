//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "backend/native_pool_api.hpp"
#include "backend/pool_open_mode.hpp"
#include "backend/session_cache.hpp"
#include "config.hpp"
#include "http/http_status.hpp"
#include "http/response.hpp"
#include "io/poller.hpp"
#include "io/socket_address.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
#include "svc/pools/services.hpp"
#include "svc/svc_helpers.hpp"
#include "svc/system/services.hpp"
#include "zpl_export/chunked_reader.hpp"
#include "zpl_export/export_service.hpp"
#include "zpl_export/fault.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace
{

constexpr const char*   DefaultHttpListen     = "tcp://127.0.0.1:9000";
constexpr std::uint16_t DefaultHttpPort       = 9000;
constexpr const char*   DefaultBackendLibrary = "libzdbdecode.so";

}  // namespace

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    // 1. Create the event loop poller.
    //
    auto maybe_poller = common::io::Poller::make();
    if (const auto* const err = cetl::get_if<common::io::Poller::MakeResult::Failure>(&maybe_poller))
    {
        std::string msg = fmt::format("Failed to create poller: {}.", std::strerror(*err));
        logger_->error(msg);
        return msg;
    }
    poller_ = std::move(cetl::get<common::io::Poller::MakeResult::Success>(maybe_poller));

    // 2. Load the native backend library, and make the pool session cache on top of it.
    //
    if (auto failure = initBackend())
    {
        return failure;
    }

    // 3. Register HTTP services, and start listening.
    //
    if (auto failure = initHttpServer())
    {
        return failure;
    }

    logger_->debug("Engine is initialized.");
    return cetl::nullopt;
}

cetl::optional<std::string> Engine::initBackend()
{
    const auto library = config_->getBackendLibrary().value_or(DefaultBackendLibrary);

    auto maybe_raw_api = backend::NativePoolApi::make(library);
    if (const auto* const failure = cetl::get_if<backend::NativePoolApi::Make::Failure>(&maybe_raw_api))
    {
        std::string msg = fmt::format("Failed to load backend library '{}': {}", library, *failure);
        logger_->error(msg);
        return msg;
    }
    raw_api_ = std::move(cetl::get<backend::NativePoolApi::Make::Success>(maybe_raw_api));
    logger_->info("Backend library is loaded (library='{}', version='{}').", library, raw_api_->version());

    backend::SessionCache::Settings settings;
    if (const auto mode_str = config_->getPoolOpenMode())
    {
        const auto mode = backend::parsePoolOpenMode(*mode_str);
        if (!mode)
        {
            std::string msg = fmt::format("Invalid pool open mode '{}' (expected 'live' or 'offline').", *mode_str);
            logger_->error(msg);
            return msg;
        }
        settings.mode = *mode;
    }
    settings.offline_search_paths = config_->getPoolOpenOfflineSearchPaths();
    if (const auto capacity = config_->getSessionsCapacity())
    {
        settings.capacity = static_cast<std::size_t>(*capacity);
    }
    logger_->debug("Pool sessions (mode={}, capacity={}).", backend::poolOpenModeName(settings.mode), settings.capacity);
    session_cache_ = std::make_unique<backend::SessionCache>(raw_api_, std::move(settings));

    auto limits = zpl_export::ChunkedReader::DefaultLimits;
    if (const auto max_download_bytes = config_->getExportMaxDownloadBytes())
    {
        limits.max_download_bytes = *max_download_bytes;
    }
    if (const auto max_chunk_bytes = config_->getExportMaxChunkBytes())
    {
        limits.max_chunk_bytes = *max_chunk_bytes;
    }
    if ((limits.max_download_bytes == 0) || (limits.max_chunk_bytes == 0))
    {
        std::string msg = "Export limits must be greater than zero.";
        logger_->error(msg);
        return msg;
    }
    export_service_ = std::make_unique<zpl_export::ExportService>(*session_cache_, limits);

    return cetl::nullopt;
}

cetl::optional<std::string> Engine::initHttpServer()
{
    router_ = std::make_unique<server::Router>([](const common::http::Status status, const std::string& message) {
        //
        return zpl_export::makeErrorResponse(zpl_export::Fault::http(status, message));
    });

    const svc::SvcContext svc_context{*router_, *config_, *raw_api_, *session_cache_, *export_service_};
    svc::system::registerAllServices(svc_context);
    svc::pools::registerAllServices(svc_context);

    const auto listen      = config_->getHttpListen().value_or(DefaultHttpListen);
    auto       maybe_addrs = common::io::SocketAddress::parse(listen, DefaultHttpPort);
    if (const auto* const err = cetl::get_if<common::io::SocketAddress::ParseResult::Failure>(&maybe_addrs))
    {
        std::string msg = fmt::format("Failed to parse HTTP listen address '{}': {}.", listen, std::strerror(*err));
        logger_->error(msg);
        return msg;
    }
    const auto& address = cetl::get<common::io::SocketAddress::ParseResult::Success>(maybe_addrs);

    server::HttpServer::Handlers handlers;
    handlers.on_request = [this](const common::http::Request& request, const server::HttpServer::KeepGoing& keep_going) {
        //
        return router_->route(request, keep_going);
    };
    handlers.on_malformed = [this](const common::http::Status status, const std::string& reason) {
        //
        return router_->error(status, reason);
    };

    http_server_ = std::make_unique<server::HttpServer>(*poller_, address, std::move(handlers));
    if (const auto err = http_server_->start())
    {
        std::string msg = fmt::format("Failed to start HTTP server on '{}': {}.", listen, std::strerror(err));
        logger_->error(msg);
        return msg;
    }

    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    using std::chrono_literals::operator""s;

    CETL_DEBUG_ASSERT(poller_, "");

    while (loop_predicate())
    {
        // Wait for I/O readiness, but awake at least once per second to re-check the predicate.
        if (const auto err = poller_->pollFor(1s))
        {
            spdlog::warn("Failed to poll awaitable resources: {}.", std::strerror(err));
        }
    }
    spdlog::debug("Run loop predicate is fulfilled (clients={}).", http_server_ ? http_server_->clientsCount() : 0);
}

}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
