//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_SERVER_HTTP_SERVER_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_SERVER_HTTP_SERVER_HPP_INCLUDED

#include "client_context.hpp"
#include "http/http_status.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "io/io.hpp"
#include "io/poller.hpp"
#include "io/socket_address.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace server
{

/// Non-blocking HTTP/1.1 server driven by the poller.
///
/// Requests of one connection are handled strictly in order, on the poller thread;
/// responses are buffered and written as the socket becomes writable.
///
class HttpServer final
{
public:
    /// Tells a long-running handler whether the requesting peer is still connected.
    ///
    using KeepGoing = std::function<bool()>;

    struct Handlers
    {
        /// Produces response for a complete request.
        ///
        /// `nullopt` abandons the request - nothing is sent, and the connection is closed.
        ///
        std::function<cetl::optional<common::http::Response>(const common::http::Request&, const KeepGoing&)>
            on_request;

        /// Produces response for a malformed request (the connection is closed after it).
        ///
        std::function<common::http::Response(const common::http::Status, const std::string&)> on_malformed;
    };

    HttpServer(common::io::Poller&                        poller,
               const common::io::SocketAddress&           address,
               Handlers                                   handlers,
               const common::http::RequestParser::Limits limits = common::http::RequestParser::DefaultLimits);

    HttpServer(const HttpServer&)                = delete;
    HttpServer(HttpServer&&) noexcept            = delete;
    HttpServer& operator=(const HttpServer&)     = delete;
    HttpServer& operator=(HttpServer&&) noexcept = delete;

    ~HttpServer();

    /// Binds, listens and starts accepting connections.
    ///
    /// @return `0` on success, otherwise `errno` of the failed step.
    ///
    CETL_NODISCARD int start();

    std::size_t clientsCount() const noexcept
    {
        return id_to_client_.size();
    }

private:
    void handleAccept();
    void handleReadable(const ClientContext::Id client_id);
    void handleWritable(const ClientContext::Id client_id);
    void closeClient(const ClientContext::Id client_id);

    // These return `false` when the connection has to be closed right away.
    //
    CETL_NODISCARD bool processInput(ClientContext& client);
    CETL_NODISCARD bool flushClient(ClientContext& client);

    static void sendResponse(ClientContext& client, common::http::Response response, const bool keep_alive);

    ClientContext* tryFindClient(const ClientContext::Id client_id);

    common::io::Poller&                                         poller_;
    const common::io::SocketAddress                             address_;
    const Handlers                                              handlers_;
    const common::http::RequestParser                           parser_;
    common::io::OwnFd                                           server_fd_;
    ClientContext::Id                                           last_client_id_;
    common::io::Poller::Callback                                accept_callback_;
    std::unordered_map<ClientContext::Id, ClientContext::Ptr> id_to_client_;
    const common::LoggerPtr                                     logger_{common::getLogger("http")};

};  // HttpServer

}  // namespace server
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_SERVER_HTTP_SERVER_HPP_INCLUDED
