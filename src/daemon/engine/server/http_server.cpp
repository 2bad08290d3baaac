//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "http_server.hpp"

#include "client_context.hpp"
#include "http/http_status.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "io/io.hpp"
#include "io/poller.hpp"
#include "io/socket_address.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <utility>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace server
{
namespace
{

constexpr int MaxBacklog = 64;

}  // namespace

HttpServer::HttpServer(common::io::Poller&                        poller,
                       const common::io::SocketAddress&           address,
                       Handlers                                   handlers,
                       const common::http::RequestParser::Limits limits)
    : poller_{poller}
    , address_{address}
    , handlers_{std::move(handlers)}
    , parser_{limits}
    , last_client_id_{0}
{
    CETL_DEBUG_ASSERT(handlers_.on_request, "");
    CETL_DEBUG_ASSERT(handlers_.on_malformed, "");
}

HttpServer::~HttpServer()
{
    if (!id_to_client_.empty())
    {
        logger_->debug("Closing {} client connection(s).", id_to_client_.size());
    }
    id_to_client_.clear();
    accept_callback_.reset();
}

int HttpServer::start()
{
    CETL_DEBUG_ASSERT(!server_fd_.isValid(), "");

    auto socket_result = address_.socket(SOCK_STREAM);
    if (const auto* const err = cetl::get_if<common::io::SocketAddress::SocketResult::Failure>(&socket_result))
    {
        logger_->error("Failed to create server socket (addr='{}'): {}.", address_.toString(), std::strerror(*err));
        return *err;
    }
    server_fd_ = std::move(cetl::get<common::io::SocketAddress::SocketResult::Success>(socket_result));

    if (const auto err = address_.bind(server_fd_))
    {
        logger_->error("Failed to bind server socket (addr='{}'): {}.", address_.toString(), std::strerror(err));
        return err;
    }
    if (const auto err = address_.listen(server_fd_, MaxBacklog))
    {
        return err;
    }

    accept_callback_ = poller_.registerAwaitableCallback(  //
        [this] {
            //
            handleAccept();
        },
        common::io::Poller::Trigger::Readable{server_fd_.get()});
    if (!accept_callback_)
    {
        logger_->error("Failed to register accept callback (fd={}).", server_fd_.get());
        return EINVAL;
    }

    logger_->info("HTTP server is listening (addr='{}').", address_.toString());
    return 0;
}

void HttpServer::handleAccept()
{
    // Drain all pending connections - the listening socket is non-blocking.
    while (true)
    {
        common::io::SocketAddress peer_address;
        auto                      client_fd = peer_address.accept(server_fd_);
        if (!client_fd)
        {
            return;
        }

        const int  raw_fd    = client_fd->get();
        const auto client_id = ++last_client_id_;
        auto client = std::make_unique<ClientContext>(client_id, std::move(*client_fd), peer_address.toString());

        client->setReadCallback(poller_.registerAwaitableCallback(  //
            [this, client_id] {
                //
                handleReadable(client_id);
            },
            common::io::Poller::Trigger::Readable{raw_fd}));

        logger_->debug("Client connected (id={}, fd={}, peer='{}').", client_id, raw_fd, client->peer());
        id_to_client_.emplace(client_id, std::move(client));
    }
}

void HttpServer::handleReadable(const ClientContext::Id client_id)
{
    auto* const client = tryFindClient(client_id);
    if (client == nullptr)
    {
        return;
    }

    const int err = client->receive();
    if (err > 0)
    {
        logger_->warn("Failed to receive from client - closing connection (id={}, fd={}): {}.",
                      client_id,
                      client->fd(),
                      std::strerror(err));
        closeClient(client_id);
        return;
    }

    // Whatever is already received is still served after the end of the client stream.
    const bool is_end_of_stream = (err == -1);
    if (!processInput(*client))
    {
        closeClient(client_id);
        return;
    }
    if (is_end_of_stream)
    {
        logger_->debug("End of client stream (id={}, fd={}).", client_id, client->fd());
        client->markClosing();
        client->setReadCallback({});
    }
    if (!flushClient(*client))
    {
        closeClient(client_id);
    }
}

void HttpServer::handleWritable(const ClientContext::Id client_id)
{
    auto* const client = tryFindClient(client_id);
    if (client == nullptr)
    {
        return;
    }

    if (!flushClient(*client))
    {
        closeClient(client_id);
    }
}

bool HttpServer::processInput(ClientContext& client)
{
    using Parsed = common::http::RequestParser::Result;

    while (!client.isClosing())
    {
        auto parsed = parser_.parse(client.input());
        if (cetl::get_if<Parsed::Incomplete>(&parsed) != nullptr)
        {
            break;
        }

        if (const auto* const failure = cetl::get_if<Parsed::Failure>(&parsed))
        {
            logger_->debug("Malformed request - closing connection (id={}, status={}): {}.",
                           client.id(),
                           common::http::toCode(failure->status),
                           failure->reason);
            client.input().clear();
            sendResponse(client, handlers_.on_malformed(failure->status, failure->reason), false);
            break;
        }

        auto& success = cetl::get<Parsed::Success>(parsed);
        client.input().erase(0, success.consumed);

        const auto& request    = success.request;
        const bool  keep_alive = request.keepAlive();
        auto        response   = handlers_.on_request(request, [&client] {
            //
            return !client.isPeerGone();
        });
        if (!response)
        {
            logger_->debug("Request is abandoned - closing connection (id={}, target='{}').",
                           client.id(),
                           request.target);
            return false;
        }

        logger_->info("{} {} -> {} ({} bytes, id={}).",
                      request.method,
                      request.target,
                      common::http::toCode(response->status),
                      response->body.size(),
                      client.id());
        sendResponse(client, std::move(*response), keep_alive);
    }
    return true;
}

bool HttpServer::flushClient(ClientContext& client)
{
    if (const auto err = client.flushOutput())
    {
        logger_->debug("Failed to send to client - closing connection (id={}, fd={}): {}.",
                       client.id(),
                       client.fd(),
                       std::strerror(err));
        return false;
    }

    if (client.hasPendingOutput())
    {
        if (!client.hasWriteCallback())
        {
            const auto client_id = client.id();
            client.setWriteCallback(poller_.registerAwaitableCallback(  //
                [this, client_id] {
                    //
                    handleWritable(client_id);
                },
                common::io::Poller::Trigger::Writable{client.fd()}));
            if (!client.hasWriteCallback())
            {
                logger_->warn("Failed to register writable callback (id={}, fd={}).", client_id, client.fd());
                return false;
            }
        }
        return true;
    }

    client.resetWriteCallback();
    return !client.isClosing();
}

void HttpServer::sendResponse(ClientContext& client, common::http::Response response, const bool keep_alive)
{
    if (!keep_alive)
    {
        response.headers.set("Connection", "close");
        client.markClosing();
    }

    client.enqueueOutput(response.serializeHead());
    client.enqueueOutput(std::move(response.body));
}

void HttpServer::closeClient(const ClientContext::Id client_id)
{
    logger_->debug("Closing client connection (id={}).", client_id);
    id_to_client_.erase(client_id);
}

ClientContext* HttpServer::tryFindClient(const ClientContext::Id client_id)
{
    const auto id_and_client = id_to_client_.find(client_id);
    if (id_and_client != id_to_client_.end())
    {
        return id_and_client->second.get();
    }
    return nullptr;
}

}  // namespace server
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
