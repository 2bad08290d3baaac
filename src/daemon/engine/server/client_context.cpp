//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "client_context.hpp"

#include "io/io.hpp"
#include "zfsx/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>

#include <array>
#include <cerrno>
#include <cstddef>
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

constexpr std::size_t ReceiveChunkSize = 16UL * 1024UL;  // NOLINT(*-magic-numbers)

#ifdef MSG_NOSIGNAL
constexpr int SendFlags = MSG_DONTWAIT | MSG_NOSIGNAL;
#else
constexpr int SendFlags = MSG_DONTWAIT;
#endif

bool isWouldBlock(const int err) noexcept
{
    return (err == EAGAIN) || (err == EWOULDBLOCK);
}

}  // namespace

ClientContext::ClientContext(const Id id, common::io::OwnFd&& fd, std::string peer)
    : id_{id}
    , fd_{std::move(fd)}
    , peer_{std::move(peer)}
    , output_offset_{0}
    , is_closing_{false}
    , is_peer_gone_{false}
{
    CETL_DEBUG_ASSERT(fd_.isValid(), "");

    logger_->trace("ClientContext(fd={}, id={}, peer='{}').", fd_.get(), id_, peer_);
}

ClientContext::~ClientContext()
{
    // Callbacks first - they refer to the descriptor.
    read_callback_.reset();
    write_callback_.reset();

    logger_->trace("~ClientContext(fd={}, id={}).", fd_.get(), id_);
}

int ClientContext::receive()
{
    std::array<char, ReceiveChunkSize> buffer{};
    while (true)
    {
        std::size_t bytes_read = 0;
        const int   err        = platform::posixTransferError(
            [this, &buffer] {
                //
                return ::recv(fd_.get(), buffer.data(), buffer.size(), MSG_DONTWAIT);
            },
            bytes_read);
        if (err != 0)
        {
            return isWouldBlock(err) ? 0 : err;
        }
        if (bytes_read == 0)
        {
            return -1;
        }

        input_.append(buffer.data(), bytes_read);
        if (bytes_read < buffer.size())
        {
            return 0;
        }
    }
}

void ClientContext::enqueueOutput(std::string data)
{
    if (!data.empty())
    {
        output_.emplace_back(std::move(data));
    }
}

int ClientContext::flushOutput()
{
    while (!output_.empty())
    {
        const auto& front = output_.front();
        CETL_DEBUG_ASSERT(output_offset_ < front.size(), "");

        std::size_t bytes_sent = 0;
        const int   err        = platform::posixTransferError(
            [this, &front] {
                //
                return ::send(fd_.get(), front.data() + output_offset_, front.size() - output_offset_, SendFlags);
            },
            bytes_sent);
        if (err != 0)
        {
            return isWouldBlock(err) ? 0 : err;
        }

        output_offset_ += bytes_sent;
        if (output_offset_ < front.size())
        {
            // The socket buffer is full - the rest goes on the next writable readiness.
            return 0;
        }
        output_.pop_front();
        output_offset_ = 0;
    }
    return 0;
}

bool ClientContext::isPeerGone()
{
    if (is_peer_gone_)
    {
        return true;
    }

    char        peeked     = 0;
    std::size_t bytes_read = 0;
    const int   err        = platform::posixTransferError(
        [this, &peeked] {
            //
            return ::recv(fd_.get(), &peeked, sizeof(peeked), MSG_PEEK | MSG_DONTWAIT);
        },
        bytes_read);
    if (err != 0)
    {
        is_peer_gone_ = !isWouldBlock(err);
        return is_peer_gone_;
    }
    if (bytes_read > 0)
    {
        // Pipelined data - the peer is still there.
        return false;
    }

    // End of the peer stream. A half-closed peer still reads the response,
    // so only a pending socket error (such as a reset) means that the peer has gone.
    int       so_error = 0;
    socklen_t so_len   = sizeof(so_error);
    if (::getsockopt(fd_.get(), SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0)
    {
        so_error = errno;
    }
    is_peer_gone_ = (so_error != 0);
    return is_peer_gone_;
}

}  // namespace server
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
