//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_SERVER_CLIENT_CONTEXT_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_SERVER_CLIENT_CONTEXT_HPP_INCLUDED

#include "io/io.hpp"
#include "io/poller.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <utility>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace server
{

/// State of one accepted HTTP connection.
///
class ClientContext final
{
public:
    using Ptr = std::unique_ptr<ClientContext>;
    using Id  = std::uint64_t;

    ClientContext(const Id id, common::io::OwnFd&& fd, std::string peer);
    ~ClientContext();

    ClientContext(const ClientContext&)                = delete;
    ClientContext(ClientContext&&) noexcept            = delete;
    ClientContext& operator=(const ClientContext&)     = delete;
    ClientContext& operator=(ClientContext&&) noexcept = delete;

    Id id() const noexcept
    {
        return id_;
    }

    int fd() const noexcept
    {
        return fd_.get();
    }

    const std::string& peer() const noexcept
    {
        return peer_;
    }

    /// Accumulated, not yet parsed request bytes.
    ///
    std::string& input() noexcept
    {
        return input_;
    }

    /// Receives all currently available bytes (without blocking) into the input buffer.
    ///
    /// @return `0` on success (including "nothing more is pending"), `-1` at the end of the peer stream,
    ///         otherwise `errno` of the failed `recv`.
    ///
    CETL_NODISCARD int receive();

    void enqueueOutput(std::string data);

    bool hasPendingOutput() const noexcept
    {
        return !output_.empty();
    }

    /// Sends (without blocking) as much of the pending output as the socket accepts.
    ///
    /// @return `0` on success (even if some output is still pending), otherwise `errno` of the failed `send`.
    ///
    CETL_NODISCARD int flushOutput();

    /// Checks the socket (without consuming anything) whether the peer has dropped the connection.
    ///
    /// The end of the peer stream alone is not a drop - a half-closed peer still waits for the response.
    /// Once the peer is found gone, it stays so.
    ///
    bool isPeerGone();

    /// Whether the connection is closed as soon as the pending output is sent.
    ///
    bool isClosing() const noexcept
    {
        return is_closing_;
    }

    void markClosing() noexcept
    {
        is_closing_ = true;
    }

    void setReadCallback(common::io::Poller::Callback&& callback)
    {
        read_callback_ = std::move(callback);
    }

    bool hasWriteCallback() const noexcept
    {
        return static_cast<bool>(write_callback_);
    }

    void setWriteCallback(common::io::Poller::Callback&& callback)
    {
        write_callback_ = std::move(callback);
    }

    void resetWriteCallback() noexcept
    {
        write_callback_.reset();
    }

private:
    const Id                     id_;
    common::io::OwnFd            fd_;
    const std::string            peer_;
    std::string                  input_;
    std::deque<std::string>      output_;
    std::size_t                  output_offset_;  // sent part of the front output chunk
    bool                         is_closing_;
    bool                         is_peer_gone_;
    common::io::Poller::Callback read_callback_;
    common::io::Poller::Callback write_callback_;
    const common::LoggerPtr      logger_{common::getLogger("http")};

};  // ClientContext

}  // namespace server
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_SERVER_CLIENT_CONTEXT_HPP_INCLUDED
