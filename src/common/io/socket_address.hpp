//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
#define ZFSX_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED

#include "io.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <utility>

namespace zfsx
{
namespace common
{
namespace io
{

/// Listening (or connecting) address of a stream socket.
///
/// Supported textual forms:
/// - `unix:/path/to/socket` - Unix domain socket;
/// - `tcp://host:port`, `host:port`, `host` - IPv4 (with optional port);
/// - `[ipv6]:port`, `ipv6` - IPv6 (with optional port);
/// - `*:port` - dual stack wildcard (IPv6 with IPv4 mapping enabled).
///
class SocketAddress final
{
public:
    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = SocketAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static ParseResult::Var parse(const std::string& str, const std::uint16_t port_hint);

    SocketAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept;

    bool isUnix() const noexcept
    {
        return asGenericAddr().sa_family == AF_UNIX;
    }

    bool isAnyInet() const noexcept
    {
        const auto family = asGenericAddr().sa_family;
        return (family == AF_INET) || (family == AF_INET6);
    }

    /// Human-readable form of the address, f.e. `127.0.0.1:9000`, `[::1]:9000` or `unix:/run/zfsxd.sock`.
    ///
    std::string toString() const;

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Creates a non-blocking, close-on-exec socket of the address family.
    ///
    CETL_NODISCARD SocketResult::Var socket(const int type) const;

    CETL_NODISCARD int bind(const OwnFd& socket_fd) const;
    CETL_NODISCARD int listen(const OwnFd& socket_fd, const int backlog) const;
    CETL_NODISCARD int connect(const OwnFd& socket_fd) const;

    /// Accepts a pending connection (if any).
    ///
    /// Transient network errors are retried; "would block" and permanent errors give `nullopt`.
    /// On success this address object is updated with the peer address.
    ///
    cetl::optional<OwnFd> accept(const OwnFd& server_fd);

private:
    static cetl::optional<ParseResult::Var> tryParseAsUnixDomain(const std::string& str);
    static int extractFamilyHostAndPort(const std::string& str, std::string& host, std::uint16_t& port);
    static cetl::optional<ParseResult::Success> tryParseAsWildcard(const std::string& host, const std::uint16_t port);

    sockaddr& asGenericAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr&>(addr_storage_);
    }
    const sockaddr& asGenericAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr&>(addr_storage_);
    }
    sockaddr_un& asUnixAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_un&>(addr_storage_);
    }
    const sockaddr_un& asUnixAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr_un&>(addr_storage_);
    }
    sockaddr_in& asInetAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in&>(addr_storage_);
    }
    const sockaddr_in& asInetAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr_in&>(addr_storage_);
    }
    sockaddr_in6& asInet6Addr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in6&>(addr_storage_);
    }
    const sockaddr_in6& asInet6Addr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr_in6&>(addr_storage_);
    }

    bool             is_wildcard_;
    socklen_t        addr_len_;
    sockaddr_storage addr_storage_;

};  // SocketAddress

}  // namespace io
}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
