//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_address.hpp"

#include "common_helpers.hpp"
#include "io.hpp"
#include "logging.hpp"
#include "zfsx/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace zfsx
{
namespace common
{
namespace io
{
namespace
{

constexpr const char* UnixPrefix = "unix:";
constexpr const char* TcpPrefix  = "tcp://";

}  // namespace

SocketAddress::SocketAddress() noexcept
    : is_wildcard_{false}
    , addr_len_{0}
    , addr_storage_{}
{
}

std::pair<const sockaddr*, socklen_t> SocketAddress::getRaw() const noexcept
{
    return {&asGenericAddr(), addr_len_};
}

std::string SocketAddress::toString() const
{
    switch (asGenericAddr().sa_family)
    {
    case AF_UNIX: {
        return UnixPrefix + std::string{asUnixAddr().sun_path};  // NOLINT(*-array-to-pointer-decay, *-no-array-decay)
    }
    case AF_INET: {
        std::array<char, INET_ADDRSTRLEN> buf{};
        const auto&                       addr = asInetAddr();
        if (nullptr == ::inet_ntop(AF_INET, &addr.sin_addr, buf.data(), buf.size()))
        {
            return "?";
        }
        return std::string{buf.data()} + ":" + std::to_string(ntohs(addr.sin_port));
    }
    case AF_INET6: {
        const auto& addr = asInet6Addr();
        if (is_wildcard_)
        {
            return "*:" + std::to_string(ntohs(addr.sin6_port));
        }
        std::array<char, INET6_ADDRSTRLEN> buf{};
        if (nullptr == ::inet_ntop(AF_INET6, &addr.sin6_addr, buf.data(), buf.size()))
        {
            return "?";
        }
        return "[" + std::string{buf.data()} + "]:" + std::to_string(ntohs(addr.sin6_port));
    }
    default: {
        return "?";
    }
    }
}

SocketAddress::SocketResult::Var SocketAddress::socket(const int type) const
{
    unsigned int socket_type = static_cast<unsigned int>(type);
#if __linux__
    socket_type |= static_cast<unsigned int>(SOCK_NONBLOCK);
    socket_type |= static_cast<unsigned int>(SOCK_CLOEXEC);
#endif

    OwnFd out_fd;

    const auto& addr_generic = asGenericAddr();
    if (const auto err = platform::posixSyscallError([socket_type, &addr_generic, &out_fd] {
            //
            const int fd = ::socket(addr_generic.sa_family, static_cast<int>(socket_type), 0);
            if (fd != -1)
            {
                out_fd = OwnFd{fd};
            }
            return fd;
        }))
    {
        getLogger("io")->error("Failed to create socket (addr='{}'): {}.", toString(), std::strerror(err));
        return err;
    }

    return out_fd;
}

int SocketAddress::bind(const OwnFd& socket_fd) const
{
    const int raw_fd = socket_fd.get();
    CETL_DEBUG_ASSERT(raw_fd != -1, "");

    if (isUnix())
    {
        // A stale socket file from a previous run would make `bind` fail with `EADDRINUSE`.
        const char* const sun_path = asUnixAddr().sun_path;  // NOLINT(*-array-to-pointer-decay, *-no-array-decay)
        if ((::unlink(sun_path) < 0) && (errno != ENOENT))
        {
            getLogger("io")->warn("Failed to unlink stale socket file (path='{}').", sun_path);
        }
    }
    else
    {
        if (const auto err = platform::posixSyscallError([raw_fd] {
                //
                int enable = 1;
                return ::setsockopt(raw_fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
            }))
        {
            getLogger("io")->warn("Failed to set SO_REUSEADDR=1: {}.", std::strerror(err));
        }
    }

    // Disable IPv6-only mode for dual-stack sockets (aka wildcard).
    if (is_wildcard_)
    {
        if (const auto err = platform::posixSyscallError([raw_fd] {
                //
                int disable = 0;
                return ::setsockopt(raw_fd, IPPROTO_IPV6, IPV6_V6ONLY, &disable, sizeof(disable));
            }))
        {
            getLogger("io")->error("Failed to set IPV6_V6ONLY=0: {}.", std::strerror(err));
            return err;
        }
    }

    const auto err = platform::posixSyscallError([this, raw_fd] {
        //
        return ::bind(raw_fd, &asGenericAddr(), addr_len_);
    });
    if (err != 0)
    {
        getLogger("io")->error("Failed to bind socket (addr='{}'): {}.", toString(), std::strerror(err));
    }
    return err;
}

int SocketAddress::listen(const OwnFd& socket_fd, const int backlog) const
{
    CETL_DEBUG_ASSERT(socket_fd.isValid(), "");

    const auto err = platform::posixSyscallError([&socket_fd, backlog] {
        //
        return ::listen(socket_fd.get(), backlog);
    });
    if (err != 0)
    {
        getLogger("io")->error("Failed to listen (addr='{}'): {}.", toString(), std::strerror(err));
    }
    return err;
}

int SocketAddress::connect(const OwnFd& socket_fd) const
{
    const int raw_fd = socket_fd.get();
    CETL_DEBUG_ASSERT(raw_fd != -1, "");

    const auto err = platform::posixSyscallError([this, raw_fd] {
        //
        return ::connect(raw_fd, &asGenericAddr(), addr_len_);
    });
    switch (err)
    {
    case 0:
    case EINPROGRESS: {
        return 0;
    }
    default: {
        getLogger("io")->error("Failed to connect (addr='{}'): {}.", toString(), std::strerror(err));
        return err;
    }
    }
}

cetl::optional<OwnFd> SocketAddress::accept(const OwnFd& server_fd)
{
    CETL_DEBUG_ASSERT(server_fd.isValid(), "");

    while (true)
    {
        addr_len_ = sizeof(addr_storage_);
#if __linux__
        OwnFd client_fd{::accept4(server_fd.get(), &asGenericAddr(), &addr_len_, SOCK_NONBLOCK | SOCK_CLOEXEC)};
#else
        OwnFd client_fd{::accept(server_fd.get(), &asGenericAddr(), &addr_len_)};
#endif
        if (client_fd.isValid())
        {
            return client_fd;
        }

        const int err = errno;
        switch (err)
        {
        case EAGAIN:
#if EAGAIN != EWOULDBLOCK
        case EWOULDBLOCK:
#endif
        {
            // Nothing is pending.
            return cetl::nullopt;
        }

        // Temporary network errors (vs permanent ones) - the peer is gone, but the listener is fine.
        //
        case EINTR:
        case ENETDOWN:
        case ETIMEDOUT:
        case EHOSTDOWN:
        case ENETUNREACH:
        case ECONNABORTED:
        case EHOSTUNREACH:
#ifdef EPROTO
        case EPROTO:
#endif
        {
            getLogger("io")->debug("Failed to accept connection; retrying (fd={}, err={}).", server_fd.get(), err);
            break;
        }

        default: {
            getLogger("io")->warn("Failed to accept connection (fd={}, err={}): {}.",
                                  server_fd.get(),
                                  err,
                                  std::strerror(err));
            return cetl::nullopt;
        }
        }  // switch err

    }  // while(true)
}

SocketAddress::ParseResult::Var SocketAddress::parse(const std::string& str, const std::uint16_t port_hint)
{
    if (auto result = tryParseAsUnixDomain(str))
    {
        return *result;
    }

    // `tcp://` scheme is optional.
    const std::string inet_str = startsWith(str, TcpPrefix) ? str.substr(std::strlen(TcpPrefix)) : str;

    std::string   host;
    std::uint16_t port   = port_hint;
    const int     family = extractFamilyHostAndPort(inet_str, host, port);
    if (family == AF_UNSPEC)
    {
        return EINVAL;
    }
    if (auto result = tryParseAsWildcard(host, port))
    {
        return *result;
    }
    if (host == "localhost")
    {
        host = "127.0.0.1";
    }

    SocketAddress result{};
    void*         addr_target = nullptr;
    if (family == AF_INET6)
    {
        auto& result_inet6       = result.asInet6Addr();
        result.addr_len_         = sizeof(result_inet6);
        result_inet6.sin6_family = AF_INET6;
        result_inet6.sin6_port   = htons(port);
        addr_target              = &result_inet6.sin6_addr;
    }
    else
    {
        auto& result_inet4      = result.asInetAddr();
        result.addr_len_        = sizeof(result_inet4);
        result_inet4.sin_family = AF_INET;
        result_inet4.sin_port   = htons(port);
        addr_target             = &result_inet4.sin_addr;
    }
    const int convert_result = ::inet_pton(family, host.c_str(), addr_target);
    switch (convert_result)
    {
    case 1: {
        return result;
    }
    case 0: {
        getLogger("io")->error("Unsupported address (addr='{}').", host);
        return EINVAL;
    }
    default: {
        const int err = errno;
        getLogger("io")->error("Failed to parse address (addr='{}'): {}", host, std::strerror(err));
        return err;
    }
    }
}

cetl::optional<SocketAddress::ParseResult::Var> SocketAddress::tryParseAsUnixDomain(const std::string& str)
{
    if (!startsWith(str, UnixPrefix))
    {
        return cetl::nullopt;
    }
    const auto path = str.substr(std::strlen(UnixPrefix));
    if (path.empty())
    {
        getLogger("io")->error("Unix domain path is empty.");
        return ParseResult::Var{EINVAL};
    }

    SocketAddress result{};
    auto&         result_un = result.asUnixAddr();
    result_un.sun_family    = AF_UNIX;

    // Reserve one byte for the null terminator.
    if ((path.size() + 1) > sizeof(result_un.sun_path))
    {
        getLogger("io")->error("Unix domain path is too long (path='{}').", str);
        return ParseResult::Var{EINVAL};
    }

    // NOLINTNEXTLINE(*-array-to-pointer-decay, *-no-array-decay)
    std::memcpy(result_un.sun_path, path.c_str(), path.size() + 1);

    result.addr_len_ = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size() + 1);
    return ParseResult::Var{result};
}

int SocketAddress::extractFamilyHostAndPort(const std::string& str, std::string& host, std::uint16_t& port)
{
    int         family = AF_INET;
    std::string port_part;

    if (0 == str.find_first_of('['))
    {
        // IPv6 starts with a bracket when with a port.
        family = AF_INET6;

        const auto end_bracket_pos = str.find_last_of(']');
        if (end_bracket_pos == std::string::npos)
        {
            getLogger("io")->error("Invalid IPv6 address; unclosed '[' (addr='{}').", str);
            return AF_UNSPEC;
        }
        host = str.substr(1, end_bracket_pos - 1);

        if (str.size() > end_bracket_pos + 1)
        {
            if (str[end_bracket_pos + 1] != ':')
            {
                getLogger("io")->error("Invalid IPv6 address; expected port suffix after ']' (addr='{}').", str);
                return AF_UNSPEC;
            }
            port_part = str.substr(end_bracket_pos + 2);
            if (port_part.empty())
            {
                getLogger("io")->error("Invalid IPv6 address; empty port after ']:' (addr='{}').", str);
                return AF_UNSPEC;
            }
        }
    }
    else
    {
        const auto colon_pos = str.find_first_of(':');
        if (colon_pos == std::string::npos)
        {
            host = str;
        }
        else if (str.find_first_of(':', colon_pos + 1) != std::string::npos)
        {
            // At least two colons and no brackets - a bare IPv6 address (without port).
            family = AF_INET6;
            host   = str;
        }
        else
        {
            host      = str.substr(0, colon_pos);
            port_part = str.substr(colon_pos + 1);
            if (port_part.empty())
            {
                getLogger("io")->error("Empty port number (addr='{}').", str);
                return AF_UNSPEC;
            }
        }
    }

    if (host.empty())
    {
        getLogger("io")->error("Empty host (addr='{}').", str);
        return AF_UNSPEC;
    }

    // Parse the port if any; otherwise keep untouched (hint).
    //
    if (!port_part.empty())
    {
        char*               end_ptr    = nullptr;
        const std::uint64_t maybe_port = std::strtoull(port_part.c_str(), &end_ptr, 10);
        if ((*end_ptr != '\0') || (port_part.front() == '-') || (port_part.front() == '+'))
        {
            getLogger("io")->error("Invalid port number (port='{}').", port_part);
            return AF_UNSPEC;
        }
        if (maybe_port > std::numeric_limits<std::uint16_t>::max())
        {
            getLogger("io")->error("Port number is too large (port={}).", maybe_port);
            return AF_UNSPEC;
        }
        port = static_cast<std::uint16_t>(maybe_port);
    }

    return family;
}

cetl::optional<SocketAddress::ParseResult::Success> SocketAddress::tryParseAsWildcard(const std::string&  host,
                                                                                      const std::uint16_t port)
{
    if (host != "*")
    {
        return cetl::nullopt;
    }

    SocketAddress result{};
    result.is_wildcard_    = true;
    auto& result_inet6     = result.asInet6Addr();
    result_inet6.sin6_port = htons(port);
    result.addr_len_       = sizeof(result_inet6);

    // IPv4 will be also enabled by IPV6_V6ONLY=0 (at `bind` method).
    result_inet6.sin6_family = AF_INET6;

    return result;
}

}  // namespace io
}  // namespace common
}  // namespace zfsx
