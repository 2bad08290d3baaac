//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io/socket_address.hpp"

#include "io/io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace
{

using namespace zfsx::common::io;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::ElementsAre;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSocketAddress : public testing::Test
{
protected:
    using Result = SocketAddress::ParseResult;

    static SocketAddress parseOk(const std::string& str, const std::uint16_t port_hint)
    {
        auto maybe_address = SocketAddress::parse(str, port_hint);
        EXPECT_THAT(maybe_address, VariantWith<Result::Success>(_)) << str;
        if (const auto* const address = cetl::get_if<Result::Success>(&maybe_address))
        {
            return *address;
        }
        return SocketAddress{};
    }

    static const sockaddr_in& asInet(const SocketAddress& address)
    {
        return *reinterpret_cast<const sockaddr_in*>(address.getRaw().first);  // NOLINT
    }

    static const sockaddr_in6& asInet6(const SocketAddress& address)
    {
        return *reinterpret_cast<const sockaddr_in6*>(address.getRaw().first);  // NOLINT
    }
};

// MARK: - Tests:

TEST_F(TestSocketAddress, parse_unix_domain)
{
    const std::string test_path = "/tmp/zfsxd.sock";

    const auto address = parseOk("unix:" + test_path, 0);
    EXPECT_TRUE(address.isUnix());
    EXPECT_FALSE(address.isAnyInet());
    EXPECT_THAT(address.toString(), "unix:" + test_path);

    const auto* const addr_un = reinterpret_cast<const sockaddr_un*>(address.getRaw().first);  // NOLINT
    EXPECT_THAT(addr_un->sun_family, AF_UNIX);
    EXPECT_THAT(addr_un->sun_path, test_path);

    // The longest path which still leaves room for the null terminator.
    constexpr auto MaxPath = sizeof(sockaddr_un::sun_path);
    EXPECT_THAT(SocketAddress::parse("unix:" + std::string(MaxPath - 1, 'x'), 0), VariantWith<Result::Success>(_));
    EXPECT_THAT(SocketAddress::parse("unix:" + std::string(MaxPath, 'x'), 0), VariantWith<Result::Failure>(EINVAL));

    EXPECT_THAT(SocketAddress::parse("unix:", 0), VariantWith<Result::Failure>(EINVAL));
}

TEST_F(TestSocketAddress, parse_ipv4)
{
    {
        const auto address = parseOk("127.0.0.1", 9000);
        EXPECT_FALSE(address.isUnix());
        EXPECT_TRUE(address.isAnyInet());
        EXPECT_THAT(asInet(address).sin_family, AF_INET);
        EXPECT_THAT(ntohs(asInet(address).sin_port), 9000);
        EXPECT_THAT(ntohl(asInet(address).sin_addr.s_addr), 0x7F000001);
        EXPECT_THAT(address.toString(), "127.0.0.1:9000");
    }

    // The `tcp://` scheme and explicit port.
    {
        const auto address = parseOk("tcp://192.168.1.123:8080", 80);
        EXPECT_THAT(ntohs(asInet(address).sin_port), 8080);
        EXPECT_THAT(ntohl(asInet(address).sin_addr.s_addr), 0xC0A8017B);
    }

    // `localhost` is the IPv4 loopback.
    {
        const auto address = parseOk("localhost:9001", 80);
        EXPECT_THAT(address.toString(), "127.0.0.1:9001");
    }

    EXPECT_THAT(SocketAddress::parse("127.0.0.256", 80), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("example.com", 80), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("127.0.0.1:", 80), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("127.0.0.1:-1", 80), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("127.0.0.1:65536", 80), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse(":80", 80), VariantWith<Result::Failure>(EINVAL));
}

TEST_F(TestSocketAddress, parse_ipv6)
{
    {
        const auto address = parseOk("::1", 0x1234);
        EXPECT_TRUE(address.isAnyInet());
        EXPECT_THAT(asInet6(address).sin6_family, AF_INET6);
        EXPECT_THAT(ntohs(asInet6(address).sin6_port), 0x1234);
        EXPECT_THAT(asInet6(address).sin6_addr.s6_addr, ElementsAre(0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1));
    }

    {
        const auto address = parseOk("[2001:db8::1]:8080", 0);
        EXPECT_THAT(ntohs(asInet6(address).sin6_port), 8080);
        EXPECT_THAT(asInet6(address).sin6_addr.s6_addr,
                    ElementsAre(0x20, 0x01, 0x0D, 0xB8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1));
        EXPECT_THAT(address.toString(), "[2001:db8::1]:8080");
    }

    EXPECT_THAT(SocketAddress::parse("[::1", 0), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1]8080", 0), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1]:", 0), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1]:80_80", 0), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1]:65536", 0), VariantWith<Result::Failure>(EINVAL));
}

TEST_F(TestSocketAddress, parse_wildcard)
{
    {
        const auto address = parseOk("*", 9000);
        EXPECT_TRUE(address.isAnyInet());
        EXPECT_THAT(asInet6(address).sin6_family, AF_INET6);
        EXPECT_THAT(ntohs(asInet6(address).sin6_port), 9000);
        EXPECT_THAT(asInet6(address).sin6_addr.s6_addr, ElementsAre(0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0));
        EXPECT_THAT(address.toString(), "*:9000");
    }
    {
        const auto address = parseOk("tcp://*:8080", 9000);
        EXPECT_THAT(ntohs(asInet6(address).sin6_port), 8080);
    }
}

TEST_F(TestSocketAddress, unix_domain_listen_connect_accept)
{
    const std::string path    = "/tmp/zfsx_test_socket_address_" + std::to_string(::getpid()) + ".sock";
    const auto        address = parseOk("unix:" + path, 0);

    auto maybe_server_fd = address.socket(SOCK_STREAM);
    ASSERT_THAT(maybe_server_fd, VariantWith<SocketAddress::SocketResult::Success>(_));
    const auto server_fd = std::move(cetl::get<SocketAddress::SocketResult::Success>(maybe_server_fd));
    ASSERT_THAT(address.bind(server_fd), 0);
    ASSERT_THAT(address.listen(server_fd, 4), 0);

    // Nothing is pending yet.
    SocketAddress peer_address;
    EXPECT_FALSE(peer_address.accept(server_fd).has_value());

    auto maybe_client_fd = address.socket(SOCK_STREAM);
    ASSERT_THAT(maybe_client_fd, VariantWith<SocketAddress::SocketResult::Success>(_));
    const auto client_fd = std::move(cetl::get<SocketAddress::SocketResult::Success>(maybe_client_fd));
    ASSERT_THAT(address.connect(client_fd), 0);

    const auto accepted_fd = peer_address.accept(server_fd);
    ASSERT_TRUE(accepted_fd.has_value());
    EXPECT_TRUE(accepted_fd->isValid());
    EXPECT_TRUE(peer_address.isUnix());

    // A stale socket file doesn't prevent binding again.
    {
        auto maybe_other_fd = address.socket(SOCK_STREAM);
        ASSERT_THAT(maybe_other_fd, VariantWith<SocketAddress::SocketResult::Success>(_));
        const auto other_fd = std::move(cetl::get<SocketAddress::SocketResult::Success>(maybe_other_fd));
        EXPECT_THAT(address.bind(other_fd), 0);
    }

    (void) ::unlink(path.c_str());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
