//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "server/http_server.hpp"

#include "http/http_status.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "io/io.hpp"
#include "io/poller.hpp"
#include "io/socket_address.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace
{

using namespace zfsx::daemon::engine::server;  // NOLINT This our main concern here in the unit tests.
using zfsx::common::http::Request;
using zfsx::common::http::Response;
using zfsx::common::http::Status;
using zfsx::common::io::OwnFd;
using zfsx::common::io::Poller;
using zfsx::common::io::SocketAddress;

using testing::_;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::Not;
using testing::StartsWith;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestHttpServer : public testing::Test
{
protected:
    void SetUp() override
    {
        auto maybe_poller = Poller::make();
        ASSERT_THAT(maybe_poller, VariantWith<Poller::Ptr>(_));
        poller_ = std::move(cetl::get<Poller::Ptr>(maybe_poller));

        socket_path_ = "/tmp/zfsx_test_http_server_" + std::to_string(::getpid()) + ".sock";
        auto maybe_address = SocketAddress::parse("unix:" + socket_path_, 0);
        ASSERT_THAT(maybe_address, VariantWith<SocketAddress>(_));
        address_ = cetl::get<SocketAddress>(maybe_address);
    }

    void TearDown() override
    {
        server_.reset();
        (void) ::unlink(socket_path_.c_str());
    }

    void startServer()
    {
        HttpServer::Handlers handlers;
        handlers.on_request = [this](const Request& request, const HttpServer::KeepGoing& keep_going) {
            //
            targets_.push_back(request.target);
            if (request.path == "/abandon")
            {
                return cetl::optional<Response>{};
            }
            const bool is_peer_connected = keep_going();
            return cetl::optional<Response>{
                Response::json(Status::Ok, is_peer_connected ? "{\"ok\":true}" : "{\"ok\":false}")};
        };
        handlers.on_malformed = [](const Status status, const std::string& reason) {
            //
            return Response::json(status, "{\"error\":\"" + reason + "\"}");
        };

        server_ = std::make_unique<HttpServer>(*poller_, address_, std::move(handlers));
        ASSERT_THAT(server_->start(), 0);
    }

    OwnFd connectClient() const
    {
        auto maybe_fd = address_.socket(SOCK_STREAM);
        EXPECT_THAT(maybe_fd, VariantWith<SocketAddress::SocketResult::Success>(_));
        auto client_fd = std::move(cetl::get<SocketAddress::SocketResult::Success>(maybe_fd));
        EXPECT_THAT(address_.connect(client_fd), 0);
        return client_fd;
    }

    static void sendAll(const OwnFd& fd, const std::string& data)
    {
        ASSERT_THAT(::send(fd.get(), data.data(), data.size(), MSG_NOSIGNAL), static_cast<ssize_t>(data.size()));
    }

    /// Drains whatever is available at the client side; returns `true` on end of stream.
    ///
    static bool receiveAvailable(const OwnFd& fd, std::string& received)
    {
        std::array<char, 1024> buffer{};
        while (true)
        {
            const auto bytes = ::recv(fd.get(), buffer.data(), buffer.size(), MSG_DONTWAIT);
            if (bytes > 0)
            {
                received.append(buffer.data(), static_cast<std::size_t>(bytes));
                continue;
            }
            return bytes == 0;
        }
    }

    /// Runs the poller until the condition is met (or the attempts are exhausted).
    ///
    bool spinUntil(const std::function<bool()>& condition)
    {
        for (int attempt = 0; attempt < 200; ++attempt)
        {
            if (condition())
            {
                return true;
            }
            EXPECT_THAT(poller_->pollFor(std::chrono::milliseconds{5}), 0);
        }
        return condition();
    }

    static std::size_t countOf(const std::string& text, const std::string& needle)
    {
        std::size_t count = 0;
        for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size()))
        {
            ++count;
        }
        return count;
    }

    // MARK: Data members:

    // NOLINTBEGIN
    Poller::Ptr                 poller_;
    std::string                 socket_path_;
    SocketAddress               address_;
    std::unique_ptr<HttpServer> server_;
    std::vector<std::string>    targets_;
    // NOLINTEND

};  // TestHttpServer

// MARK: - Tests:

TEST_F(TestHttpServer, serves_request_and_keeps_connection)
{
    startServer();
    const auto client = connectClient();
    EXPECT_TRUE(spinUntil([this] { return server_->clientsCount() == 1; }));

    sendAll(client, "GET /api/version?x=1 HTTP/1.1\r\nHost: localhost\r\n\r\n");

    std::string received;
    EXPECT_TRUE(spinUntil([&] {
        //
        (void) receiveAvailable(client, received);
        return received.find("{\"ok\":true}") != std::string::npos;
    }));
    EXPECT_THAT(received, StartsWith("HTTP/1.1 200 OK\r\n"));
    EXPECT_THAT(received, HasSubstr("Content-Length: 11\r\n"));
    EXPECT_THAT(received, Not(HasSubstr("Connection: close")));
    EXPECT_THAT(targets_, ElementsAre("/api/version?x=1"));
    EXPECT_THAT(server_->clientsCount(), 1U);
}

TEST_F(TestHttpServer, pipelined_requests_are_answered_in_order)
{
    startServer();
    const auto client = connectClient();

    sendAll(client,
            "GET /first HTTP/1.1\r\n\r\n"
            "GET /second HTTP/1.1\r\nConnection: close\r\n\r\n");

    std::string received;
    bool        is_end_of_stream = false;
    EXPECT_TRUE(spinUntil([&] {
        //
        is_end_of_stream = receiveAvailable(client, received);
        return is_end_of_stream;
    }));
    EXPECT_THAT(countOf(received, "HTTP/1.1 200 OK\r\n"), 2U);
    EXPECT_THAT(received, HasSubstr("Connection: close\r\n"));
    EXPECT_THAT(targets_, ElementsAre("/first", "/second"));
    EXPECT_TRUE(spinUntil([this] { return server_->clientsCount() == 0; }));
}

TEST_F(TestHttpServer, malformed_request_closes_connection)
{
    startServer();
    const auto client = connectClient();

    sendAll(client, "GARBAGE\r\n\r\nGET /never HTTP/1.1\r\n\r\n");

    std::string received;
    EXPECT_TRUE(spinUntil([&] { return receiveAvailable(client, received); }));
    EXPECT_THAT(received, StartsWith("HTTP/1.1 400 Bad Request\r\n"));
    EXPECT_THAT(received, HasSubstr("Connection: close\r\n"));
    EXPECT_THAT(received, HasSubstr("malformed request line"));
    EXPECT_THAT(targets_, IsEmpty());
}

TEST_F(TestHttpServer, abandoned_request_closes_connection_silently)
{
    startServer();
    const auto client = connectClient();

    sendAll(client, "GET /abandon HTTP/1.1\r\n\r\n");

    std::string received;
    EXPECT_TRUE(spinUntil([&] { return receiveAvailable(client, received); }));
    EXPECT_THAT(received, IsEmpty());
    EXPECT_THAT(targets_, ElementsAre("/abandon"));
    EXPECT_THAT(server_->clientsCount(), 0U);
}

TEST_F(TestHttpServer, half_closed_client_is_still_served)
{
    startServer();
    const auto client = connectClient();

    sendAll(client, "GET /last HTTP/1.1\r\n\r\n");
    ASSERT_THAT(::shutdown(client.get(), SHUT_WR), 0);

    std::string received;
    EXPECT_TRUE(spinUntil([&] { return receiveAvailable(client, received); }));
    EXPECT_THAT(received, StartsWith("HTTP/1.1 200 OK\r\n"));
    EXPECT_THAT(received, HasSubstr("{\"ok\":true}"));
    EXPECT_THAT(targets_, ElementsAre("/last"));
    EXPECT_TRUE(spinUntil([this] { return server_->clientsCount() == 0; }));
}

TEST_F(TestHttpServer, disconnected_clients_are_forgotten)
{
    startServer();
    {
        const auto client1 = connectClient();
        const auto client2 = connectClient();
        EXPECT_TRUE(spinUntil([this] { return server_->clientsCount() == 2; }));
    }
    EXPECT_TRUE(spinUntil([this] { return server_->clientsCount() == 0; }));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
