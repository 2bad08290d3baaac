//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "http/request.hpp"

#include "http/http_status.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace zfsx::common::http;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Eq;
using testing::Field;
using testing::IsFalse;
using testing::IsTrue;
using testing::Optional;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestRequestParser : public testing::Test
{
protected:
    using Result = RequestParser::Result;

    static Result::Success parseOk(const RequestParser& parser, const std::string& buffer)
    {
        auto result = parser.parse(buffer);
        EXPECT_THAT(result, VariantWith<Result::Success>(_)) << buffer;
        if (auto* const success = cetl::get_if<Result::Success>(&result))
        {
            return std::move(*success);
        }
        return Result::Success{Request{}, 0};
    }

    static testing::Matcher<const Result::Var&> failsWith(const Status status)
    {
        return VariantWith<Result::Failure>(Field(&Result::Failure::status, status));
    }
};

// MARK: - Tests:

TEST_F(TestRequestParser, simple_get)
{
    const RequestParser parser;
    const std::string   raw = "GET /api/pools/tank/zpl/path/a%20b?x=1 HTTP/1.1\r\n"
                              "Host: localhost\r\n"
                              "Range:  bytes=0-9 \r\n"
                              "\r\n";

    const auto success = parseOk(parser, raw);
    EXPECT_THAT(success.consumed, raw.size());

    const auto& request = success.request;
    EXPECT_THAT(request.method, "GET");
    EXPECT_THAT(request.target, "/api/pools/tank/zpl/path/a%20b?x=1");
    EXPECT_THAT(request.path, "/api/pools/tank/zpl/path/a%20b");
    EXPECT_THAT(request.query, "x=1");
    EXPECT_THAT(request.version_minor, 1);
    EXPECT_THAT(request.headers.size(), 2);
    EXPECT_THAT(request.headers.find("range"), Optional(std::string{"bytes=0-9"}));
    EXPECT_THAT(request.body, "");
    EXPECT_THAT(request.keepAlive(), IsTrue());
}

TEST_F(TestRequestParser, incremental_feeding)
{
    const RequestParser parser;
    const std::string   raw = "PUT /api/mode HTTP/1.1\r\n"
                              "Content-Length: 18\r\n"
                              "\r\n"
                              "{\"mode\":\"offline\"}";

    // Every strict prefix is incomplete.
    for (std::size_t size = 0; size < raw.size(); ++size)
    {
        EXPECT_THAT(parser.parse(raw.substr(0, size)), VariantWith<Result::Incomplete>(_)) << size;
    }

    const auto success = parseOk(parser, raw);
    EXPECT_THAT(success.consumed, raw.size());
    EXPECT_THAT(success.request.body, "{\"mode\":\"offline\"}");
}

TEST_F(TestRequestParser, pipelined_requests)
{
    const RequestParser parser;
    const std::string   first  = "GET /api/version HTTP/1.1\r\n\r\n";
    const std::string   second = "GET /api/mode HTTP/1.1\r\nConnection: close\r\n\r\n";

    const auto buffer = first + second;

    const auto success1 = parseOk(parser, buffer);
    EXPECT_THAT(success1.consumed, first.size());
    EXPECT_THAT(success1.request.path, "/api/version");
    EXPECT_THAT(success1.request.keepAlive(), IsTrue());

    const auto success2 = parseOk(parser, buffer.substr(success1.consumed));
    EXPECT_THAT(success2.consumed, second.size());
    EXPECT_THAT(success2.request.path, "/api/mode");
    EXPECT_THAT(success2.request.keepAlive(), IsFalse());
}

TEST_F(TestRequestParser, keep_alive)
{
    const RequestParser parser;

    EXPECT_THAT(parseOk(parser, "GET / HTTP/1.0\r\n\r\n").request.keepAlive(), IsFalse());
    EXPECT_THAT(parseOk(parser, "GET / HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n").request.keepAlive(), IsTrue());
    EXPECT_THAT(parseOk(parser, "GET / HTTP/1.1\r\n\r\n").request.keepAlive(), IsTrue());
    EXPECT_THAT(parseOk(parser, "GET / HTTP/1.1\r\nconnection: CLOSE\r\n\r\n").request.keepAlive(), IsFalse());
}

TEST_F(TestRequestParser, malformed_requests)
{
    const RequestParser parser;

    EXPECT_THAT(parser.parse("\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET /\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("G(T / HTTP/1.1\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET api HTTP/1.1\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET / a HTTP/1.1\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET / FTP/1.1\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET / HTTP/2.0\r\n\r\n"), failsWith(Status::HttpVersionNotSupported));
    EXPECT_THAT(parser.parse("GET / HTTP/1.1\r\nNoColon\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET / HTTP/1.1\r\nBad Name: x\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET / HTTP/1.1\r\nA: x\r\n  folded\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET / HTTP/1.1\r\nContent-Length: -1\r\n\r\n"), failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("GET / HTTP/1.1\r\nContent-Length: 99999999999999999999999\r\n\r\n"),
                failsWith(Status::BadRequest));
    EXPECT_THAT(parser.parse("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"),
                failsWith(Status::NotImplemented));
}

TEST_F(TestRequestParser, limits)
{
    const RequestParser parser{RequestParser::Limits{64, 8}};

    // Too large head, both with and without its terminator.
    EXPECT_THAT(parser.parse("GET /" + std::string(100, 'a')), failsWith(Status::RequestHeaderFieldsTooLarge));
    EXPECT_THAT(parser.parse("GET /" + std::string(100, 'a') + " HTTP/1.1\r\n\r\n"),
                failsWith(Status::RequestHeaderFieldsTooLarge));

    // The body limit is checked against the declared length, before the body arrives.
    EXPECT_THAT(parser.parse("PUT / HTTP/1.1\r\nContent-Length: 9\r\n\r\n"), failsWith(Status::PayloadTooLarge));
    EXPECT_THAT(parser.parse("PUT / HTTP/1.1\r\nContent-Length: 8\r\n\r\n12345678"),
                VariantWith<Result::Success>(_));
}

TEST_F(TestRequestParser, percent_decode)
{
    EXPECT_THAT(percentDecode(""), Optional(std::string{}));
    EXPECT_THAT(percentDecode("plain/path"), Optional(std::string{"plain/path"}));
    EXPECT_THAT(percentDecode("a%20b+c"), Optional(std::string{"a b+c"}));
    EXPECT_THAT(percentDecode("%2Fetc%2fpasswd"), Optional(std::string{"/etc/passwd"}));
    EXPECT_THAT(percentDecode("%C3%A9t%C3%A9"), Optional(std::string{"\xC3\xA9t\xC3\xA9"}));

    EXPECT_THAT(percentDecode("%"), Eq(cetl::nullopt));
    EXPECT_THAT(percentDecode("abc%4"), Eq(cetl::nullopt));
    EXPECT_THAT(percentDecode("%zz"), Eq(cetl::nullopt));
    EXPECT_THAT(percentDecode("a%00b"), Eq(cetl::nullopt));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
