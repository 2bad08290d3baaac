//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "http/response.hpp"

#include "http/headers.hpp"
#include "http/http_status.hpp"
#include "http/mime.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace zfsx::common::http;  // NOLINT This our main concern here in the unit tests.

using testing::Eq;
using testing::IsFalse;
using testing::IsTrue;
using testing::Optional;
using testing::StrEq;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestResponse : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestResponse, headers_lookup_is_case_insensitive)
{
    Headers headers;
    headers.add("Content-Type", "text/plain");
    headers.add("X-Test", "first");
    headers.add("x-test", "second");

    EXPECT_THAT(headers.size(), 3);
    EXPECT_THAT(headers.find("content-type"), Optional(std::string{"text/plain"}));
    EXPECT_THAT(headers.find("X-TEST"), Optional(std::string{"first"}));
    EXPECT_THAT(headers.find("Range"), Eq(cetl::nullopt));
    EXPECT_THAT(headers.contains("CONTENT-TYPE"), IsTrue());

    headers.set("x-TEST", "replaced");
    EXPECT_THAT(headers.size(), 3);
    EXPECT_THAT(headers.find("X-Test"), Optional(std::string{"replaced"}));

    headers.set("Accept-Ranges", "bytes");
    EXPECT_THAT(headers.size(), 4);
}

TEST_F(TestResponse, header_value_validity)
{
    EXPECT_THAT(Headers::isValidValue(""), IsTrue());
    EXPECT_THAT(Headers::isValidValue("attachment; filename=\"a b.txt\""), IsTrue());
    EXPECT_THAT(Headers::isValidValue("tab\tseparated"), IsTrue());
    EXPECT_THAT(Headers::isValidValue("\xC3\xA9"), IsTrue());

    EXPECT_THAT(Headers::isValidValue("line\r\nInjected: yes"), IsFalse());
    EXPECT_THAT(Headers::isValidValue(std::string{"nul\0byte", 8}), IsFalse());
    EXPECT_THAT(Headers::isValidValue("del\x7F"), IsFalse());
}

TEST_F(TestResponse, serialize_head)
{
    auto response = Response::json(Status::NotFound, R"({"error":"x"})");
    response.headers.add("Connection", "close");

    EXPECT_THAT(response.serializeHead(),
                StrEq("HTTP/1.1 404 Not Found\r\n"
                      "Content-Type: application/json\r\n"
                      "Connection: close\r\n"
                      "Content-Length: 13\r\n"
                      "\r\n"));
}

TEST_F(TestResponse, serialize_head_with_explicit_length)
{
    Response response;
    response.status = Status::PartialContent;
    response.headers.add("Content-Range", "bytes 0-9/100");
    response.headers.add("Content-Length", "10");

    EXPECT_THAT(response.serializeHead(),
                StrEq("HTTP/1.1 206 Partial Content\r\n"
                      "Content-Range: bytes 0-9/100\r\n"
                      "Content-Length: 10\r\n"
                      "\r\n"));
}

TEST_F(TestResponse, status_helpers)
{
    EXPECT_THAT(toCode(Status::RangeNotSatisfiable), 416);
    EXPECT_THAT(isClientError(Status::BadRequest), IsTrue());
    EXPECT_THAT(isClientError(Status::RequestHeaderFieldsTooLarge), IsTrue());
    EXPECT_THAT(isClientError(Status::Ok), IsFalse());
    EXPECT_THAT(isClientError(Status::InternalServerError), IsFalse());

    EXPECT_THAT(reasonPhrase(Status::Ok), StrEq("OK"));
    EXPECT_THAT(reasonPhrase(Status::RangeNotSatisfiable), StrEq("Range Not Satisfiable"));
    EXPECT_THAT(reasonPhrase(Status::MethodNotAllowed), StrEq("Method Not Allowed"));
}

TEST_F(TestResponse, guess_mime_type)
{
    EXPECT_THAT(guessMimeType("notes.txt"), "text/plain");
    EXPECT_THAT(guessMimeType("dir/Photo.JPG"), "image/jpeg");
    EXPECT_THAT(guessMimeType("archive.tar.gz"), "application/gzip");
    EXPECT_THAT(guessMimeType("data.json"), "application/json");

    EXPECT_THAT(guessMimeType("Makefile"), "application/octet-stream");
    EXPECT_THAT(guessMimeType("trailing."), "application/octet-stream");
    EXPECT_THAT(guessMimeType("some.dir/file"), "application/octet-stream");
    EXPECT_THAT(guessMimeType("file.unknownext"), "application/octet-stream");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
