//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "request.hpp"

#include "common_helpers.hpp"
#include "headers.hpp"
#include "http_status.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace zfsx
{
namespace common
{
namespace http
{
namespace
{

constexpr const char* HeadTerminator = "\r\n\r\n";
constexpr const char* LineTerminator = "\r\n";

bool isTokenChar(const unsigned char ch)
{
    // RFC 9110 `tchar`.
    return (std::isalnum(ch) != 0) || (std::string{"!#$%&'*+-.^_`|~"}.find(static_cast<char>(ch)) != std::string::npos);
}

bool isToken(const std::string& str)
{
    return !str.empty() && std::all_of(str.begin(), str.end(), [](const char ch) {
        //
        return isTokenChar(static_cast<unsigned char>(ch));
    });
}

int hexValue(const char ch)
{
    if ((ch >= '0') && (ch <= '9'))
    {
        return ch - '0';
    }
    if ((ch >= 'a') && (ch <= 'f'))
    {
        return ch - 'a' + 10;  // NOLINT(*-magic-numbers)
    }
    if ((ch >= 'A') && (ch <= 'F'))
    {
        return ch - 'A' + 10;  // NOLINT(*-magic-numbers)
    }
    return -1;
}

cetl::optional<std::size_t> parseContentLength(const std::string& value)
{
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](const unsigned char ch) {
            //
            return std::isdigit(ch) != 0;
        }))
    {
        return cetl::nullopt;
    }

    std::size_t result = 0;
    for (const char ch : value)
    {
        const auto digit = static_cast<std::size_t>(ch - '0');
        if (result > ((std::numeric_limits<std::size_t>::max() - digit) / 10))  // NOLINT(*-magic-numbers)
        {
            return cetl::nullopt;
        }
        result = (result * 10) + digit;  // NOLINT(*-magic-numbers)
    }
    return result;
}

}  // namespace

constexpr RequestParser::Limits RequestParser::DefaultLimits;

bool Request::keepAlive() const
{
    const auto connection = headers.find("Connection");
    if (connection)
    {
        const auto value = toLowerAscii(trimWhitespace(*connection));
        if (value == "close")
        {
            return false;
        }
        if (value == "keep-alive")
        {
            return true;
        }
    }
    return version_minor >= 1;
}

RequestParser::Result::Var RequestParser::parse(const std::string& buffer) const
{
    const auto head_end = buffer.find(HeadTerminator);
    if (head_end == std::string::npos)
    {
        if (buffer.size() > limits_.max_head_bytes)
        {
            return Result::Failure{Status::RequestHeaderFieldsTooLarge, "request head is too large"};
        }
        return Result::Incomplete{};
    }
    if (head_end > limits_.max_head_bytes)
    {
        return Result::Failure{Status::RequestHeaderFieldsTooLarge, "request head is too large"};
    }

    Request     request;
    std::size_t line_begin = 0;
    bool        is_first   = true;
    while (line_begin < head_end)
    {
        auto line_end = buffer.find(LineTerminator, line_begin);
        if ((line_end == std::string::npos) || (line_end > head_end))
        {
            line_end = head_end;
        }
        const auto line = buffer.substr(line_begin, line_end - line_begin);
        line_begin      = line_end + 2;

        const auto failure = is_first ? parseRequestLine(line, request) : parseHeaderLine(line, request);
        if (failure)
        {
            return *failure;
        }
        is_first = false;
    }
    if (is_first)
    {
        return Result::Failure{Status::BadRequest, "empty request line"};
    }

    if (request.headers.contains("Transfer-Encoding"))
    {
        return Result::Failure{Status::NotImplemented, "transfer codings are not supported"};
    }

    std::size_t body_size = 0;
    if (const auto content_length = request.headers.find("Content-Length"))
    {
        const auto maybe_size = parseContentLength(trimWhitespace(*content_length));
        if (!maybe_size)
        {
            return Result::Failure{Status::BadRequest, "invalid Content-Length"};
        }
        body_size = *maybe_size;
    }
    if (body_size > limits_.max_body_bytes)
    {
        return Result::Failure{Status::PayloadTooLarge, "request body is too large"};
    }

    const std::size_t body_begin = head_end + std::char_traits<char>::length(HeadTerminator);
    if ((buffer.size() - body_begin) < body_size)
    {
        return Result::Incomplete{};
    }
    request.body = buffer.substr(body_begin, body_size);

    return Result::Success{std::move(request), body_begin + body_size};
}

cetl::optional<RequestParser::Result::Failure> RequestParser::parseRequestLine(const std::string& line,
                                                                               Request&           request)
{
    const auto first_space = line.find(' ');
    const auto last_space  = line.rfind(' ');
    if ((first_space == std::string::npos) || (first_space == last_space))
    {
        return Result::Failure{Status::BadRequest, "malformed request line"};
    }

    request.method = line.substr(0, first_space);
    request.target = line.substr(first_space + 1, last_space - first_space - 1);
    const auto version = line.substr(last_space + 1);

    if (!isToken(request.method))
    {
        return Result::Failure{Status::BadRequest, "malformed request method"};
    }
    if (request.target.empty() || (request.target.front() != '/') ||
        (request.target.find_first_of(" \t#") != std::string::npos))
    {
        return Result::Failure{Status::BadRequest, "malformed request target"};
    }

    if (version == "HTTP/1.1")
    {
        request.version_minor = 1;
    }
    else if (version == "HTTP/1.0")
    {
        request.version_minor = 0;
    }
    else if (startsWith(version, "HTTP/"))
    {
        return Result::Failure{Status::HttpVersionNotSupported, "unsupported HTTP version"};
    }
    else
    {
        return Result::Failure{Status::BadRequest, "malformed HTTP version"};
    }

    const auto query_pos = request.target.find('?');
    request.path         = request.target.substr(0, query_pos);
    if (query_pos != std::string::npos)
    {
        request.query = request.target.substr(query_pos + 1);
    }
    return cetl::nullopt;
}

cetl::optional<RequestParser::Result::Failure> RequestParser::parseHeaderLine(const std::string& line,
                                                                              Request&           request)
{
    if (!line.empty() && ((line.front() == ' ') || (line.front() == '\t')))
    {
        return Result::Failure{Status::BadRequest, "obsolete header line folding"};
    }

    const auto colon_pos = line.find(':');
    if (colon_pos == std::string::npos)
    {
        return Result::Failure{Status::BadRequest, "malformed header field"};
    }
    auto name = line.substr(0, colon_pos);
    if (!isToken(name))
    {
        return Result::Failure{Status::BadRequest, "malformed header field name"};
    }

    request.headers.add(std::move(name), trimWhitespace(line.substr(colon_pos + 1)));
    return cetl::nullopt;
}

cetl::optional<std::string> percentDecode(const std::string& encoded)
{
    std::string decoded;
    decoded.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i)
    {
        const char ch = encoded[i];
        if (ch != '%')
        {
            decoded.push_back(ch);
            continue;
        }

        if ((i + 2) >= encoded.size())
        {
            return cetl::nullopt;
        }
        const int high = hexValue(encoded[i + 1]);
        const int low  = hexValue(encoded[i + 2]);
        if ((high < 0) || (low < 0))
        {
            return cetl::nullopt;
        }
        const auto byte = static_cast<char>((high << 4) | low);  // NOLINT(*-magic-numbers, *-signed-bitwise)
        if (byte == '\0')
        {
            return cetl::nullopt;
        }
        decoded.push_back(byte);
        i += 2;
    }
    return decoded;
}

}  // namespace http
}  // namespace common
}  // namespace zfsx
