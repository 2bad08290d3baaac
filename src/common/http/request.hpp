//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_HTTP_REQUEST_HPP_INCLUDED
#define ZFSX_COMMON_HTTP_REQUEST_HPP_INCLUDED

#include "headers.hpp"
#include "http_status.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <string>

namespace zfsx
{
namespace common
{
namespace http
{

struct Request final
{
    std::string method;
    std::string target;  ///< As received, f.e. `/api/pools/tank/zpl/path/a%20b?x=1`.
    std::string path;    ///< Target without the query (still percent-encoded).
    std::string query;
    int         version_minor{1};  ///< `0` for HTTP/1.0, `1` for HTTP/1.1
    Headers     headers;
    std::string body;

    /// Whether the connection should stay open after the response (HTTP/1.1 default, `Connection` header aware).
    ///
    bool keepAlive() const;

};  // Request

/// Incremental (re-entrant) parser of HTTP/1.x requests.
///
/// The parser is stateless: it is fed with all the bytes received so far, and reports how many of them
/// belong to the first complete request, so that pipelined requests could be parsed one after another.
///
class RequestParser final
{
public:
    struct Limits
    {
        std::size_t max_head_bytes;
        std::size_t max_body_bytes;
    };
    static constexpr Limits DefaultLimits{16UL * 1024UL, 64UL * 1024UL};  // NOLINT(*-magic-numbers)

    struct Result
    {
        struct Success
        {
            Request     request;
            std::size_t consumed;
        };
        struct Incomplete
        {};
        struct Failure
        {
            Status      status;
            std::string reason;
        };
        using Var = cetl::variant<Success, Incomplete, Failure>;
    };

    explicit RequestParser(const Limits limits = DefaultLimits)
        : limits_{limits}
    {
    }

    CETL_NODISCARD Result::Var parse(const std::string& buffer) const;

private:
    CETL_NODISCARD static cetl::optional<Result::Failure> parseRequestLine(const std::string& line, Request& request);
    CETL_NODISCARD static cetl::optional<Result::Failure> parseHeaderLine(const std::string& line, Request& request);

    Limits limits_;

};  // RequestParser

/// Decodes `%XX` escapes of a URL path (`+` is kept as is).
///
/// @return `nullopt` on a malformed escape or an embedded NUL character.
///
cetl::optional<std::string> percentDecode(const std::string& encoded);

}  // namespace http
}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_HTTP_REQUEST_HPP_INCLUDED
