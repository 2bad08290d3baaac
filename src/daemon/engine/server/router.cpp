//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "router.hpp"

#include "common_helpers.hpp"
#include "http/http_status.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "http_server.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

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

bool isParamSegment(const std::string& segment)
{
    return (segment.size() > 2) && (segment.front() == '{') && (segment.back() == '}');
}

bool isWildcardSegment(const std::string& segment)
{
    return isParamSegment(segment) && (segment[1] == '*');
}

std::string paramName(const std::string& segment)
{
    const std::size_t skip = isWildcardSegment(segment) ? 2 : 1;
    return segment.substr(skip, segment.size() - skip - 1);
}

}  // namespace

Router::Router(ErrorResponder error_responder)
    : error_responder_{std::move(error_responder)}
{
    CETL_DEBUG_ASSERT(error_responder_, "");
}

void Router::add(std::string method, const std::string& pattern, Handler handler)
{
    CETL_DEBUG_ASSERT(!pattern.empty() && (pattern.front() == '/'), "");
    CETL_DEBUG_ASSERT(handler, "");

    routes_.push_back({std::move(method), common::splitCleanPath(pattern), std::move(handler)});
}

cetl::optional<common::http::Response> Router::route(const common::http::Request& request,
                                                     const HttpServer::KeepGoing& keep_going) const
{
    using common::http::Status;

    std::vector<std::string> allowed_methods;
    for (const auto& route : routes_)
    {
        Params     params;
        const auto matched = match(route.segments, request.path, params);
        if (matched == Match::BadEncoding)
        {
            return error(Status::BadRequest, fmt::format("invalid percent-encoding in path '{}'", request.path));
        }
        if (matched == Match::None)
        {
            continue;
        }

        if (route.method == request.method)
        {
            return route.handler(request, params, keep_going);
        }
        if (std::find(allowed_methods.begin(), allowed_methods.end(), route.method) == allowed_methods.end())
        {
            allowed_methods.push_back(route.method);
        }
    }

    if (allowed_methods.empty())
    {
        return error(Status::NotFound, fmt::format("no route for '{}'", request.path));
    }

    auto response = error(Status::MethodNotAllowed,
                          fmt::format("method {} is not allowed for '{}'", request.method, request.path));
    std::string allow;
    for (const auto& method : allowed_methods)
    {
        allow += allow.empty() ? method : (", " + method);
    }
    response.headers.set("Allow", std::move(allow));
    return response;
}

Router::Match Router::match(const std::vector<std::string>& segments, const std::string& path, Params& params)
{
    if (path.empty() || (path.front() != '/'))
    {
        return Match::None;
    }

    // Matching runs on the raw path, so that encoded `/` (`%2F`) never splits a segment.
    std::size_t pos = 1;
    for (const auto& segment : segments)
    {
        if (pos > path.size())
        {
            return Match::None;
        }

        if (isWildcardSegment(segment))
        {
            const auto decoded = common::http::percentDecode(path.substr(pos));
            if (!decoded)
            {
                return Match::BadEncoding;
            }
            params[paramName(segment)] = *decoded;
            return Match::Matched;
        }

        auto next = path.find('/', pos);
        if (next == std::string::npos)
        {
            next = path.size();
        }
        const auto raw = path.substr(pos, next - pos);
        pos            = next + 1;

        if (!isParamSegment(segment))
        {
            if (raw != segment)
            {
                return Match::None;
            }
            continue;
        }

        if (raw.empty())
        {
            return Match::None;
        }
        const auto decoded = common::http::percentDecode(raw);
        if (!decoded)
        {
            return Match::BadEncoding;
        }
        params[paramName(segment)] = *decoded;
    }

    return (pos == (path.size() + 1)) ? Match::Matched : Match::None;
}

}  // namespace server
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
