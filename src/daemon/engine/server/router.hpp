//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_SERVER_ROUTER_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_SERVER_ROUTER_HPP_INCLUDED

#include "http/http_status.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "http_server.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace server
{

/// Dispatches HTTP requests to handlers by method and path pattern.
///
/// Pattern segments are either literals, `{name}` (one non-empty path segment),
/// or a trailing `{*name}` (the rest of the path, including embedded `/`).
/// Captured values are percent-decoded.
///
class Router final
{
public:
    using Params = std::map<std::string, std::string>;
    using Handler =
        std::function<cetl::optional<common::http::Response>(const common::http::Request&,
                                                             const Params&,
                                                             const HttpServer::KeepGoing&)>;
    using ErrorResponder = std::function<common::http::Response(const common::http::Status, const std::string&)>;

    explicit Router(ErrorResponder error_responder);

    void add(std::string method, const std::string& pattern, Handler handler);

    /// Routes the request to its handler.
    ///
    /// Unknown paths give 404, known paths with other methods 405 (with `Allow` header),
    /// and paths with invalid percent-encoding 400.
    ///
    CETL_NODISCARD cetl::optional<common::http::Response> route(const common::http::Request& request,
                                                                const HttpServer::KeepGoing& keep_going) const;

    /// Makes a generic error response in the same format as the handlers use.
    ///
    common::http::Response error(const common::http::Status status, const std::string& message) const
    {
        return error_responder_(status, message);
    }

private:
    enum class Match
    {
        None,
        Matched,
        BadEncoding,
    };

    struct Route
    {
        std::string              method;
        std::vector<std::string> segments;
        Handler                  handler;
    };

    static Match match(const std::vector<std::string>& segments, const std::string& path, Params& params);

    const ErrorResponder error_responder_;
    std::vector<Route>   routes_;

};  // Router

}  // namespace server
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_SERVER_ROUTER_HPP_INCLUDED
