//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_HTTP_RESPONSE_HPP_INCLUDED
#define ZFSX_COMMON_HTTP_RESPONSE_HPP_INCLUDED

#include "headers.hpp"
#include "http_status.hpp"

#include <string>
#include <utility>

namespace zfsx
{
namespace common
{
namespace http
{

struct Response final
{
    Status      status{Status::Ok};
    Headers     headers;
    std::string body;

    /// Makes a response with `application/json` body.
    ///
    static Response json(const Status status, std::string json_body)
    {
        Response response;
        response.status = status;
        response.headers.set("Content-Type", "application/json");
        response.body = std::move(json_body);
        return response;
    }

    /// Serializes the status line and header fields, including the terminating empty line.
    ///
    /// `Content-Length` is derived from the body unless it is set explicitly.
    ///
    std::string serializeHead() const;

};  // Response

}  // namespace http
}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_HTTP_RESPONSE_HPP_INCLUDED
