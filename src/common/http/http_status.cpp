//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "http_status.hpp"

namespace zfsx
{
namespace common
{
namespace http
{

const char* reasonPhrase(const Status status) noexcept
{
    switch (status)
    {
    case Status::Ok:
        return "OK";
    case Status::PartialContent:
        return "Partial Content";
    case Status::BadRequest:
        return "Bad Request";
    case Status::NotFound:
        return "Not Found";
    case Status::MethodNotAllowed:
        return "Method Not Allowed";
    case Status::PayloadTooLarge:
        return "Payload Too Large";
    case Status::RangeNotSatisfiable:
        return "Range Not Satisfiable";
    case Status::RequestHeaderFieldsTooLarge:
        return "Request Header Fields Too Large";
    case Status::InternalServerError:
        return "Internal Server Error";
    case Status::NotImplemented:
        return "Not Implemented";
    case Status::ServiceUnavailable:
        return "Service Unavailable";
    case Status::HttpVersionNotSupported:
        return "HTTP Version Not Supported";
    }
    return "Unknown";
}

}  // namespace http
}  // namespace common
}  // namespace zfsx
