//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_HTTP_STATUS_HPP_INCLUDED
#define ZFSX_COMMON_HTTP_STATUS_HPP_INCLUDED

#include <cstdint>

namespace zfsx
{
namespace common
{
namespace http
{

/// HTTP status codes used by the daemon.
///
enum class Status : std::uint16_t
{
    Ok                          = 200,
    PartialContent              = 206,
    BadRequest                  = 400,
    NotFound                    = 404,
    MethodNotAllowed            = 405,
    PayloadTooLarge             = 413,
    RangeNotSatisfiable         = 416,
    RequestHeaderFieldsTooLarge = 431,
    InternalServerError         = 500,
    NotImplemented              = 501,
    ServiceUnavailable          = 503,
    HttpVersionNotSupported     = 505,

};  // Status

inline std::uint16_t toCode(const Status status) noexcept
{
    return static_cast<std::uint16_t>(status);
}

inline bool isClientError(const Status status) noexcept
{
    return (toCode(status) >= 400) && (toCode(status) < 500);  // NOLINT(*-magic-numbers)
}

/// Gets the standard reason phrase of the status (f.e. "Partial Content" for 206).
///
const char* reasonPhrase(const Status status) noexcept;

}  // namespace http
}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_HTTP_STATUS_HPP_INCLUDED
