//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_HTTP_MIME_HPP_INCLUDED
#define ZFSX_COMMON_HTTP_MIME_HPP_INCLUDED

#include <string>

namespace zfsx
{
namespace common
{
namespace http
{

/// Guesses the media type of a file by its name extension (case-insensitive).
///
/// @return `application/octet-stream` for unknown or missing extensions.
///
std::string guessMimeType(const std::string& file_name);

}  // namespace http
}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_HTTP_MIME_HPP_INCLUDED
