//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_ZPL_EXPORT_RESPONSE_ASSEMBLER_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_ZPL_EXPORT_RESPONSE_ASSEMBLER_HPP_INCLUDED

#include "http/response.hpp"
#include "path_resolver.hpp"
#include "range_parser.hpp"

#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace zpl_export
{

/// Makes download file name safe for the `Content-Disposition` header.
///
/// Quotes, backslashes and slashes are replaced with `_`; an empty name becomes `download.bin`.
///
std::string sanitizeDownloadFilename(const std::string& raw);

/// Makes `200 OK` (or `206 Partial Content` for a partial range) response with the assembled bytes.
///
common::http::Response assembleFileResponse(const PathContext& context, const ByteRange& range, std::string bytes);

/// Makes `200 OK` response with empty body, for an empty file (regardless of any requested range).
///
common::http::Response assembleEmptyFileResponse(const PathContext& context);

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_ZPL_EXPORT_RESPONSE_ASSEMBLER_HPP_INCLUDED
