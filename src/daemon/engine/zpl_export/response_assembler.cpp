//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "response_assembler.hpp"

#include "http/headers.hpp"
#include "http/http_status.hpp"
#include "http/mime.hpp"
#include "http/response.hpp"
#include "path_resolver.hpp"
#include "range_parser.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace zpl_export
{
namespace
{

using common::http::Headers;

void setFieldOr(Headers& headers, const std::string& name, std::string value, const char* const fallback)
{
    headers.set(name, Headers::isValidValue(value) ? std::move(value) : std::string{fallback});
}

/// Sets the fields which are common for empty and non-empty file responses.
///
void setFileFields(Headers& headers, const PathContext& context, const std::size_t content_length)
{
    const auto filename = sanitizeDownloadFilename(context.filename);

    headers.set("Accept-Ranges", "bytes");
    headers.set("Content-Type", common::http::guessMimeType(filename));
    headers.set("Content-Length", std::to_string(content_length));
    setFieldOr(headers, "Content-Disposition", fmt::format("attachment; filename=\"{}\"", filename), "attachment");
    setFieldOr(headers, "X-ZFS-Dataset", context.dataset_name, "unknown");
    setFieldOr(headers, "X-ZFS-Relpath", context.rel_path, "/");
}

}  // namespace

std::string sanitizeDownloadFilename(const std::string& raw)
{
    std::string cleaned{raw};
    std::replace_if(
        cleaned.begin(),
        cleaned.end(),
        [](const char ch) {
            //
            return (ch == '"') || (ch == '\\') || (ch == '/');
        },
        '_');
    return cleaned.empty() ? std::string{"download.bin"} : cleaned;
}

common::http::Response assembleFileResponse(const PathContext& context, const ByteRange& range, std::string bytes)
{
    common::http::Response response;
    response.status = range.partial ? common::http::Status::PartialContent : common::http::Status::Ok;
    setFileFields(response.headers, context, bytes.size());
    if (range.partial)
    {
        response.headers.set("Content-Range", fmt::format("bytes {}-{}/{}", range.start, range.end, context.file_size));
    }
    response.body = std::move(bytes);
    return response;
}

common::http::Response assembleEmptyFileResponse(const PathContext& context)
{
    common::http::Response response;
    response.status = common::http::Status::Ok;
    setFileFields(response.headers, context, 0);
    return response;
}

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
