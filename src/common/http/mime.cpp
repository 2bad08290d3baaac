//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mime.hpp"

#include "common_helpers.hpp"

#include <string>
#include <unordered_map>

namespace zfsx
{
namespace common
{
namespace http
{
namespace
{

using MimeMap = std::unordered_map<std::string, std::string>;

const MimeMap& extensionToMime()
{
    static const MimeMap instance{
        {"txt", "text/plain"},
        {"log", "text/plain"},
        {"conf", "text/plain"},
        {"cfg", "text/plain"},
        {"ini", "text/plain"},
        {"md", "text/markdown"},
        {"csv", "text/csv"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"js", "text/javascript"},
        {"json", "application/json"},
        {"xml", "text/xml"},
        {"yaml", "application/yaml"},
        {"yml", "application/yaml"},
        {"toml", "application/toml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tgz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"bz2", "application/x-bzip2"},
        {"xz", "application/x-xz"},
        {"zst", "application/zstd"},
        {"7z", "application/x-7z-compressed"},
        {"iso", "application/x-iso9660-image"},
        {"sh", "application/x-sh"},
        {"wasm", "application/wasm"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"bmp", "image/bmp"},
        {"ico", "image/x-icon"},
        {"svg", "image/svg+xml"},
        {"webp", "image/webp"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"flac", "audio/flac"},
        {"mp4", "video/mp4"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"avi", "video/x-msvideo"},
        {"mov", "video/quicktime"},
    };
    return instance;
}

}  // namespace

std::string guessMimeType(const std::string& file_name)
{
    static const std::string default_mime = "application/octet-stream";

    const auto dot_pos = file_name.rfind('.');
    if ((dot_pos == std::string::npos) || (dot_pos + 1 == file_name.size()))
    {
        return default_mime;
    }
    // A dot which belongs to a parent directory is not an extension.
    const auto slash_pos = file_name.rfind('/');
    if ((slash_pos != std::string::npos) && (slash_pos > dot_pos))
    {
        return default_mime;
    }

    const auto& mime_map = extensionToMime();
    const auto  it       = mime_map.find(toLowerAscii(file_name.substr(dot_pos + 1)));
    return (it != mime_map.end()) ? it->second : default_mime;
}

}  // namespace http
}  // namespace common
}  // namespace zfsx
