//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "response.hpp"

#include "http_status.hpp"

#include <string>

namespace zfsx
{
namespace common
{
namespace http
{

std::string Response::serializeHead() const
{
    std::string head;
    head.reserve(256);  // NOLINT(*-magic-numbers)

    head += "HTTP/1.1 ";
    head += std::to_string(toCode(status));
    head += ' ';
    head += reasonPhrase(status);
    head += "\r\n";

    for (const auto& field : headers)
    {
        head += field.first;
        head += ": ";
        head += field.second;
        head += "\r\n";
    }
    if (!headers.contains("Content-Length"))
    {
        head += "Content-Length: ";
        head += std::to_string(body.size());
        head += "\r\n";
    }

    head += "\r\n";
    return head;
}

}  // namespace http
}  // namespace common
}  // namespace zfsx
