//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "range_parser.hpp"

#include "common_helpers.hpp"
#include "fault.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstdint>
#include <limits>
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

constexpr const char* BytesUnitPrefix = "bytes=";

Fault badRange(std::string message, cetl::optional<std::string> hint = cetl::nullopt)
{
    return Fault::make(FaultKind::BadRange, std::move(message), std::move(hint));
}

Fault notSatisfiable(std::string message)
{
    return Fault::make(FaultKind::RangeNotSatisfiable, std::move(message));
}

}  // namespace

cetl::optional<std::uint64_t> parseDecimalU64(const std::string& str)
{
    if (str.empty())
    {
        return cetl::nullopt;
    }

    constexpr auto MaxValue = std::numeric_limits<std::uint64_t>::max();

    std::uint64_t value = 0;
    for (const char ch : str)
    {
        if ((ch < '0') || (ch > '9'))
        {
            return cetl::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(ch - '0');
        if (value > ((MaxValue - digit) / 10U))  // NOLINT(*-magic-numbers)
        {
            return cetl::nullopt;
        }
        value = value * 10U + digit;  // NOLINT(*-magic-numbers)
    }
    return value;
}

RangeParse::Result parseRange(const cetl::optional<std::string>& range_header, const std::uint64_t total_size)
{
    if (!range_header)
    {
        return ByteRange{0, (total_size == 0) ? 0 : (total_size - 1), false};
    }

    const auto trimmed = common::trimWhitespace(*range_header);
    if (!common::startsWith(trimmed, BytesUnitPrefix))
    {
        return badRange(fmt::format("unsupported Range header '{}'", trimmed),
                        std::string{"Use a single byte range, for example: bytes=0-1048575"});
    }

    const auto range_expr = common::trimWhitespace(trimmed.substr(std::string{BytesUnitPrefix}.size()));
    if (range_expr.find(',') != std::string::npos)
    {
        return badRange("multiple byte ranges are not supported", std::string{"Use a single range request per call."});
    }

    if (total_size == 0)
    {
        return notSatisfiable("cannot satisfy range for empty file");
    }

    const auto dash = range_expr.find('-');
    if (dash == std::string::npos)
    {
        return badRange(fmt::format("invalid Range header '{}'", trimmed));
    }
    const auto start_raw = common::trimWhitespace(range_expr.substr(0, dash));
    const auto end_raw   = common::trimWhitespace(range_expr.substr(dash + 1));

    // Suffix form - the last N bytes.
    //
    if (start_raw.empty())
    {
        const auto suffix_len = parseDecimalU64(end_raw);
        if (!suffix_len)
        {
            return badRange(fmt::format("invalid suffix range '{}'", trimmed));
        }
        if (*suffix_len == 0)
        {
            return notSatisfiable("suffix length must be greater than zero");
        }
        const auto start = (*suffix_len >= total_size) ? 0 : (total_size - *suffix_len);
        return ByteRange{start, total_size - 1, true};
    }

    const auto start = parseDecimalU64(start_raw);
    if (!start)
    {
        return badRange(fmt::format("invalid range start '{}'", start_raw));
    }

    std::uint64_t end = total_size - 1;
    if (!end_raw.empty())
    {
        const auto parsed_end = parseDecimalU64(end_raw);
        if (!parsed_end)
        {
            return badRange(fmt::format("invalid range end '{}'", end_raw));
        }
        end = *parsed_end;
    }

    if ((*start >= total_size) || (*start > end))
    {
        return notSatisfiable(fmt::format("range {}-{} is outside object size {}", *start, end, total_size));
    }

    return ByteRange{*start, std::min(end, total_size - 1), true};
}

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
