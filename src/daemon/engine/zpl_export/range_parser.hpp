//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_ZPL_EXPORT_RANGE_PARSER_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_ZPL_EXPORT_RANGE_PARSER_HPP_INCLUDED

#include "fault.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace zpl_export
{

/// Inclusive byte range to serve.
///
/// For an empty object the only valid range is `{0, 0, false}`, which stands for an empty body.
///
struct ByteRange
{
    std::uint64_t start;
    std::uint64_t end;
    bool          partial;

};  // ByteRange

struct RangeParse
{
    using Success = ByteRange;
    using Failure = Fault;
    using Result  = cetl::variant<Success, Failure>;
};

/// Parses (optional) value of the `Range` request header against the total object size.
///
/// Only a single `bytes=` range is supported - either `START-END`, `START-` or the `-SUFFIX` form.
///
CETL_NODISCARD RangeParse::Result parseRange(const cetl::optional<std::string>& range_header,
                                             const std::uint64_t                total_size);

/// Parses plain decimal unsigned 64-bit number (no sign, no whitespace, no overflow).
///
CETL_NODISCARD cetl::optional<std::uint64_t> parseDecimalU64(const std::string& str);

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_ZPL_EXPORT_RANGE_PARSER_HPP_INCLUDED
