//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "chunked_reader.hpp"

#include "backend/backend_error.hpp"
#include "backend/pool_session.hpp"
#include "common_helpers.hpp"
#include "fault.hpp"
#include "logging.hpp"
#include "path_resolver.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
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

using common::http::Status;

int hexNibble(const char ch) noexcept
{
    if ((ch >= '0') && (ch <= '9'))
    {
        return ch - '0';
    }
    if ((ch >= 'a') && (ch <= 'f'))
    {
        return ch - 'a' + 10;  // NOLINT(*-magic-numbers)
    }
    if ((ch >= 'A') && (ch <= 'F'))
    {
        return ch - 'A' + 10;  // NOLINT(*-magic-numbers)
    }
    return -1;
}

}  // namespace

constexpr ChunkedReader::Limits ChunkedReader::DefaultLimits;

ChunkedReader::ChunkedReader(const Limits limits)
    : limits_{limits}
{
    CETL_DEBUG_ASSERT(limits_.max_chunk_bytes > 0, "");
}

ChunkedReader::Read::Result ChunkedReader::decodeHex(const std::string& data_hex)
{
    const auto trimmed = common::trimWhitespace(data_hex);
    if ((trimmed.size() % 2) != 0)
    {
        return Fault::internal("invalid hex payload length from backend read");
    }

    std::string bytes;
    bytes.reserve(trimmed.size() / 2);
    for (std::size_t i = 0; i < trimmed.size(); i += 2)
    {
        const int hi = hexNibble(trimmed[i]);
        const int lo = hexNibble(trimmed[i + 1]);
        if ((hi < 0) || (lo < 0))
        {
            return Fault::internal("invalid hex payload from backend read");
        }
        bytes.push_back(static_cast<char>((hi << 4) | lo));  // NOLINT(*-magic-numbers)
    }
    return bytes;
}

ChunkedReader::Read::Result ChunkedReader::read(backend::PoolSession& session,
                                                const PathContext&    context,
                                                const std::uint64_t   start,
                                                const std::uint64_t   end,
                                                const KeepGoing&      keep_going) const
{
    if (end < start)
    {
        return std::string{};
    }

    const auto total = end - start + 1;
    if (total > limits_.max_download_bytes)
    {
        return Fault::make(FaultKind::DownloadTooLarge,
                           fmt::format("requested byte range is {} bytes; max per request is {} bytes",
                                       total,
                                       limits_.max_download_bytes),
                           std::string{"Use HTTP Range requests to download the file in chunks."});
    }

    const auto logger = common::getLogger("export");

    std::string out;
    out.reserve(static_cast<std::size_t>(total));

    auto offset = start;
    while (offset <= end)
    {
        if (keep_going && !keep_going())
        {
            logger->debug("Reading of object {} is abandoned at offset {} (client is gone).", context.objid, offset);
            return Fault::clientGone();
        }

        const auto remaining  = end - offset + 1;
        const auto chunk_size = std::min(remaining, limits_.max_chunk_bytes);

        const auto chunk = session.objsetRead(context.objset_id, context.objid, offset, chunk_size);
        if (const auto* const failure = cetl::get_if<backend::BackendFailure>(&chunk))
        {
            if (failure->kind == backend::BackendFailure::Kind::Payload)
            {
                logger->error("Bad data payload of object {} at offset {}: {}", context.objid, offset, failure->message);
                return Fault::internal(failure->message);
            }
            const auto status = backend::isObjsetUserInputError(failure->message) ? Status::BadRequest
                                                                                   : Status::InternalServerError;
            return Fault::http(status,
                               fmt::format("failed to read object data at offset {}: {}", offset, failure->message));
        }

        auto decoded = decodeHex(cetl::get<std::string>(chunk));
        if (auto* const fault = cetl::get_if<Fault>(&decoded))
        {
            logger->error("Failed to decode data of object {} at offset {}: {}", context.objid, offset, fault->message);
            return std::move(*fault);
        }
        auto& bytes = cetl::get<std::string>(decoded);
        if (bytes.empty())
        {
            break;
        }
        if (bytes.size() > remaining)
        {
            bytes.resize(static_cast<std::size_t>(remaining));
        }

        out += bytes;
        offset += bytes.size();
        if (offset == 0)
        {
            break;  // wrapped around the end of 64-bit space
        }
    }

    if (out.size() != total)
    {
        logger->error("Short read of object {} (objset={}, range={}-{}, expected={}, got={}).",
                      context.objid,
                      context.objset_id,
                      start,
                      end,
                      total,
                      out.size());
        return Fault::make(FaultKind::ShortRead,
                           fmt::format("short read while exporting object data (expected {} bytes, got {})",
                                       total,
                                       out.size()),
                           std::string{"Try smaller range requests; the object may be sparse "
                                       "or partially unreadable."});
    }

    return out;
}

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
