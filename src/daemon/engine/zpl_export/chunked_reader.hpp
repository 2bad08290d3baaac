//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_ZPL_EXPORT_CHUNKED_READER_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_ZPL_EXPORT_CHUNKED_READER_HPP_INCLUDED

#include "backend/pool_session.hpp"
#include "fault.hpp"
#include "path_resolver.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace zpl_export
{

/// Assembles a byte range of an object from bounded backend reads.
///
/// The backend has no streaming - every read returns at most `max_chunk_bytes`, possibly less (sparse or
/// partially unreadable data), so the reader loops until the whole range is assembled. A range which is
/// not fully assembled is a fault; a truncated result is never returned.
///
class ChunkedReader final
{
public:
    struct Limits
    {
        std::uint64_t max_download_bytes;
        std::uint64_t max_chunk_bytes;
    };
    static constexpr Limits DefaultLimits{512ULL * 1024ULL * 1024ULL, 1024ULL * 1024ULL};  // NOLINT(*-magic-numbers)

    /// Consulted before each backend read; `false` stops the reading (f.e. the HTTP peer is gone).
    ///
    using KeepGoing = std::function<bool()>;

    struct Read
    {
        using Success = std::string;  // raw bytes
        using Failure = Fault;
        using Result  = cetl::variant<Success, Failure>;
    };

    explicit ChunkedReader(const Limits limits = DefaultLimits);

    /// Reads inclusive `[start, end]` range of the object. An empty range (`end < start`) is read as empty.
    ///
    CETL_NODISCARD Read::Result read(backend::PoolSession& session,
                                     const PathContext&    context,
                                     const std::uint64_t   start,
                                     const std::uint64_t   end,
                                     const KeepGoing&      keep_going) const;

    /// Decodes hex payload of a backend read (surrounding whitespace ignored).
    ///
    CETL_NODISCARD static Read::Result decodeHex(const std::string& data_hex);

private:
    Limits limits_;

};  // ChunkedReader

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_ZPL_EXPORT_CHUNKED_READER_HPP_INCLUDED
