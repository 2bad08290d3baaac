//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_ZPL_EXPORT_EXPORT_SERVICE_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_ZPL_EXPORT_EXPORT_SERVICE_HPP_INCLUDED

#include "backend/session_cache.hpp"
#include "chunked_reader.hpp"
#include "fault.hpp"
#include "http/response.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace zpl_export
{

/// Serves files of pool datasets by path, honoring single-range requests.
///
/// The pipeline of a request: lease the pool session -> resolve the path -> parse the range
/// against the file size -> read the range chunk by chunk -> assemble the response.
///
class ExportService final
{
public:
    struct Request
    {
        std::string                 pool;
        std::string                 path;
        cetl::optional<std::string> range;  ///< Value of the `Range` header (if any).
    };

    struct Export
    {
        using Success = common::http::Response;
        using Failure = Fault;
        using Result  = cetl::variant<Success, Failure>;
    };

    ExportService(backend::SessionCache& session_cache, const ChunkedReader::Limits limits)
        : session_cache_{session_cache}
        , chunked_reader_{limits}
    {
    }

    CETL_NODISCARD Export::Result exportFile(const Request& request, const ChunkedReader::KeepGoing& keep_going) const;

private:
    CETL_NODISCARD Export::Result logged(const Request& request, Export::Result result) const;

    backend::SessionCache&  session_cache_;
    const ChunkedReader     chunked_reader_;
    const common::LoggerPtr logger_{common::getLogger("export")};

};  // ExportService

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_ZPL_EXPORT_EXPORT_SERVICE_HPP_INCLUDED
