//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "export_service.hpp"

#include "backend/session_cache.hpp"
#include "chunked_reader.hpp"
#include "fault.hpp"
#include "path_resolver.hpp"
#include "range_parser.hpp"
#include "response_assembler.hpp"

#include <cetl/pf17/cetlpf.hpp>

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

ExportService::Export::Result ExportService::exportFile(const Request&                  request,
                                                        const ChunkedReader::KeepGoing& keep_going) const
{
    auto acquired = session_cache_.acquire(request.pool);
    if (const auto* const failure = cetl::get_if<backend::PoolOpenFailure>(&acquired))
    {
        return poolOpenFault(*failure);
    }
    const auto& lease = cetl::get<backend::SessionCache::Lease>(acquired);

    const PathResolver path_resolver{lease.session()};
    auto               resolved = path_resolver.resolve(request.pool, request.path);
    if (auto* const fault = cetl::get_if<Fault>(&resolved))
    {
        return logged(request, std::move(*fault));
    }
    const auto& context = cetl::get<PathContext>(resolved);

    if (context.file_size == 0)
    {
        logger_->debug("Serving empty file (pool='{}', dataset='{}', objid={}).",
                       request.pool,
                       context.dataset_name,
                       context.objid);
        return assembleEmptyFileResponse(context);
    }

    auto range = parseRange(request.range, context.file_size);
    if (auto* const fault = cetl::get_if<Fault>(&range))
    {
        return logged(request, std::move(*fault));
    }
    const auto& byte_range = cetl::get<ByteRange>(range);

    auto read = chunked_reader_.read(lease.session(), context, byte_range.start, byte_range.end, keep_going);
    if (auto* const fault = cetl::get_if<Fault>(&read))
    {
        return logged(request, std::move(*fault));
    }

    logger_->debug("Serving bytes {}-{} of {} (pool='{}', dataset='{}', objid={}).",
                   byte_range.start,
                   byte_range.end,
                   context.file_size,
                   request.pool,
                   context.dataset_name,
                   context.objid);
    return assembleFileResponse(context, byte_range, std::move(cetl::get<std::string>(read)));
}

ExportService::Export::Result ExportService::logged(const Request& request, Export::Result result) const
{
    if (const auto* const fault = cetl::get_if<Fault>(&result))
    {
        if (fault->isServerSide() && (fault->kind != FaultKind::ClientGone))
        {
            logger_->error("Export of '{}' from pool '{}' has failed (code={}): {}",
                           request.path,
                           request.pool,
                           fault->code,
                           fault->message);
        }
        else
        {
            logger_->debug("Export of '{}' from pool '{}' is rejected (code={}): {}",
                           request.path,
                           request.pool,
                           fault->code,
                           fault->message);
        }
    }
    return result;
}

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
