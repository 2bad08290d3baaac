//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "path_resolver.hpp"

#include "backend/backend_error.hpp"
#include "backend/pool_session.hpp"
#include "common_helpers.hpp"
#include "fault.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

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

/// Matches `path` against a `prefix` which is either equal to it, or is its parent (`prefix/...`).
///
/// @return The remainder after `prefix/` (empty on exact match), or `nullopt` if there is no match.
///
cetl::optional<std::string> matchPathPrefix(const std::string& prefix, const std::string& path)
{
    if (path == prefix)
    {
        return std::string{};
    }
    const auto parent = prefix + "/";
    if (common::startsWith(path, parent))
    {
        return path.substr(parent.size());
    }
    return cetl::nullopt;
}

template <typename T>
const backend::BackendFailure* failureOf(const backend::PoolSession::Result<T>& result)
{
    return cetl::get_if<backend::BackendFailure>(&result);
}

}  // namespace

cetl::optional<PathResolver::DatasetMatch> PathResolver::matchDataset(
    const std::vector<backend::DatasetCatalogEntry>& catalog,
    const std::string&                              relative_path,
    const std::string&                              absolute_path)
{
    cetl::optional<DatasetMatch> best;
    const auto                   consider = [&best](const std::size_t length, const std::string& name, std::string rel) {
        //
        if (!best || (length > best->length))
        {
            best = DatasetMatch{length, name, std::move(rel)};
        }
    };

    for (const auto& entry : catalog)
    {
        if (entry.kind != backend::DatasetCatalogEntry::Kind::Filesystem)
        {
            continue;
        }

        if (auto rel = matchPathPrefix(entry.name, relative_path))
        {
            consider(entry.name.size(), entry.name, std::move(*rel));
        }

        // Unknown mount state is treated as mounted.
        const bool unmounted = entry.mounted && !*entry.mounted;
        if (entry.mountpoint && !unmounted)
        {
            if (auto rel = matchPathPrefix(*entry.mountpoint, absolute_path))
            {
                consider(entry.mountpoint->size(), entry.name, std::move(*rel));
            }
        }
    }
    return best;
}

PathResolver::Resolve::Result PathResolver::resolve(const std::string& pool, const std::string& raw_path) const
{
    const auto trimmed = common::trimWhitespace(raw_path);
    if (trimmed.empty())
    {
        return Fault::make(FaultKind::InvalidPath,
                           "path is empty",
                           std::string{"Provide a dataset-relative path like pool/dataset/file "
                                       "or an absolute mount path."});
    }

    const auto absolute_path = (trimmed.front() == '/') ? trimmed : ("/" + trimmed);
    const auto first_char    = trimmed.find_first_not_of('/');
    const auto relative_path = (first_char == std::string::npos) ? std::string{} : trimmed.substr(first_char);

    // 1. Dataset of the path.
    //
    auto catalog = session_.listDatasetCatalog();
    if (const auto* const failure = failureOf(catalog))
    {
        if (failure->kind == backend::BackendFailure::Kind::Payload)
        {
            return Fault::internal(failure->message);
        }
        return Fault::backend(Status::InternalServerError,
                              failure->code,
                              fmt::format("failed to list datasets: {}", failure->message),
                              false);
    }
    auto match = matchDataset(cetl::get<std::vector<backend::DatasetCatalogEntry>>(catalog),
                              relative_path,
                              absolute_path);
    if (!match)
    {
        return Fault::make(FaultKind::DatasetPathUnresolved,
                           fmt::format("could not resolve dataset for path '{}'", raw_path),
                           std::string{"Use either an absolute mounted path (/pool/dataset/file) "
                                       "or a dataset path like pool/dataset/file."});
    }

    // 2. Its objset.
    //
    const auto dir_obj = resolveDatasetDir(pool, match->dataset_name);
    if (const auto* const fault = cetl::get_if<Fault>(&dir_obj))
    {
        return *fault;
    }
    const auto objset = resolveDirObjset(cetl::get<std::uint64_t>(dir_obj));
    if (const auto* const fault = cetl::get_if<Fault>(&objset))
    {
        return *fault;
    }
    const auto objset_id = cetl::get<std::uint64_t>(objset);

    // 3. The file object inside the objset.
    //
    const auto walk_path = match->rel_path.empty() ? std::string{"/"} : ("/" + match->rel_path);
    const auto walk      = session_.objsetWalk(objset_id, walk_path);
    if (const auto* const failure = failureOf(walk))
    {
        if (failure->kind == backend::BackendFailure::Kind::Payload)
        {
            return Fault::internal(failure->message);
        }
        return Fault::make(FaultKind::ZplWalkFailed,
                           fmt::format("failed to walk path '{}': {}", walk_path, failure->message),
                           std::string{"Verify the file path and dataset context."});
    }
    const auto& walked = cetl::get<backend::ObjsetWalkResult>(walk);
    if (!walked.found || !walked.remaining.empty())
    {
        return Fault::make(FaultKind::PathNotFound,
                           fmt::format("path '{}' could not be fully resolved", walk_path),
                           std::string{"The requested file may not exist in this dataset or snapshot state."});
    }

    const auto stat = session_.objsetStat(objset_id, walked.objid);
    if (const auto* const failure = failureOf(stat))
    {
        if (failure->kind == backend::BackendFailure::Kind::Payload)
        {
            return Fault::internal(failure->message);
        }
        return Fault::make(FaultKind::ObjsetStatFailed,
                           fmt::format("failed to stat object {}: {}", walked.objid, failure->message));
    }
    const auto& stated = cetl::get<backend::ObjsetStatResult>(stat);
    if (stated.type_name != "file")
    {
        return Fault::make(FaultKind::NotAFile,
                           fmt::format("resolved path '{}' is a {} object, not a file", walk_path, stated.type_name),
                           std::string{"Use this endpoint only for file paths."});
    }

    const auto segments = common::splitCleanPath(match->rel_path);
    auto filename = segments.empty() ? fmt::format("objset-{}-obj-{}", objset_id, walked.objid) : segments.back();

    return PathContext{std::move(match->dataset_name),
                       objset_id,
                       std::move(match->rel_path),
                       walked.objid,
                       stated.size,
                       std::move(filename)};
}

PathResolver::DirResolve::Result PathResolver::resolveDatasetDir(const std::string& pool,
                                                                 const std::string& dataset) const
{
    const auto root_dir = session_.rootDir();
    if (const auto* const failure = failureOf(root_dir))
    {
        return genericBackendFault(*failure, Status::InternalServerError, "failed to resolve DSL root: ");
    }
    const auto root_dir_obj = cetl::get<std::uint64_t>(root_dir);

    if (dataset == pool)
    {
        return root_dir_obj;
    }

    const auto pool_prefix = pool + "/";
    if (!common::startsWith(dataset, pool_prefix))
    {
        return Fault::make(FaultKind::InvalidDatasetPath,
                           fmt::format("dataset '{}' is not under pool '{}'", dataset, pool),
                           std::string{"Use paths rooted at the selected pool name."});
    }

    auto current_dir_obj = root_dir_obj;
    for (const auto& component : common::splitCleanPath(dataset.substr(pool_prefix.size())))
    {
        const auto children = session_.dirChildren(current_dir_obj);
        if (const auto* const failure = failureOf(children))
        {
            return genericBackendFault(*failure, Status::InternalServerError, "failed to enumerate DSL children: ");
        }

        cetl::optional<std::uint64_t> next_dir_obj;
        for (const auto& child : cetl::get<std::vector<backend::DslDirChild>>(children))
        {
            if (child.name == component)
            {
                next_dir_obj = child.dir_obj;
                break;
            }
        }
        if (!next_dir_obj)
        {
            return Fault::make(FaultKind::DatasetNotFound,
                               fmt::format("dataset component '{}' not found under '{}'", component, dataset),
                               std::string{"Refresh dataset tree and verify the dataset path exists."});
        }
        current_dir_obj = *next_dir_obj;
    }
    return current_dir_obj;
}

PathResolver::DirResolve::Result PathResolver::resolveDirObjset(const std::uint64_t dir_obj) const
{
    const auto logger = common::getLogger("export");

    const auto head = session_.dirHeadDataset(dir_obj);
    if (const auto* const failure = failureOf(head))
    {
        logger->error("Failed to get head dataset of DSL dir {}: {}", dir_obj, failure->message);
        return genericBackendFault(*failure, Status::InternalServerError, "");
    }
    const auto& head_obj = cetl::get<cetl::optional<std::uint64_t>>(head);
    if (!head_obj)
    {
        return Fault::http(Status::BadRequest,
                           fmt::format("DSL dir {} has no head dataset (special internal dir such as $FREE/$MOS)",
                                       dir_obj));
    }

    const auto objset = session_.datasetObjset(*head_obj);
    if (const auto* const failure = failureOf(objset))
    {
        if ((failure->kind == backend::BackendFailure::Kind::Call) &&
            backend::isDatasetUserInputError(failure->message))
        {
            return Fault::http(Status::BadRequest, failure->message);
        }
        logger->error("Failed to get objset of dataset {}: {}", *head_obj, failure->message);
        return genericBackendFault(*failure, Status::InternalServerError, "");
    }
    return cetl::get<std::uint64_t>(objset);
}

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
