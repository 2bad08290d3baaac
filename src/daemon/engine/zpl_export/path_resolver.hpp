//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_ZPL_EXPORT_PATH_RESOLVER_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_ZPL_EXPORT_PATH_RESOLVER_HPP_INCLUDED

#include "backend/pool_session.hpp"
#include "fault.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace zpl_export
{

/// Fully resolved file of a request.
///
struct PathContext
{
    std::string   dataset_name;
    std::uint64_t objset_id;
    std::string   rel_path;  ///< Path of the file relative to the dataset root (without leading `/`).
    std::uint64_t objid;
    std::uint64_t file_size;
    std::string   filename;

};  // PathContext

/// Resolves user supplied paths (absolute mount-style `/mnt/tank/a.txt`,
/// or dataset-relative `tank/data/a.txt`) to concrete file objects of a pool.
///
class PathResolver final
{
public:
    struct Resolve
    {
        using Success = PathContext;
        using Failure = Fault;
        using Result  = cetl::variant<Success, Failure>;
    };

    /// Candidate dataset of a path match.
    ///
    struct DatasetMatch
    {
        std::size_t length;  ///< Length of the matched dataset name or mountpoint.
        std::string dataset_name;
        std::string rel_path;
    };

    explicit PathResolver(backend::PoolSession& session)
        : session_{session}
    {
    }

    CETL_NODISCARD Resolve::Result resolve(const std::string& pool, const std::string& raw_path) const;

    /// Picks the best (longest, and the first one among equally long) matching filesystem dataset.
    ///
    /// @param relative_path Path without leading slashes - matched against dataset names.
    /// @param absolute_path Path with leading slash - matched against mountpoints of mounted datasets.
    ///
    static cetl::optional<DatasetMatch> matchDataset(const std::vector<backend::DatasetCatalogEntry>& catalog,
                                                     const std::string&                              relative_path,
                                                     const std::string&                              absolute_path);

private:
    struct DirResolve
    {
        using Success = std::uint64_t;
        using Failure = Fault;
        using Result  = cetl::variant<Success, Failure>;
    };

    CETL_NODISCARD DirResolve::Result resolveDatasetDir(const std::string& pool, const std::string& dataset) const;
    CETL_NODISCARD DirResolve::Result resolveDirObjset(const std::uint64_t dir_obj) const;

    backend::PoolSession& session_;

};  // PathResolver

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_ZPL_EXPORT_PATH_RESOLVER_HPP_INCLUDED
