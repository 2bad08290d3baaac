//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_BACKEND_POOL_SESSION_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_BACKEND_POOL_SESSION_HPP_INCLUDED

#include "backend_error.hpp"
#include "raw_pool_api.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace backend
{

/// Entry of the dataset catalog of a pool.
///
struct DatasetCatalogEntry
{
    enum class Kind
    {
        Filesystem,
        Volume,
        Other,  ///< Snapshots, bookmarks, etc. - never used for path resolution.
    };

    std::string                 name;
    Kind                        kind{Kind::Other};
    cetl::optional<std::string> mountpoint;
    cetl::optional<bool>        mounted;

};  // DatasetCatalogEntry

struct DslDirChild
{
    std::string   name;
    std::uint64_t dir_obj;
};

struct ObjsetWalkResult
{
    std::uint64_t objid{0};
    bool          found{false};
    std::string   remaining;
};

struct ObjsetStatResult
{
    std::uint64_t size{0};
    std::string   type_name;
};

/// Typed view of one open pool.
///
/// Every operation returns either its decoded value, or a `BackendFailure` - either the backend call
/// has failed (`Kind::Call`), or its payload didn't have expected shape (`Kind::Payload`).
/// A session is bound to exactly one pool.
///
class PoolSession
{
public:
    using Ptr = std::unique_ptr<PoolSession>;

    template <typename T>
    using Result = cetl::variant<T, BackendFailure>;

    /// Makes a session which decodes JSON payloads of the given raw pool.
    ///
    CETL_NODISCARD static Ptr make(RawPool::Ptr raw_pool);

    PoolSession(const PoolSession&)                = delete;
    PoolSession(PoolSession&&) noexcept            = delete;
    PoolSession& operator=(const PoolSession&)     = delete;
    PoolSession& operator=(PoolSession&&) noexcept = delete;

    virtual ~PoolSession() = default;

    virtual Result<std::vector<DatasetCatalogEntry>> listDatasetCatalog() = 0;

    /// Gets object id of the root DSL directory.
    ///
    virtual Result<std::uint64_t> rootDir() = 0;

    virtual Result<std::vector<DslDirChild>> dirChildren(const std::uint64_t dir_obj) = 0;

    /// Gets the head dataset object of a DSL directory, or `nullopt` if the directory has none.
    ///
    virtual Result<cetl::optional<std::uint64_t>> dirHeadDataset(const std::uint64_t dir_obj) = 0;

    virtual Result<std::uint64_t>     datasetObjset(const std::uint64_t dataset_obj)                       = 0;
    virtual Result<ObjsetWalkResult>  objsetWalk(const std::uint64_t objset_id, const std::string& path)   = 0;
    virtual Result<ObjsetStatResult>  objsetStat(const std::uint64_t objset_id, const std::uint64_t objid) = 0;

    /// Reads at most `max_len` bytes of object data, and returns them hex-encoded (as the backend does).
    ///
    virtual Result<std::string> objsetRead(const std::uint64_t objset_id,
                                           const std::uint64_t objid,
                                           const std::uint64_t offset,
                                           const std::uint64_t max_len) = 0;

protected:
    PoolSession() = default;

};  // PoolSession

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_BACKEND_POOL_SESSION_HPP_INCLUDED
