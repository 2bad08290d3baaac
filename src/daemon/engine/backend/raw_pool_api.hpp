//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_BACKEND_RAW_POOL_API_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_BACKEND_RAW_POOL_API_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace backend
{

/// Outcome of a JSON-returning backend call, as is.
///
struct RawResult
{
    int         err{0};  ///< `0` on success, otherwise errno-style (or `EZFS_*`) code.
    std::string json;
    std::string errmsg;

    bool isOk() const noexcept
    {
        return err == 0;
    }

};  // RawResult

/// Raw (JSON level) interface of one open pool.
///
/// Destruction of the object closes the pool.
/// Implementations are not thread-safe - callers serialize access (see `SessionCache`).
///
class RawPool
{
public:
    using Ptr = std::unique_ptr<RawPool>;

    RawPool(const RawPool&)                = delete;
    RawPool(RawPool&&) noexcept            = delete;
    RawPool& operator=(const RawPool&)     = delete;
    RawPool& operator=(RawPool&&) noexcept = delete;

    virtual ~RawPool() = default;

    virtual RawResult datasets()                                                           = 0;
    virtual RawResult dslRootDir()                                                         = 0;
    virtual RawResult dslDirChildren(const std::uint64_t dir_obj)                          = 0;
    virtual RawResult dslDirHead(const std::uint64_t dir_obj)                              = 0;
    virtual RawResult datasetObjset(const std::uint64_t dataset_obj)                       = 0;
    virtual RawResult objsetWalk(const std::uint64_t objset_id, const std::string& path)   = 0;
    virtual RawResult objsetStat(const std::uint64_t objset_id, const std::uint64_t objid) = 0;
    virtual RawResult objsetReadData(const std::uint64_t objset_id,
                                     const std::uint64_t objid,
                                     const std::uint64_t offset,
                                     const std::uint64_t limit) = 0;

protected:
    RawPool() = default;

};  // RawPool

/// Raw (JSON level) interface of the pool backend library.
///
class RawPoolApi
{
public:
    using Ptr = std::shared_ptr<RawPoolApi>;

    struct OpenPool
    {
        using Success = RawPool::Ptr;
        using Failure = int;  // backend code (errno-style or `EZFS_*`)
        using Result  = cetl::variant<Success, Failure>;
    };

    RawPoolApi(const RawPoolApi&)                = delete;
    RawPoolApi(RawPoolApi&&) noexcept            = delete;
    RawPoolApi& operator=(const RawPoolApi&)     = delete;
    RawPoolApi& operator=(RawPoolApi&&) noexcept = delete;

    virtual ~RawPoolApi() = default;

    /// Opens an imported pool of the running system.
    ///
    CETL_NODISCARD virtual OpenPool::Result openPool(const std::string& name) = 0;

    /// Opens an exported pool by scanning the given search paths (`:` separated), or backend defaults.
    ///
    CETL_NODISCARD virtual OpenPool::Result openPoolOffline(const std::string&                 name,
                                                            const cetl::optional<std::string>& search_paths) = 0;

    CETL_NODISCARD virtual RawResult listPools() = 0;

    /// Gets version (commit) of the backend decoding library.
    ///
    virtual std::string version() = 0;

protected:
    RawPoolApi() = default;

};  // RawPoolApi

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_BACKEND_RAW_POOL_API_HPP_INCLUDED
