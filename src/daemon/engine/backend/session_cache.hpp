//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_BACKEND_SESSION_CACHE_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_BACKEND_SESSION_CACHE_HPP_INCLUDED

#include "logging.hpp"
#include "pool_open_mode.hpp"
#include "pool_session.hpp"
#include "raw_pool_api.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace backend
{

/// Describes why a pool could not be opened.
///
struct PoolOpenFailure
{
    std::string  pool;
    PoolOpenMode mode;
    int          code;  ///< Raw backend code - see `backendErrorCodeName`.
    std::string  message;

};  // PoolOpenFailure

/// Small LRU cache of open pool sessions, keyed by pool name.
///
/// A session is used only through a `Lease`, which holds the session's own mutex for its whole lifetime,
/// so a session is never touched by two threads at once. Sessions which are currently leased
/// are never evicted - the cache temporarily grows beyond its capacity instead.
///
class SessionCache final
{
    struct Entry;
    using EntryPtr = std::shared_ptr<Entry>;

public:
    using SessionFactory = std::function<PoolSession::Ptr(RawPool::Ptr)>;

    struct Settings
    {
        PoolOpenMode                mode{PoolOpenMode::Live};
        cetl::optional<std::string> offline_search_paths;
        std::size_t                 capacity{4};
    };

    /// Exclusive access to one cached session.
    ///
    class Lease final
    {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease();

        PoolSession& session() const noexcept;

    private:
        friend class SessionCache;

        Lease(SessionCache& cache, EntryPtr entry);
        void release() noexcept;

        SessionCache*                cache_;
        EntryPtr                     entry_;
        std::unique_lock<std::mutex> lock_;

    };  // Lease

    struct Acquire
    {
        using Success = Lease;
        using Failure = PoolOpenFailure;
        using Result  = cetl::variant<Success, Failure>;
    };

    SessionCache(RawPoolApi::Ptr raw_api, Settings settings, SessionFactory session_factory = PoolSession::make);

    SessionCache(const SessionCache&)                = delete;
    SessionCache(SessionCache&&) noexcept            = delete;
    SessionCache& operator=(const SessionCache&)     = delete;
    SessionCache& operator=(SessionCache&&) noexcept = delete;

    ~SessionCache();

    /// Leases session of the given pool, opening the pool (in the current mode) if needed.
    ///
    /// Blocks while the session is leased by someone else.
    ///
    CETL_NODISCARD Acquire::Result acquire(const std::string& pool);

    PoolOpenMode                mode() const;
    cetl::optional<std::string> offlineSearchPaths() const;

    /// Switches pool open mode.
    ///
    /// On an actual change all cached sessions are dropped; idle ones are closed immediately,
    /// and leased ones as soon as their lease is over.
    ///
    /// @return `true` if the mode has changed.
    ///
    bool setMode(const PoolOpenMode mode);

    /// Gets number of currently cached sessions.
    ///
    std::size_t size() const;

private:
    RawPoolApi::OpenPool::Result openRawPool(const std::string& pool, const PoolOpenMode mode) const;
    void                         evictIdleOverCapacity();
    void                         onLeaseReleased(Entry& entry);

    mutable std::mutex      mutex_;
    const RawPoolApi::Ptr   raw_api_;
    Settings                settings_;
    const SessionFactory    session_factory_;
    std::list<EntryPtr>     entries_;  // the most recently used first
    const common::LoggerPtr logger_{common::getLogger("backend")};

};  // SessionCache

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_BACKEND_SESSION_CACHE_HPP_INCLUDED
