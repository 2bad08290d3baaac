//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session_cache.hpp"

#include "pool_open_mode.hpp"
#include "pool_session.hpp"
#include "raw_pool_api.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace backend
{

struct SessionCache::Entry
{
    Entry(std::string pool_name, PoolSession::Ptr pool_session)
        : pool{std::move(pool_name)}
        , session{std::move(pool_session)}
    {
    }

    const std::string      pool;
    const PoolSession::Ptr session;
    std::mutex             mutex;
    std::size_t            leases{0};  // guarded by the cache mutex

};  // Entry

// MARK: - Lease

SessionCache::Lease::Lease(SessionCache& cache, EntryPtr entry)
    : cache_{&cache}
    , entry_{std::move(entry)}
    , lock_{entry_->mutex}
{
}

SessionCache::Lease::Lease(Lease&& other) noexcept
    : cache_{other.cache_}
    , entry_{std::move(other.entry_)}
    , lock_{std::move(other.lock_)}
{
}

SessionCache::Lease& SessionCache::Lease::operator=(Lease&& other) noexcept
{
    if (this != &other)
    {
        release();
        cache_ = other.cache_;
        entry_ = std::move(other.entry_);
        lock_  = std::move(other.lock_);
    }
    return *this;
}

SessionCache::Lease::~Lease()
{
    release();
}

PoolSession& SessionCache::Lease::session() const noexcept
{
    CETL_DEBUG_ASSERT(entry_ && entry_->session, "");
    return *entry_->session;
}

void SessionCache::Lease::release() noexcept
{
    if (entry_)
    {
        if (lock_.owns_lock())
        {
            lock_.unlock();
        }
        cache_->onLeaseReleased(*entry_);
        entry_.reset();
    }
}

// MARK: - SessionCache

SessionCache::SessionCache(RawPoolApi::Ptr raw_api, Settings settings, SessionFactory session_factory)
    : raw_api_{std::move(raw_api)}
    , settings_{std::move(settings)}
    , session_factory_{std::move(session_factory)}
{
    CETL_DEBUG_ASSERT(raw_api_, "");
    CETL_DEBUG_ASSERT(session_factory_, "");

    settings_.capacity = std::max<std::size_t>(settings_.capacity, 1);
}

SessionCache::~SessionCache()
{
    const std::lock_guard<std::mutex> lock{mutex_};
    logger_->debug("Closing {} cached pool session(s).", entries_.size());
    entries_.clear();
}

SessionCache::Acquire::Result SessionCache::acquire(const std::string& pool)
{
    EntryPtr entry;
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        const auto it = std::find_if(entries_.begin(), entries_.end(), [&pool](const EntryPtr& cached) {
            //
            return cached->pool == pool;
        });
        if (it != entries_.end())
        {
            entries_.splice(entries_.begin(), entries_, it);
            entry = entries_.front();
        }
        else
        {
            const auto mode   = settings_.mode;
            auto       opened = openRawPool(pool, mode);
            if (const auto* const code = cetl::get_if<RawPoolApi::OpenPool::Failure>(&opened))
            {
                const char* const call = (mode == PoolOpenMode::Offline) ? "zdx_pool_open_offline" : "zdx_pool_open";
                return PoolOpenFailure{pool, mode, *code, fmt::format("{} failed with code {}", call, *code)};
            }

            auto session = session_factory_(std::move(cetl::get<RawPool::Ptr>(opened)));
            entry        = std::make_shared<Entry>(pool, std::move(session));
            entries_.push_front(entry);
            logger_->debug("Pool '{}' session is cached (mode={}, sessions={}).",
                           pool,
                           poolOpenModeName(mode),
                           entries_.size());
        }

        ++entry->leases;
        evictIdleOverCapacity();
    }

    // The entry lock is taken outside of the cache lock - another lease of the same pool may still be in progress.
    return Lease{*this, std::move(entry)};
}

PoolOpenMode SessionCache::mode() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return settings_.mode;
}

cetl::optional<std::string> SessionCache::offlineSearchPaths() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return settings_.offline_search_paths;
}

bool SessionCache::setMode(const PoolOpenMode mode)
{
    const std::lock_guard<std::mutex> lock{mutex_};

    if (settings_.mode == mode)
    {
        return false;
    }

    logger_->info("Pool open mode is switched ({} -> {}), dropping {} cached session(s).",
                  poolOpenModeName(settings_.mode),
                  poolOpenModeName(mode),
                  entries_.size());

    settings_.mode = mode;
    entries_.clear();
    return true;
}

std::size_t SessionCache::size() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return entries_.size();
}

RawPoolApi::OpenPool::Result SessionCache::openRawPool(const std::string& pool, const PoolOpenMode mode) const
{
    switch (mode)
    {
    case PoolOpenMode::Offline:
        return raw_api_->openPoolOffline(pool, settings_.offline_search_paths);
    case PoolOpenMode::Live:
    default:
        return raw_api_->openPool(pool);
    }
}

// Should be called with the cache mutex locked.
//
void SessionCache::evictIdleOverCapacity()
{
    auto it = entries_.end();
    while ((entries_.size() > settings_.capacity) && (it != entries_.begin()))
    {
        --it;
        if ((*it)->leases == 0)
        {
            logger_->debug("Evicting idle session of pool '{}'.", (*it)->pool);
            it = entries_.erase(it);
        }
    }
}

void SessionCache::onLeaseReleased(Entry& entry)
{
    const std::lock_guard<std::mutex> lock{mutex_};

    CETL_DEBUG_ASSERT(entry.leases > 0, "");
    --entry.leases;
    evictIdleOverCapacity();
}

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
