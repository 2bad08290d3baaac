//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "poller.hpp"

#include "io.hpp"
#include "logging.hpp"
#include "zfsx/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <sys/epoll.h>
#include <utility>

namespace zfsx
{
namespace common
{
namespace io
{
namespace
{

constexpr std::size_t MaxEventsPerPoll = 64;

}  // namespace

void Poller::Callback::reset() noexcept
{
    if (auto* const poller = std::exchange(poller_, nullptr))
    {
        poller->unregister(std::exchange(id_, 0));
    }
}

Poller::MakeResult::Var Poller::make()
{
    OwnFd epoll_fd;
    if (const auto err = platform::posixSyscallError([&epoll_fd] {
            //
            epoll_fd = OwnFd{::epoll_create1(EPOLL_CLOEXEC)};
            return epoll_fd.get();
        }))
    {
        getLogger("io")->error("Failed to create epoll instance: {}.", std::strerror(err));
        return err;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory) private constructor
    return Ptr{new Poller{std::move(epoll_fd)}};
}

Poller::Poller(OwnFd&& epoll_fd)
    : epoll_fd_{std::move(epoll_fd)}
    , last_id_{0}
{
}

Poller::~Poller()
{
    if (!id_to_registration_.empty())
    {
        getLogger("io")->warn("Poller is destroyed with {} registered callbacks.", id_to_registration_.size());
    }
}

Poller::Callback Poller::registerAwaitableCallback(Function&& function, const Trigger::Variant& trigger)
{
    CETL_DEBUG_ASSERT(function, "");

    int  fd          = -1;
    bool is_writable = false;
    if (const auto* const readable = cetl::get_if<Trigger::Readable>(&trigger))
    {
        fd = readable->fd;
    }
    else
    {
        fd          = cetl::get<Trigger::Writable>(trigger).fd;
        is_writable = true;
    }
    CETL_DEBUG_ASSERT(fd >= 0, "");

    FdSlots    slots{0, 0};
    const auto slots_it = fd_to_slots_.find(fd);
    if (slots_it != fd_to_slots_.end())
    {
        slots = slots_it->second;
    }
    auto& slot_id = is_writable ? slots.writable_id : slots.readable_id;
    if (slot_id != 0)
    {
        getLogger("io")->error("Callback is already registered (fd={}, writable={}).", fd, is_writable);
        return {};
    }

    const auto new_id = ++last_id_;
    slot_id           = new_id;
    if (const auto err = updateInterest(fd, &slots))
    {
        getLogger("io")->error("Failed to register fd in epoll (fd={}): {}.", fd, std::strerror(err));
        return {};
    }

    fd_to_slots_[fd] = slots;
    id_to_registration_.emplace(new_id, Registration{fd, is_writable, std::move(function)});
    return Callback{*this, new_id};
}

int Poller::pollFor(const std::chrono::milliseconds timeout)
{
    std::array<epoll_event, MaxEventsPerPoll> events{};

    int ready_count = 0;
    if (const auto err = platform::posixSyscallError([this, &events, &ready_count, timeout] {
            //
            ready_count = ::epoll_wait(epoll_fd_.get(),
                                       events.data(),
                                       static_cast<int>(events.size()),
                                       static_cast<int>(timeout.count()));
            return ready_count;
        }))
    {
        return err;
    }

    for (int i = 0; i < ready_count; ++i)
    {
        const auto& event = events[static_cast<std::size_t>(i)];
        const int   fd    = event.data.fd;

        // Slots are looked up per event b/c previous callbacks could have (un)registered this fd.
        //
        const bool is_readable = 0 != (event.events & (EPOLLIN | EPOLLHUP | EPOLLERR | EPOLLRDHUP));
        if (is_readable)
        {
            const auto it = fd_to_slots_.find(fd);
            if ((it != fd_to_slots_.end()) && (it->second.readable_id != 0))
            {
                dispatch(it->second.readable_id);
            }
        }
        const bool is_writable = 0 != (event.events & (EPOLLOUT | EPOLLHUP | EPOLLERR));
        if (is_writable)
        {
            const auto it = fd_to_slots_.find(fd);
            if ((it != fd_to_slots_.end()) && (it->second.writable_id != 0))
            {
                dispatch(it->second.writable_id);
            }
        }
    }
    return 0;
}

void Poller::dispatch(const std::uint64_t id)
{
    const auto it = id_to_registration_.find(id);
    if (it == id_to_registration_.end())
    {
        return;
    }

    // A copy b/c the callback is allowed to unregister itself.
    const auto function = it->second.function;
    function();
}

void Poller::unregister(const std::uint64_t id) noexcept
{
    const auto reg_it = id_to_registration_.find(id);
    if (reg_it == id_to_registration_.end())
    {
        return;
    }
    const int  fd          = reg_it->second.fd;
    const bool is_writable = reg_it->second.is_writable;
    id_to_registration_.erase(reg_it);

    const auto slots_it = fd_to_slots_.find(fd);
    if (slots_it == fd_to_slots_.end())
    {
        return;
    }
    auto& slots = slots_it->second;
    (is_writable ? slots.writable_id : slots.readable_id) = 0;

    const bool is_unused = (slots.readable_id == 0) && (slots.writable_id == 0);
    if (const auto err = updateInterest(fd, is_unused ? nullptr : &slots))
    {
        // `EBADF` is expected if the descriptor was closed before its callback.
        getLogger("io")->debug("Failed to update epoll interest (fd={}): {}.", fd, std::strerror(err));
    }
    if (is_unused)
    {
        fd_to_slots_.erase(slots_it);
    }
}

int Poller::updateInterest(const int fd, const FdSlots* const slots) const
{
    if (slots == nullptr)
    {
        return platform::posixSyscallError([this, fd] {
            //
            return ::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr);
        });
    }

    epoll_event event{};
    event.data.fd = fd;
    if (slots->readable_id != 0)
    {
        event.events |= EPOLLIN | EPOLLRDHUP;
    }
    if (slots->writable_id != 0)
    {
        event.events |= EPOLLOUT;
    }

    const bool is_known = fd_to_slots_.find(fd) != fd_to_slots_.end();
    return platform::posixSyscallError([this, fd, is_known, &event] {
        //
        return ::epoll_ctl(epoll_fd_.get(), is_known ? EPOLL_CTL_MOD : EPOLL_CTL_ADD, fd, &event);
    });
}

}  // namespace io
}  // namespace common
}  // namespace zfsx
