//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_IO_POLLER_HPP_INCLUDED
#define ZFSX_COMMON_IO_POLLER_HPP_INCLUDED

#include "io.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>

namespace zfsx
{
namespace common
{
namespace io
{

/// Single-threaded readiness poller of file descriptors (epoll based).
///
/// Callbacks are registered per descriptor and per direction (readable/writable),
/// and are executed from within `pollFor` on the thread which calls it.
///
class Poller final
{
public:
    using Ptr      = std::unique_ptr<Poller>;
    using Function = std::function<void()>;

    struct Trigger
    {
        struct Readable
        {
            int fd;
        };
        struct Writable
        {
            int fd;
        };

        using Variant = cetl::variant<Readable, Writable>;
    };

    /// RAII handle of a registered callback - the callback is unregistered when the handle is reset or destroyed.
    ///
    class Callback final
    {
    public:
        Callback() noexcept
            : poller_{nullptr}
            , id_{0}
        {
        }

        Callback(Callback&& other) noexcept
            : poller_{std::exchange(other.poller_, nullptr)}
            , id_{std::exchange(other.id_, 0)}
        {
        }

        Callback& operator=(Callback&& other) noexcept
        {
            if (this != &other)
            {
                reset();
                poller_ = std::exchange(other.poller_, nullptr);
                id_     = std::exchange(other.id_, 0);
            }
            return *this;
        }

        Callback(const Callback&)            = delete;
        Callback& operator=(const Callback&) = delete;

        ~Callback()
        {
            reset();
        }

        void reset() noexcept;

        explicit operator bool() const noexcept
        {
            return poller_ != nullptr;
        }

    private:
        friend class Poller;

        Callback(Poller& poller, const std::uint64_t id) noexcept
            : poller_{&poller}
            , id_{id}
        {
        }

        Poller*       poller_;
        std::uint64_t id_;

    };  // Callback

    struct MakeResult
    {
        using Success = Ptr;
        using Failure = int;  // aka errno
        using Var     = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static MakeResult::Var make();

    Poller(const Poller&)                = delete;
    Poller(Poller&&) noexcept            = delete;
    Poller& operator=(const Poller&)     = delete;
    Poller& operator=(Poller&&) noexcept = delete;

    ~Poller();

    /// Registers a callback which is called each time the trigger descriptor is ready.
    ///
    /// At most one readable and one writable callback could be registered per descriptor;
    /// an empty handle is returned if the slot is taken already, or `epoll_ctl` failed.
    ///
    CETL_NODISCARD Callback registerAwaitableCallback(Function&& function, const Trigger::Variant& trigger);

    /// Waits (at most the given timeout) for readiness of registered descriptors, and executes their callbacks.
    ///
    /// @return `0` on success (including timeout), otherwise `errno` of the failed `epoll_wait`.
    ///
    CETL_NODISCARD int pollFor(const std::chrono::milliseconds timeout);

    std::size_t registrationsCount() const noexcept
    {
        return id_to_registration_.size();
    }

private:
    struct Registration
    {
        int      fd;
        bool     is_writable;
        Function function;
    };
    struct FdSlots
    {
        std::uint64_t readable_id;
        std::uint64_t writable_id;
    };

    explicit Poller(OwnFd&& epoll_fd);

    void unregister(const std::uint64_t id) noexcept;
    int  updateInterest(const int fd, const FdSlots* const slots) const;
    void dispatch(const std::uint64_t id);

    OwnFd                                            epoll_fd_;
    std::uint64_t                                    last_id_;
    std::unordered_map<std::uint64_t, Registration> id_to_registration_;
    std::unordered_map<int, FdSlots>                 fd_to_slots_;

};  // Poller

}  // namespace io
}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_IO_POLLER_HPP_INCLUDED
