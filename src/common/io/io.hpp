//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_COMMON_IO_HPP_INCLUDED
#define ZFSX_COMMON_IO_HPP_INCLUDED

#include <cstddef>
#include <utility>

namespace zfsx
{
namespace common
{
namespace io
{

/// RAII owner of a POSIX file descriptor (socket, epoll instance, pid file, etc.).
///
/// The descriptor is closed on destruction, on `reset`, or when another descriptor is move-assigned.
///
class OwnFd final
{
public:
    OwnFd() noexcept
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd) noexcept
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{other.release()}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    OwnFd& operator=(std::nullptr_t) noexcept
    {
        reset();
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    ~OwnFd()
    {
        reset();
    }

    int get() const noexcept
    {
        return fd_;
    }

    bool isValid() const noexcept
    {
        return fd_ >= 0;
    }

    /// Gives up the ownership without closing the descriptor.
    ///
    int release() noexcept
    {
        return std::exchange(fd_, -1);
    }

    void reset() noexcept;

private:
    int fd_;

};  // OwnFd

}  // namespace io
}  // namespace common
}  // namespace zfsx

#endif  // ZFSX_COMMON_IO_HPP_INCLUDED
