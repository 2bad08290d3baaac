//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_PLATFORM_POSIX_UTILS_HPP_INCLUDED
#define ZFSX_PLATFORM_POSIX_UTILS_HPP_INCLUDED

#include <cerrno>
#include <cstddef>
#include <sys/types.h>

namespace zfsx
{
namespace platform
{

/// Wraps a POSIX syscall and retries it if it was interrupted by a signal.
///
/// @return `0` on success, otherwise the `errno` of the failed call.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    while (call() < 0)
    {
        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
    return 0;
}

/// Wraps a POSIX data transfer call (`read`, `recv`, `send`, etc.) and retries it on `EINTR`.
///
/// The number of transferred bytes is stored into `out_count` (`0` on failure).
/// Would-block conditions are reported as `EAGAIN` (or `EWOULDBLOCK`) like any other error,
/// so that non-blocking callers can distinguish them from real failures.
///
template <typename Call>
int posixTransferError(const Call& call, std::size_t& out_count)
{
    out_count = 0;
    while (true)
    {
        const ssize_t result = call();
        if (result >= 0)
        {
            out_count = static_cast<std::size_t>(result);
            return 0;
        }

        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
}

}  // namespace platform
}  // namespace zfsx

#endif  // ZFSX_PLATFORM_POSIX_UTILS_HPP_INCLUDED
