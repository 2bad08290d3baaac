//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace zfsx
{
namespace common
{
namespace io
{

void OwnFd::reset() noexcept
{
    const int fd = release();
    if (fd < 0)
    {
        return;
    }

    // Not `posixSyscallError` here b/c `close` must not be repeated on `EINTR` (the fd is already released).
    if (::close(fd) < 0)
    {
        const int err = errno;
        getLogger("io")->error("Failed to close file descriptor (fd={}): {}.", fd, std::strerror(err));
    }
}

}  // namespace io
}  // namespace common
}  // namespace zfsx
