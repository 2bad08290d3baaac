//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "backend_error.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace backend
{
namespace
{

constexpr int LibzfsFirstErrorCode = 2000;

// Names of `zfs_error_t` codes, starting at `EZFS_NOMEM` (2000) and up to `EZFS_UNKNOWN`.
//
constexpr std::array<const char*, 101> LibzfsErrorNames{{
    "EZFS_NOMEM",
    "EZFS_BADPROP",
    "EZFS_PROPREADONLY",
    "EZFS_PROPTYPE",
    "EZFS_PROPNONINHERIT",
    "EZFS_PROPSPACE",
    "EZFS_BADTYPE",
    "EZFS_BUSY",
    "EZFS_EXISTS",
    "EZFS_NOENT",
    "EZFS_BADSTREAM",
    "EZFS_DSREADONLY",
    "EZFS_VOLTOOBIG",
    "EZFS_INVALIDNAME",
    "EZFS_BADRESTORE",
    "EZFS_BADBACKUP",
    "EZFS_BADTARGET",
    "EZFS_NODEVICE",
    "EZFS_BADDEV",
    "EZFS_NOREPLICAS",
    "EZFS_RESILVERING",
    "EZFS_BADVERSION",
    "EZFS_POOLUNAVAIL",
    "EZFS_DEVOVERFLOW",
    "EZFS_BADPATH",
    "EZFS_CROSSTARGET",
    "EZFS_ZONED",
    "EZFS_MOUNTFAILED",
    "EZFS_UMOUNTFAILED",
    "EZFS_UNSHARENFSFAILED",
    "EZFS_SHARENFSFAILED",
    "EZFS_PERM",
    "EZFS_NOSPC",
    "EZFS_FAULT",
    "EZFS_IO",
    "EZFS_INTR",
    "EZFS_ISSPARE",
    "EZFS_INVALCONFIG",
    "EZFS_RECURSIVE",
    "EZFS_NOHISTORY",
    "EZFS_POOLPROPS",
    "EZFS_POOL_NOTSUP",
    "EZFS_POOL_INVALARG",
    "EZFS_NAMETOOLONG",
    "EZFS_OPENFAILED",
    "EZFS_NOCAP",
    "EZFS_LABELFAILED",
    "EZFS_BADWHO",
    "EZFS_BADPERM",
    "EZFS_BADPERMSET",
    "EZFS_NODELEGATION",
    "EZFS_UNSHARESMBFAILED",
    "EZFS_SHARESMBFAILED",
    "EZFS_BADCACHE",
    "EZFS_ISL2CACHE",
    "EZFS_VDEVNOTSUP",
    "EZFS_NOTSUP",
    "EZFS_ACTIVE_SPARE",
    "EZFS_UNPLAYED_LOGS",
    "EZFS_REFTAG_RELE",
    "EZFS_REFTAG_HOLD",
    "EZFS_TAGTOOLONG",
    "EZFS_PIPEFAILED",
    "EZFS_THREADCREATEFAILED",
    "EZFS_POSTSPLIT_ONLINE",
    "EZFS_SCRUBBING",
    "EZFS_ERRORSCRUBBING",
    "EZFS_ERRORSCRUB_PAUSED",
    "EZFS_NO_SCRUB",
    "EZFS_DIFF",
    "EZFS_DIFFDATA",
    "EZFS_POOLREADONLY",
    "EZFS_SCRUB_PAUSED",
    "EZFS_SCRUB_PAUSED_TO_CANCEL",
    "EZFS_ACTIVE_POOL",
    "EZFS_CRYPTOFAILED",
    "EZFS_NO_PENDING",
    "EZFS_CHECKPOINT_EXISTS",
    "EZFS_DISCARDING_CHECKPOINT",
    "EZFS_NO_CHECKPOINT",
    "EZFS_DEVRM_IN_PROGRESS",
    "EZFS_VDEV_TOO_BIG",
    "EZFS_IOC_NOTSUPPORTED",
    "EZFS_TOOMANY",
    "EZFS_INITIALIZING",
    "EZFS_NO_INITIALIZE",
    "EZFS_WRONG_PARENT",
    "EZFS_TRIMMING",
    "EZFS_NO_TRIM",
    "EZFS_TRIM_NOTSUP",
    "EZFS_NO_RESILVER_DEFER",
    "EZFS_EXPORT_IN_PROGRESS",
    "EZFS_REBUILDING",
    "EZFS_VDEV_NOTSUP",
    "EZFS_NOT_USER_NAMESPACE",
    "EZFS_CKSUM",
    "EZFS_RESUME_EXISTS",
    "EZFS_SHAREFAILED",
    "EZFS_RAIDZ_EXPAND_IN_PROGRESS",
    "EZFS_ASHIFT_MISMATCH",
    "EZFS_UNKNOWN",
}};

bool containsAny(const std::string& message, const std::initializer_list<const char*> needles)
{
    return std::any_of(needles.begin(), needles.end(), [&message](const char* const needle) {
        //
        return message.find(needle) != std::string::npos;
    });
}

}  // namespace

const char* libzfsErrorName(const int code) noexcept
{
    if (code == 0)
    {
        return "EZFS_SUCCESS";
    }
    if (code < LibzfsFirstErrorCode)
    {
        return nullptr;
    }
    const auto index = static_cast<std::size_t>(code - LibzfsFirstErrorCode);
    return (index < LibzfsErrorNames.size()) ? LibzfsErrorNames[index] : nullptr;
}

std::string backendErrorCodeName(const int code)
{
    if (const auto* const name = libzfsErrorName(code))
    {
        return name;
    }
    if (code > 0)
    {
        return "ERRNO_" + std::to_string(code);
    }
    return "ZDX_" + std::to_string(code);
}

bool isDatasetUserInputError(const std::string& message)
{
    return containsAny(message,
                       {"has no head dataset",
                        "head dataset bonus unsupported",
                        "is $ORIGIN",
                        "no user-visible ZPL objset"});
}

bool isObjsetUserInputError(const std::string& message)
{
    return containsAny(message,
                       {"dnode_hold failed for object",
                        "objset is not ZFS",
                        "dsl_dataset_hold_obj failed",
                        "dmu_object_next failed",
                        "dmu_object_info failed for object",
                        "dmu_read failed for object",
                        "zap_get_stats failed",
                        "zap_lookup failed",
                        "zap_cursor_retrieve failed"});
}

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
