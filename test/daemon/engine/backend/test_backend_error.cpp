//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "backend/backend_error.hpp"

#include "backend/pool_open_mode.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>

namespace
{

using namespace zfsx::daemon::engine::backend;  // NOLINT This our main concern here in the unit tests.

using testing::Eq;
using testing::IsFalse;
using testing::IsNull;
using testing::IsTrue;
using testing::Optional;
using testing::StrEq;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestBackendError : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestBackendError, libzfs_error_name)
{
    EXPECT_THAT(libzfsErrorName(0), StrEq("EZFS_SUCCESS"));
    EXPECT_THAT(libzfsErrorName(2000), StrEq("EZFS_NOMEM"));
    EXPECT_THAT(libzfsErrorName(2009), StrEq("EZFS_NOENT"));
    EXPECT_THAT(libzfsErrorName(2031), StrEq("EZFS_PERM"));
    EXPECT_THAT(libzfsErrorName(2074), StrEq("EZFS_ACTIVE_POOL"));
    EXPECT_THAT(libzfsErrorName(2075), StrEq("EZFS_CRYPTOFAILED"));
    EXPECT_THAT(libzfsErrorName(2100), StrEq("EZFS_UNKNOWN"));

    EXPECT_THAT(libzfsErrorName(2101), IsNull());
    EXPECT_THAT(libzfsErrorName(ENOENT), IsNull());
    EXPECT_THAT(libzfsErrorName(-1), IsNull());
}

TEST_F(TestBackendError, backend_error_code_name)
{
    EXPECT_THAT(backendErrorCodeName(2009), "EZFS_NOENT");
    EXPECT_THAT(backendErrorCodeName(ENOENT), "ERRNO_2");
    EXPECT_THAT(backendErrorCodeName(EIO), "ERRNO_5");
    EXPECT_THAT(backendErrorCodeName(-3), "ZDX_-3");
}

TEST_F(TestBackendError, user_input_errors)
{
    EXPECT_THAT(isDatasetUserInputError("dataset 'tank/$ORIGIN' is $ORIGIN"), IsTrue());
    EXPECT_THAT(isDatasetUserInputError("dsl dir 42 has no head dataset"), IsTrue());
    EXPECT_THAT(isDatasetUserInputError("no user-visible ZPL objset for dataset 7"), IsTrue());
    EXPECT_THAT(isDatasetUserInputError("spa_open failed"), IsFalse());

    EXPECT_THAT(isObjsetUserInputError("dnode_hold failed for object 12345"), IsTrue());
    EXPECT_THAT(isObjsetUserInputError("objset is not ZFS"), IsTrue());
    EXPECT_THAT(isObjsetUserInputError("zap_lookup failed: 2"), IsTrue());
    EXPECT_THAT(isObjsetUserInputError("out of memory"), IsFalse());
    EXPECT_THAT(isObjsetUserInputError(""), IsFalse());
}

TEST_F(TestBackendError, pool_open_mode)
{
    EXPECT_THAT(poolOpenModeName(PoolOpenMode::Live), StrEq("live"));
    EXPECT_THAT(poolOpenModeName(PoolOpenMode::Offline), StrEq("offline"));

    EXPECT_THAT(parsePoolOpenMode("live"), Optional(PoolOpenMode::Live));
    EXPECT_THAT(parsePoolOpenMode(" OFFLINE\n"), Optional(PoolOpenMode::Offline));
    EXPECT_THAT(parsePoolOpenMode("Live"), Optional(PoolOpenMode::Live));
    EXPECT_THAT(parsePoolOpenMode(""), Eq(cetl::nullopt));
    EXPECT_THAT(parsePoolOpenMode("imported"), Eq(cetl::nullopt));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
