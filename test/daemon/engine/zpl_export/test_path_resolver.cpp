//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "zpl_export/path_resolver.hpp"

#include "backend/backend_error.hpp"
#include "backend/pool_session.hpp"
#include "backend/pool_session_mock.hpp"
#include "http/http_status.hpp"
#include "zpl_export/fault.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <string>
#include <vector>

namespace
{

using namespace zfsx::daemon::engine::zpl_export;  // NOLINT This our main concern here in the unit tests.
using namespace zfsx::daemon::engine::backend;     // NOLINT
using zfsx::common::http::Status;

using testing::_;
using testing::AllOf;
using testing::Eq;
using testing::Field;
using testing::HasSubstr;
using testing::Optional;
using testing::Return;
using testing::StrictMock;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestPathResolver : public testing::Test
{
protected:
    using Catalog = std::vector<DatasetCatalogEntry>;

    static DatasetCatalogEntry filesystem(const std::string&                 name,
                                          const cetl::optional<std::string>& mountpoint,
                                          const cetl::optional<bool>         mounted = true)
    {
        return DatasetCatalogEntry{name, DatasetCatalogEntry::Kind::Filesystem, mountpoint, mounted};
    }

    static Catalog tankCatalog()
    {
        return {filesystem("tank", std::string{"/tank"}), filesystem("tank/data", std::string{"/tank/data"})};
    }

    // `tank` is DSL dir 1 (objset 50), and `tank/data` is DSL dir 2 (objset 54).
    void expectDatasetTree()
    {
        EXPECT_CALL(session_mock_, rootDir()).WillRepeatedly(Return(std::uint64_t{1}));
        EXPECT_CALL(session_mock_, dirChildren(1))
            .WillRepeatedly(Return(std::vector<DslDirChild>{{"data", 2}, {"$ORIGIN", 3}}));
        EXPECT_CALL(session_mock_, dirHeadDataset(1)).WillRepeatedly(Return(cetl::optional<std::uint64_t>{10}));
        EXPECT_CALL(session_mock_, dirHeadDataset(2)).WillRepeatedly(Return(cetl::optional<std::uint64_t>{20}));
        EXPECT_CALL(session_mock_, datasetObjset(10)).WillRepeatedly(Return(std::uint64_t{50}));
        EXPECT_CALL(session_mock_, datasetObjset(20)).WillRepeatedly(Return(std::uint64_t{54}));
    }

    static testing::Matcher<const PathResolver::Resolve::Result&> isFault(const FaultKind kind, const Status status)
    {
        return VariantWith<Fault>(AllOf(Field(&Fault::kind, kind), Field(&Fault::status, status)));
    }

    // MARK: Data members:

    // NOLINTBEGIN
    StrictMock<PoolSessionMock> session_mock_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestPathResolver, empty_path)
{
    const PathResolver resolver{session_mock_};

    EXPECT_THAT(resolver.resolve("tank", ""), isFault(FaultKind::InvalidPath, Status::BadRequest));
    EXPECT_THAT(resolver.resolve("tank", " \t "), isFault(FaultKind::InvalidPath, Status::BadRequest));
}

TEST_F(TestPathResolver, longest_mountpoint_wins)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog()).WillOnce(Return(tankCatalog()));
    expectDatasetTree();
    EXPECT_CALL(session_mock_, objsetWalk(54, "/report.txt"))
        .WillOnce(Return(ObjsetWalkResult{128, true, ""}));
    EXPECT_CALL(session_mock_, objsetStat(54, 128)).WillOnce(Return(ObjsetStatResult{1000, "file"}));

    const auto result = resolver.resolve("tank", "/tank/data/report.txt");
    ASSERT_THAT(result, VariantWith<PathContext>(_));

    const auto& context = cetl::get<PathContext>(result);
    EXPECT_THAT(context.dataset_name, "tank/data");
    EXPECT_THAT(context.objset_id, 54);
    EXPECT_THAT(context.rel_path, "report.txt");
    EXPECT_THAT(context.objid, 128);
    EXPECT_THAT(context.file_size, 1000);
    EXPECT_THAT(context.filename, "report.txt");
}

TEST_F(TestPathResolver, dataset_relative_and_mount_paths_are_same)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog()).Times(2).WillRepeatedly(Return(tankCatalog()));
    expectDatasetTree();
    EXPECT_CALL(session_mock_, objsetWalk(54, "/docs/report.txt"))
        .Times(2)
        .WillRepeatedly(Return(ObjsetWalkResult{130, true, ""}));
    EXPECT_CALL(session_mock_, objsetStat(54, 130)).Times(2).WillRepeatedly(Return(ObjsetStatResult{7, "file"}));

    const auto by_dataset = resolver.resolve("tank", "tank/data/docs/report.txt");
    const auto by_mount   = resolver.resolve("tank", "/tank/data/docs/report.txt");
    ASSERT_THAT(by_dataset, VariantWith<PathContext>(_));
    ASSERT_THAT(by_mount, VariantWith<PathContext>(_));

    const auto& context1 = cetl::get<PathContext>(by_dataset);
    const auto& context2 = cetl::get<PathContext>(by_mount);
    EXPECT_THAT(context1.dataset_name, context2.dataset_name);
    EXPECT_THAT(context1.objset_id, context2.objset_id);
    EXPECT_THAT(context1.objid, context2.objid);
    EXPECT_THAT(context1.rel_path, "docs/report.txt");
    EXPECT_THAT(context2.rel_path, "docs/report.txt");
}

TEST_F(TestPathResolver, pool_root_dataset)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog()).WillOnce(Return(tankCatalog()));
    expectDatasetTree();
    EXPECT_CALL(session_mock_, objsetWalk(50, "/notes.txt")).WillOnce(Return(ObjsetWalkResult{9, true, ""}));
    EXPECT_CALL(session_mock_, objsetStat(50, 9)).WillOnce(Return(ObjsetStatResult{3, "file"}));

    const auto result = resolver.resolve("tank", "//tank/notes.txt");
    ASSERT_THAT(result, VariantWith<PathContext>(_));
    EXPECT_THAT(cetl::get<PathContext>(result).dataset_name, "tank");
    EXPECT_THAT(cetl::get<PathContext>(result).objset_id, 50);
}

TEST_F(TestPathResolver, synthetic_filename_for_dataset_root)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog()).WillOnce(Return(tankCatalog()));
    expectDatasetTree();
    EXPECT_CALL(session_mock_, objsetWalk(54, "/")).WillOnce(Return(ObjsetWalkResult{34, true, ""}));
    EXPECT_CALL(session_mock_, objsetStat(54, 34)).WillOnce(Return(ObjsetStatResult{0, "file"}));

    const auto result = resolver.resolve("tank", "tank/data/");
    ASSERT_THAT(result, VariantWith<PathContext>(_));
    EXPECT_THAT(cetl::get<PathContext>(result).rel_path, "");
    EXPECT_THAT(cetl::get<PathContext>(result).filename, "objset-54-obj-34");
}

TEST_F(TestPathResolver, unresolved_dataset)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog())
        .WillRepeatedly(Return(Catalog{
            filesystem("tank", std::string{"/tank"}),
            filesystem("tank/off", std::string{"/mnt/off"}, false),
            filesystem("tank/legacy", cetl::nullopt, cetl::nullopt),
            DatasetCatalogEntry{"tank/vol", DatasetCatalogEntry::Kind::Volume, std::string{"/mnt/vol"}, true},
        }));

    EXPECT_THAT(resolver.resolve("tank", "/mnt/off/a.txt"),
                isFault(FaultKind::DatasetPathUnresolved, Status::BadRequest));
    EXPECT_THAT(resolver.resolve("tank", "/mnt/vol/a.txt"),
                isFault(FaultKind::DatasetPathUnresolved, Status::BadRequest));
    EXPECT_THAT(resolver.resolve("tank", "tanker/a.txt"),
                isFault(FaultKind::DatasetPathUnresolved, Status::BadRequest));
}

TEST_F(TestPathResolver, match_dataset)
{
    const Catalog catalog{
        filesystem("tank", std::string{"/tank"}),
        filesystem("tank/data", std::string{"/srv/data"}, cetl::nullopt),
        filesystem("tank/data/deep", std::string{"/srv/data/deep"}, false),
    };

    // Unknown mount state counts as mounted.
    EXPECT_THAT(PathResolver::matchDataset(catalog, "srv/data/x", "/srv/data/x"),
                Optional(AllOf(Field(&PathResolver::DatasetMatch::dataset_name, "tank/data"),
                               Field(&PathResolver::DatasetMatch::rel_path, "x"),
                               Field(&PathResolver::DatasetMatch::length, 9))));

    // Unmounted dataset is still reachable by its name.
    EXPECT_THAT(PathResolver::matchDataset(catalog, "srv/data/deep/x", "/srv/data/deep/x"),
                Optional(Field(&PathResolver::DatasetMatch::dataset_name, "tank/data")));
    EXPECT_THAT(PathResolver::matchDataset(catalog, "tank/data/deep/x", "/tank/data/deep/x"),
                Optional(AllOf(Field(&PathResolver::DatasetMatch::dataset_name, "tank/data/deep"),
                               Field(&PathResolver::DatasetMatch::rel_path, "x"))));

    EXPECT_THAT(PathResolver::matchDataset(catalog, "tank", "/tank"),
                Optional(AllOf(Field(&PathResolver::DatasetMatch::dataset_name, "tank"),
                               Field(&PathResolver::DatasetMatch::rel_path, ""))));
    EXPECT_THAT(PathResolver::matchDataset(catalog, "srv", "/srv"), Eq(cetl::nullopt));
}

TEST_F(TestPathResolver, match_dataset_tie_keeps_first_candidate)
{
    // Two datasets share one mountpoint.
    const Catalog shared{
        filesystem("tank/a", std::string{"/mnt/shared"}),
        filesystem("tank/b", std::string{"/mnt/shared"}),
    };
    EXPECT_THAT(PathResolver::matchDataset(shared, "mnt/shared/f", "/mnt/shared/f"),
                Optional(AllOf(Field(&PathResolver::DatasetMatch::dataset_name, "tank/a"),
                               Field(&PathResolver::DatasetMatch::rel_path, "f"))));
    EXPECT_THAT(PathResolver::matchDataset(Catalog{shared[1], shared[0]}, "mnt/shared/f", "/mnt/shared/f"),
                Optional(Field(&PathResolver::DatasetMatch::dataset_name, "tank/b")));

    // A dataset name match and a mountpoint match of the same length.
    const Catalog mixed{
        filesystem("tank/ab", std::string{"/x"}),
        filesystem("tank/zz", std::string{"/mnt/xy"}),
    };
    EXPECT_THAT(PathResolver::matchDataset(mixed, "tank/ab/f", "/mnt/xy/f"),
                Optional(AllOf(Field(&PathResolver::DatasetMatch::dataset_name, "tank/ab"),
                               Field(&PathResolver::DatasetMatch::length, 7))));
    EXPECT_THAT(PathResolver::matchDataset(Catalog{mixed[1], mixed[0]}, "tank/ab/f", "/mnt/xy/f"),
                Optional(AllOf(Field(&PathResolver::DatasetMatch::dataset_name, "tank/zz"),
                               Field(&PathResolver::DatasetMatch::length, 7))));
}

TEST_F(TestPathResolver, dataset_not_found)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog())
        .WillOnce(Return(Catalog{filesystem("tank", std::string{"/tank"}),
                                 filesystem("tank/ghost", std::string{"/tank/ghost"})}));
    expectDatasetTree();

    const auto result = resolver.resolve("tank", "/tank/ghost/a.txt");
    EXPECT_THAT(result, isFault(FaultKind::DatasetNotFound, Status::NotFound));
    EXPECT_THAT(result, VariantWith<Fault>(Field(&Fault::code, "DATASET_NOT_FOUND")));
}

TEST_F(TestPathResolver, dataset_of_another_pool)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog())
        .WillOnce(Return(Catalog{filesystem("other/data", std::string{"/other/data"})}));
    EXPECT_CALL(session_mock_, rootDir()).WillOnce(Return(std::uint64_t{1}));

    EXPECT_THAT(resolver.resolve("tank", "/other/data/a.txt"),
                isFault(FaultKind::InvalidDatasetPath, Status::BadRequest));
}

TEST_F(TestPathResolver, dir_without_head_dataset)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog()).WillOnce(Return(tankCatalog()));
    EXPECT_CALL(session_mock_, rootDir()).WillOnce(Return(std::uint64_t{1}));
    EXPECT_CALL(session_mock_, dirHeadDataset(1)).WillOnce(Return(cetl::optional<std::uint64_t>{}));

    const auto result = resolver.resolve("tank", "/tank/a.txt");
    ASSERT_THAT(result, VariantWith<Fault>(_));
    EXPECT_THAT(cetl::get<Fault>(result).status, Status::BadRequest);
    EXPECT_THAT(cetl::get<Fault>(result).code, "HTTP_400");
    EXPECT_THAT(cetl::get<Fault>(result).message, HasSubstr("has no head dataset"));
}

TEST_F(TestPathResolver, objset_user_input_error)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog()).WillOnce(Return(tankCatalog()));
    EXPECT_CALL(session_mock_, rootDir()).WillOnce(Return(std::uint64_t{1}));
    EXPECT_CALL(session_mock_, dirHeadDataset(1)).WillOnce(Return(cetl::optional<std::uint64_t>{10}));
    EXPECT_CALL(session_mock_, datasetObjset(10))
        .WillOnce(Return(BackendFailure{BackendFailure::Kind::Call, EINVAL, "dataset 10 has no user-visible ZPL objset"}))
        .WillOnce(Return(BackendFailure{BackendFailure::Kind::Call, EIO, "dsl_pool_hold failed"}));

    EXPECT_THAT(resolver.resolve("tank", "/tank/a.txt"),
                VariantWith<Fault>(AllOf(Field(&Fault::status, Status::BadRequest), Field(&Fault::recoverable, true))));

    EXPECT_CALL(session_mock_, listDatasetCatalog()).WillOnce(Return(tankCatalog()));
    EXPECT_CALL(session_mock_, rootDir()).WillOnce(Return(std::uint64_t{1}));
    EXPECT_CALL(session_mock_, dirHeadDataset(1)).WillOnce(Return(cetl::optional<std::uint64_t>{10}));
    EXPECT_THAT(resolver.resolve("tank", "/tank/a.txt"),
                VariantWith<Fault>(AllOf(Field(&Fault::status, Status::InternalServerError),
                                         Field(&Fault::recoverable, false))));
}

TEST_F(TestPathResolver, path_not_found)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog()).Times(2).WillRepeatedly(Return(tankCatalog()));
    expectDatasetTree();
    EXPECT_CALL(session_mock_, objsetWalk(54, "/missing.txt")).WillOnce(Return(ObjsetWalkResult{34, false, ""}));
    EXPECT_CALL(session_mock_, objsetWalk(54, "/dir/missing.txt"))
        .WillOnce(Return(ObjsetWalkResult{77, true, "missing.txt"}));

    EXPECT_THAT(resolver.resolve("tank", "/tank/data/missing.txt"), isFault(FaultKind::PathNotFound, Status::NotFound));
    EXPECT_THAT(resolver.resolve("tank", "/tank/data/dir/missing.txt"),
                isFault(FaultKind::PathNotFound, Status::NotFound));
}

TEST_F(TestPathResolver, walk_and_stat_failures)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog()).WillRepeatedly(Return(tankCatalog()));
    expectDatasetTree();
    EXPECT_CALL(session_mock_, objsetWalk(54, "/a.txt"))
        .WillOnce(Return(BackendFailure{BackendFailure::Kind::Call, EIO, "zap_lookup failed"}))
        .WillOnce(Return(BackendFailure{BackendFailure::Kind::Payload, 0, "failed to parse walk payload"}))
        .WillRepeatedly(Return(ObjsetWalkResult{128, true, ""}));
    EXPECT_CALL(session_mock_, objsetStat(54, 128))
        .WillOnce(Return(BackendFailure{BackendFailure::Kind::Call, EIO, "dnode_hold failed for object 128"}))
        .WillOnce(Return(ObjsetStatResult{0, "directory"}));

    EXPECT_THAT(resolver.resolve("tank", "/tank/data/a.txt"), isFault(FaultKind::ZplWalkFailed, Status::BadRequest));
    EXPECT_THAT(resolver.resolve("tank", "/tank/data/a.txt"),
                isFault(FaultKind::Internal, Status::InternalServerError));
    EXPECT_THAT(resolver.resolve("tank", "/tank/data/a.txt"),
                isFault(FaultKind::ObjsetStatFailed, Status::BadRequest));
    EXPECT_THAT(resolver.resolve("tank", "/tank/data/a.txt"), isFault(FaultKind::NotAFile, Status::BadRequest));
}

TEST_F(TestPathResolver, catalog_failure)
{
    const PathResolver resolver{session_mock_};

    EXPECT_CALL(session_mock_, listDatasetCatalog())
        .WillOnce(Return(BackendFailure{BackendFailure::Kind::Call, EIO, "spa_open failed"}))
        .WillOnce(Return(BackendFailure{BackendFailure::Kind::Payload, 0, "JSON parse error"}));

    const auto result = resolver.resolve("tank", "/tank/a.txt");
    EXPECT_THAT(result, isFault(FaultKind::BackendFault, Status::InternalServerError));
    EXPECT_THAT(result, VariantWith<Fault>(Field(&Fault::code, "ERRNO_5")));

    EXPECT_THAT(resolver.resolve("tank", "/tank/a.txt"), isFault(FaultKind::Internal, Status::InternalServerError));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
