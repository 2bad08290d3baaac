//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "backend_error.hpp"
#include "logging.hpp"
#include "pool_session.hpp"
#include "raw_pool_api.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

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

using Json = nlohmann::json;

class PayloadShapeError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

std::uint64_t requireUnsigned(const Json& object, const char* const key)
{
    const auto& value = object.at(key);
    if (!value.is_number_unsigned())
    {
        throw PayloadShapeError{fmt::format("field '{}' must be an unsigned integer", key)};
    }
    return value.get<std::uint64_t>();
}

cetl::optional<std::uint64_t> findUnsigned(const Json& object, const char* const key)
{
    if (object.is_object())
    {
        const auto it = object.find(key);
        if ((it != object.end()) && it->is_number_unsigned())
        {
            return it->get<std::uint64_t>();
        }
    }
    return cetl::nullopt;
}

template <typename T>
cetl::optional<T> optionalField(const Json& object, const char* const key)
{
    const auto it = object.find(key);
    if ((it == object.end()) || it->is_null())
    {
        return cetl::nullopt;
    }
    return it->template get<T>();
}

DatasetCatalogEntry::Kind parseDatasetKind(const std::string& type)
{
    if (type == "filesystem")
    {
        return DatasetCatalogEntry::Kind::Filesystem;
    }
    if (type == "volume")
    {
        return DatasetCatalogEntry::Kind::Volume;
    }
    return DatasetCatalogEntry::Kind::Other;
}

BackendFailure payloadFailure(std::string message)
{
    return BackendFailure{BackendFailure::Kind::Payload, 0, std::move(message)};
}

class JsonPoolSession final : public PoolSession
{
public:
    explicit JsonPoolSession(RawPool::Ptr raw_pool)
        : raw_pool_{std::move(raw_pool)}
    {
        CETL_DEBUG_ASSERT(raw_pool_, "");
    }

    // MARK: PoolSession

    Result<std::vector<DatasetCatalogEntry>> listDatasetCatalog() override
    {
        return decode<std::vector<DatasetCatalogEntry>>(  //
            raw_pool_->datasets(),
            "dataset catalog",
            [](const Json& json) -> Result<std::vector<DatasetCatalogEntry>> {
                //
                if (!json.is_array())
                {
                    throw PayloadShapeError{"expected an array of datasets"};
                }
                std::vector<DatasetCatalogEntry> entries;
                entries.reserve(json.size());
                for (const auto& item : json)
                {
                    DatasetCatalogEntry entry;
                    entry.name       = item.at("name").get<std::string>();
                    entry.kind       = parseDatasetKind(item.at("type").get<std::string>());
                    entry.mountpoint = optionalField<std::string>(item, "mountpoint");
                    entry.mounted    = optionalField<bool>(item, "mounted");
                    entries.emplace_back(std::move(entry));
                }
                return entries;
            });
    }

    Result<std::uint64_t> rootDir() override
    {
        return decode<std::uint64_t>(  //
            raw_pool_->dslRootDir(),
            "DSL root payload",
            [](const Json& json) -> Result<std::uint64_t> {
                //
                if (const auto root_dir_obj = findUnsigned(json, "root_dir_obj"))
                {
                    return *root_dir_obj;
                }
                return payloadFailure("root_dir_obj missing in DSL root payload");
            });
    }

    Result<std::vector<DslDirChild>> dirChildren(const std::uint64_t dir_obj) override
    {
        return decode<std::vector<DslDirChild>>(  //
            raw_pool_->dslDirChildren(dir_obj),
            "DSL children payload",
            [](const Json& json) -> Result<std::vector<DslDirChild>> {
                //
                std::vector<DslDirChild> children;
                if (!json.is_object())
                {
                    return children;
                }
                const auto array = json.find("children");
                if ((array == json.end()) || !array->is_array())
                {
                    return children;
                }
                for (const auto& item : *array)
                {
                    // Entries without a usable directory object can't be descended into.
                    const auto child_obj = findUnsigned(item, "dir_objid");
                    if (!child_obj || (*child_obj == 0))
                    {
                        continue;
                    }
                    const auto name = item.find("name");
                    children.push_back({((name != item.end()) && name->is_string()) ? name->get<std::string>()
                                                                                    : std::string{"dataset"},
                                        *child_obj});
                }
                return children;
            });
    }

    Result<cetl::optional<std::uint64_t>> dirHeadDataset(const std::uint64_t dir_obj) override
    {
        return decode<cetl::optional<std::uint64_t>>(  //
            raw_pool_->dslDirHead(dir_obj),
            "DSL head payload",
            [](const Json& json) -> Result<cetl::optional<std::uint64_t>> {
                //
                const auto head_obj = findUnsigned(json, "head_dataset_obj");
                if (!head_obj || (*head_obj == 0))
                {
                    return cetl::optional<std::uint64_t>{};
                }
                return head_obj;
            });
    }

    Result<std::uint64_t> datasetObjset(const std::uint64_t dataset_obj) override
    {
        return decode<std::uint64_t>(  //
            raw_pool_->datasetObjset(dataset_obj),
            "dataset objset payload",
            [](const Json& json) -> Result<std::uint64_t> {
                //
                if (const auto objset_id = findUnsigned(json, "objset_id"))
                {
                    return *objset_id;
                }
                return payloadFailure("objset_id missing in dataset resolution payload");
            });
    }

    Result<ObjsetWalkResult> objsetWalk(const std::uint64_t objset_id, const std::string& path) override
    {
        return decode<ObjsetWalkResult>(  //
            raw_pool_->objsetWalk(objset_id, path),
            "walk payload",
            [](const Json& json) -> Result<ObjsetWalkResult> {
                //
                ObjsetWalkResult walk;
                walk.objid     = requireUnsigned(json, "objid");
                walk.found     = json.at("found").get<bool>();
                walk.remaining = json.at("remaining").get<std::string>();
                return walk;
            });
    }

    Result<ObjsetStatResult> objsetStat(const std::uint64_t objset_id, const std::uint64_t objid) override
    {
        return decode<ObjsetStatResult>(  //
            raw_pool_->objsetStat(objset_id, objid),
            "stat payload",
            [](const Json& json) -> Result<ObjsetStatResult> {
                //
                ObjsetStatResult stat;
                stat.size      = requireUnsigned(json, "size");
                stat.type_name = json.at("type_name").get<std::string>();
                return stat;
            });
    }

    Result<std::string> objsetRead(const std::uint64_t objset_id,
                                   const std::uint64_t objid,
                                   const std::uint64_t offset,
                                   const std::uint64_t max_len) override
    {
        return decode<std::string>(  //
            raw_pool_->objsetReadData(objset_id, objid, offset, max_len),
            "object data payload",
            [](const Json& json) -> Result<std::string> {
                //
                return json.at("data_hex").get<std::string>();
            });
    }

private:
    template <typename T, typename Decoder>
    Result<T> decode(const RawResult& raw, const char* const what, Decoder&& decoder)
    {
        if (!raw.isOk())
        {
            return BackendFailure{BackendFailure::Kind::Call,
                                  raw.err,
                                  raw.errmsg.empty() ? std::string{"Unknown error"} : raw.errmsg};
        }
        if (raw.json.empty())
        {
            return payloadFailure("Missing JSON in result");
        }

        try
        {
            const auto json = Json::parse(raw.json);
            return std::forward<Decoder>(decoder)(json);

        } catch (const Json::parse_error& ex)
        {
            logger_->error("Failed to parse JSON: {}", ex.what());
            return payloadFailure(fmt::format("JSON parse error: {}", ex.what()));

        } catch (const Json::exception& ex)
        {
            logger_->error("Unexpected shape of {}: {}", what, ex.what());
            return payloadFailure(fmt::format("failed to parse {}: {}", what, ex.what()));

        } catch (const PayloadShapeError& ex)
        {
            logger_->error("Unexpected shape of {}: {}", what, ex.what());
            return payloadFailure(fmt::format("failed to parse {}: {}", what, ex.what()));
        }
    }

    RawPool::Ptr            raw_pool_;
    const common::LoggerPtr logger_{common::getLogger("backend")};

};  // JsonPoolSession

}  // namespace

PoolSession::Ptr PoolSession::make(RawPool::Ptr raw_pool)
{
    return std::make_unique<JsonPoolSession>(std::move(raw_pool));
}

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
