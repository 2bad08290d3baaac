//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <ios>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
        , is_dirty_{false}
    {
    }

    // MARK: Config

    void save() override
    {
        if (!is_dirty_)
        {
            return;
        }

        try
        {
            root_["__meta__"]["last_modified"] = std::chrono::system_clock::now();

            const auto    cfg_str = toml::format(root_);
            std::ofstream file{file_path_, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc};
            file.exceptions(std::ios_base::failbit | std::ios_base::badbit);
            file << cfg_str;

            is_dirty_ = false;
            common::getLogger("engine")->debug("Config is saved (path='{}').", file_path_);

        } catch (const std::exception& ex)
        {
            common::getLogger("engine")->error("Failed to save config (path='{}'): {}", file_path_, ex.what());
        }
    }

    auto getHttpListen() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("http", "listen");
    }

    auto getBackendLibrary() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("backend", "library");
    }

    auto getPoolOpenMode() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("pool_open", "mode");
    }

    void setPoolOpenMode(const std::string& mode) override
    {
        const auto current_mode = getPoolOpenMode();
        if (current_mode && (*current_mode == mode))
        {
            return;
        }
        root_["pool_open"]["mode"] = mode;
        is_dirty_                  = true;
    }

    auto getPoolOpenOfflineSearchPaths() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("pool_open", "offline_search_paths");
    }

    auto getPoolOpenOfflinePools() const -> std::vector<std::string> override
    {
        return findImpl<std::vector<std::string>>("pool_open", "offline_pools").value_or(std::vector<std::string>{});
    }

    auto getExportMaxDownloadBytes() const -> cetl::optional<std::uint64_t> override
    {
        return findImpl<std::uint64_t>("export", "max_download_bytes");
    }

    auto getExportMaxChunkBytes() const -> cetl::optional<std::uint64_t> override
    {
        return findImpl<std::uint64_t>("export", "max_chunk_bytes");
    }

    auto getSessionsCapacity() const -> cetl::optional<std::uint64_t> override
    {
        return findImpl<std::uint64_t>("sessions", "capacity");
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception& ex)
        {
            // Missing key, or value of an unexpected type (or range).
            spdlog::trace("Config value is not found: {}", ex.what());
            return cetl::nullopt;
        }
    }

    std::string file_path_;
    TomlValue   root_;
    bool        is_dirty_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
