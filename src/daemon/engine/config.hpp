//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace zfsx
{
namespace daemon
{
namespace engine
{

/// Daemon configuration, backed by a TOML file.
///
/// All keys are optional - getters return `nullopt` (or an empty list) for missing or mistyped values,
/// and the caller applies its defaults.
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Loads configuration from the given file.
    ///
    /// Throws if the file can't be read or is not a valid TOML.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    /// Writes the configuration back to its file, but only if it was modified.
    ///
    virtual void save() = 0;

    CETL_NODISCARD virtual auto getHttpListen() const -> cetl::optional<std::string>                  = 0;
    CETL_NODISCARD virtual auto getBackendLibrary() const -> cetl::optional<std::string>              = 0;
    CETL_NODISCARD virtual auto getPoolOpenMode() const -> cetl::optional<std::string>                = 0;
    virtual void                setPoolOpenMode(const std::string& mode)                              = 0;
    CETL_NODISCARD virtual auto getPoolOpenOfflineSearchPaths() const -> cetl::optional<std::string>  = 0;
    CETL_NODISCARD virtual auto getPoolOpenOfflinePools() const -> std::vector<std::string>           = 0;
    CETL_NODISCARD virtual auto getExportMaxDownloadBytes() const -> cetl::optional<std::uint64_t>    = 0;
    CETL_NODISCARD virtual auto getExportMaxChunkBytes() const -> cetl::optional<std::uint64_t>       = 0;
    CETL_NODISCARD virtual auto getSessionsCapacity() const -> cetl::optional<std::uint64_t>          = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>                 = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>                = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string>           = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
