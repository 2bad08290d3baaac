//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "fault.hpp"

#include "backend/backend_error.hpp"
#include "backend/pool_open_mode.hpp"
#include "backend/session_cache.hpp"
#include "http/http_status.hpp"
#include "http/response.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace zpl_export
{
namespace
{

using common::http::Status;

Status faultKindStatus(const FaultKind kind) noexcept
{
    switch (kind)
    {
    case FaultKind::DatasetNotFound:
    case FaultKind::PathNotFound:
        return Status::NotFound;
    case FaultKind::RangeNotSatisfiable:
        return Status::RangeNotSatisfiable;
    case FaultKind::ShortRead:
    case FaultKind::BackendFault:
    case FaultKind::Internal:
    case FaultKind::Http:
        return Status::InternalServerError;
    case FaultKind::ClientGone:
        return Status::ServiceUnavailable;
    default:
        return Status::BadRequest;
    }
}

bool isLibzfsError(const int code, const char* const name) noexcept
{
    const char* const known = backend::libzfsErrorName(code);
    return (known != nullptr) && (0 == std::strcmp(known, name));
}

cetl::optional<std::string> offlinePoolOpenHint(const std::string& pool, const int code)
{
    if (isLibzfsError(code, "EZFS_NOENT") || (code == ENOENT))
    {
        return fmt::format("Pool '{}' was not found in the offline search paths. Ensure the pool is exported and "
                           "`pool_open.offline_search_paths` points to parent directories (for example /dev/disk/by-id).",
                           pool);
    }
    if (isLibzfsError(code, "EZFS_PERM") || (code == EACCES) || (code == EPERM))
    {
        return std::string{"Permission denied while opening offline media. Run the daemon as root "
                           "or grant read access to the underlying devices/images."};
    }
    if (isLibzfsError(code, "EZFS_ACTIVE_POOL") || (code == EEXIST))
    {
        return fmt::format("Pool '{}' appears active/imported. Export it before opening in offline mode.", pool);
    }
    if (isLibzfsError(code, "EZFS_CRYPTOFAILED"))
    {
        return std::string{"The pool appears encrypted and keys are unavailable in offline mode. "
                           "Unlock keys first, or inspect metadata-only views."};
    }
    return cetl::nullopt;
}

bool isExpectedPoolOpenError(const backend::PoolOpenMode mode, const int code) noexcept
{
    if ((code == ENOENT) || (code == EACCES) || (code == EPERM) || (code == EEXIST))
    {
        return true;
    }
    return (mode == backend::PoolOpenMode::Offline) &&
           (isLibzfsError(code, "EZFS_NOENT") || isLibzfsError(code, "EZFS_PERM") ||
            isLibzfsError(code, "EZFS_ACTIVE_POOL") || isLibzfsError(code, "EZFS_CRYPTOFAILED"));
}

}  // namespace

const char* faultKindCode(const FaultKind kind) noexcept
{
    switch (kind)
    {
    case FaultKind::InvalidPath:
        return "INVALID_PATH";
    case FaultKind::DatasetPathUnresolved:
        return "DATASET_PATH_UNRESOLVED";
    case FaultKind::InvalidDatasetPath:
        return "INVALID_DATASET_PATH";
    case FaultKind::DatasetNotFound:
        return "DATASET_NOT_FOUND";
    case FaultKind::ZplWalkFailed:
        return "ZPL_WALK_FAILED";
    case FaultKind::PathNotFound:
        return "PATH_NOT_FOUND";
    case FaultKind::ObjsetStatFailed:
        return "OBJSET_STAT_FAILED";
    case FaultKind::NotAFile:
        return "NOT_A_FILE";
    case FaultKind::BadRange:
        return "BAD_RANGE";
    case FaultKind::RangeNotSatisfiable:
        return "RANGE_NOT_SATISFIABLE";
    case FaultKind::DownloadTooLarge:
        return "DOWNLOAD_TOO_LARGE";
    case FaultKind::ShortRead:
        return "SHORT_READ";
    case FaultKind::ClientGone:
        return "CLIENT_GONE";
    default:
        return nullptr;
    }
}

Fault Fault::make(const FaultKind kind, std::string message, cetl::optional<std::string> hint)
{
    const char* const code = faultKindCode(kind);
    if (code == nullptr)
    {
        return internal(std::move(message));
    }

    const auto status = faultKindStatus(kind);
    return Fault{kind, status, code, std::move(message), std::move(hint), common::http::isClientError(status)};
}

Fault Fault::http(const Status status, std::string message)
{
    return Fault{FaultKind::Http,
                 status,
                 fmt::format("HTTP_{}", common::http::toCode(status)),
                 std::move(message),
                 cetl::nullopt,
                 common::http::isClientError(status)};
}

Fault Fault::internal(std::string message)
{
    auto fault = http(Status::InternalServerError, std::move(message));
    fault.kind = FaultKind::Internal;
    return fault;
}

Fault Fault::clientGone()
{
    return make(FaultKind::ClientGone, "client has disconnected");
}

Fault Fault::backend(const Status status, const int backend_code, std::string message, const bool recoverable)
{
    return Fault{FaultKind::BackendFault,
                 status,
                 backend::backendErrorCodeName(backend_code),
                 std::move(message),
                 cetl::nullopt,
                 recoverable};
}

Fault genericBackendFault(const backend::BackendFailure& failure,
                          const Status                   call_status,
                          const std::string&             message_prefix)
{
    if (failure.kind == backend::BackendFailure::Kind::Payload)
    {
        return Fault::internal(failure.message);
    }
    return Fault::http(call_status, message_prefix + failure.message);
}

Fault poolOpenFault(const backend::PoolOpenFailure& failure)
{
    const auto logger    = common::getLogger("export");
    const auto mode_name = backend::poolOpenModeName(failure.mode);
    const auto code_name = backend::backendErrorCodeName(failure.code);

    cetl::optional<std::string> hint;
    if (failure.mode == backend::PoolOpenMode::Offline)
    {
        hint = offlinePoolOpenHint(failure.pool, failure.code);
    }
    else if ((failure.code == EACCES) || (failure.code == EPERM))
    {
        hint = std::string{"Run the daemon with root privileges for live imported pools."};
    }

    const bool expected = isExpectedPoolOpenError(failure.mode, failure.code);
    if (expected)
    {
        logger->warn("Pool open warning for '{}' (mode={}, code={}): {}.",
                     failure.pool,
                     mode_name,
                     code_name,
                     failure.message);
    }
    else
    {
        logger->error("Failed to open pool '{}' (mode={}, code={}): {}.",
                      failure.pool,
                      mode_name,
                      code_name,
                      failure.message);
    }

    auto fault = Fault::backend(expected ? Status::BadRequest : Status::InternalServerError,
                                failure.code,
                                fmt::format("pool open failed ({}): {}", mode_name, failure.message),
                                true);
    fault.hint = std::move(hint);
    return fault;
}

common::http::Response makeErrorResponse(const Fault& fault)
{
    nlohmann::json payload{
        {"error", fault.message},
        {"message", fault.message},
        {"code", fault.code},
        {"recoverable", fault.recoverable},
    };
    if (fault.hint)
    {
        payload["hint"] = *fault.hint;
    }

    // Backend messages may carry raw on-disk names, so invalid UTF-8 is replaced.
    return common::http::Response::json(fault.status,
                                        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
