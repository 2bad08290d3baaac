//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_ZPL_EXPORT_FAULT_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_ZPL_EXPORT_FAULT_HPP_INCLUDED

#include "backend/backend_error.hpp"
#include "backend/session_cache.hpp"
#include "http/http_status.hpp"
#include "http/response.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace zpl_export
{

/// Closed set of reasons why a request could not be served.
///
enum class FaultKind
{
    InvalidPath,
    DatasetPathUnresolved,
    InvalidDatasetPath,
    DatasetNotFound,
    ZplWalkFailed,
    PathNotFound,
    ObjsetStatFailed,
    NotAFile,
    BadRange,
    RangeNotSatisfiable,
    DownloadTooLarge,
    ShortRead,
    ClientGone,    ///< The HTTP peer went away - nothing is sent.
    BackendFault,  ///< Failed backend call; `code` is the symbolic backend code name.
    Internal,      ///< Unexpected backend payload, or other server-side inconsistency.
    Http,          ///< Generic fault with `HTTP_<status>` code.

};  // FaultKind

struct Fault
{
    FaultKind                   kind;
    common::http::Status        status;
    std::string                 code;
    std::string                 message;
    cetl::optional<std::string> hint;
    bool                        recoverable;

    /// Makes a fault of a kind which has dedicated code and status (all except `BackendFault`, `Internal` and `Http`).
    ///
    static Fault make(const FaultKind kind, std::string message, cetl::optional<std::string> hint = cetl::nullopt);

    /// Makes a generic fault with `HTTP_<status>` code; recoverable if the status is 4xx.
    ///
    static Fault http(const common::http::Status status, std::string message);

    /// Makes a server-side (500, non-recoverable) fault.
    ///
    static Fault internal(std::string message);

    static Fault clientGone();

    /// Makes a fault from a failed backend call, with the code named after the backend code.
    ///
    static Fault backend(const common::http::Status status,
                         const int                  backend_code,
                         std::string                message,
                         const bool                 recoverable);

    bool isServerSide() const noexcept
    {
        return !common::http::isClientError(status);
    }

};  // Fault

/// Gets the dedicated code of a fault kind (f.e. `BAD_RANGE`), or `nullptr` for kinds without one.
///
const char* faultKindCode(const FaultKind kind) noexcept;

/// Maps a backend failure (which has no dedicated fault kind) to a generic fault.
///
/// Payload shape failures are internal faults; failed calls get the given status and message prefix.
///
Fault genericBackendFault(const backend::BackendFailure& failure,
                          const common::http::Status     call_status,
                          const std::string&             message_prefix);

/// Maps a pool open failure to a fault, with a hint for the expected (client-side) conditions.
///
Fault poolOpenFault(const backend::PoolOpenFailure& failure);

/// Makes JSON error response:
/// `{"error": <message>, "message": <message>, "code": <code>, "recoverable": <bool>[, "hint": <hint>]}`.
///
common::http::Response makeErrorResponse(const Fault& fault);

}  // namespace zpl_export
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_ZPL_EXPORT_FAULT_HPP_INCLUDED
