//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_BACKEND_BACKEND_ERROR_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_BACKEND_BACKEND_ERROR_HPP_INCLUDED

#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace backend
{

/// Failure reported by the pool backend (or by decoding of its payloads).
///
struct BackendFailure
{
    enum class Kind
    {
        Call,     ///< The backend call itself has failed; `code` is the backend (errno or `EZFS_*`) code.
        Payload,  ///< The call succeeded, but its payload has unexpected shape.
    };

    Kind        kind;
    int         code;
    std::string message;

};  // BackendFailure

/// Gets the libzfs `EZFS_*` name of the code, or `nullptr` if the code is not in the libzfs table.
///
const char* libzfsErrorName(const int code) noexcept;

/// Gets a stable symbolic name of a raw backend code.
///
/// The libzfs names are used where known; otherwise positive codes are named `ERRNO_<n>`,
/// and the rest (backend specific negative codes) are named `ZDX_<n>`.
///
std::string backendErrorCodeName(const int code);

/// Whether the backend message of a failed dataset-to-objset resolution names a condition of the requested
/// dataset itself (f.e. `$ORIGIN`, or a dataset without ZPL objset), rather than a backend malfunction.
///
bool isDatasetUserInputError(const std::string& message);

/// Whether the backend message of a failed objset data access names bad object/objset input.
///
bool isObjsetUserInputError(const std::string& message);

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_BACKEND_BACKEND_ERROR_HPP_INCLUDED
