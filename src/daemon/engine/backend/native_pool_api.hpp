//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZFSX_DAEMON_ENGINE_BACKEND_NATIVE_POOL_API_HPP_INCLUDED
#define ZFSX_DAEMON_ENGINE_BACKEND_NATIVE_POOL_API_HPP_INCLUDED

#include "raw_pool_api.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace zfsx
{
namespace daemon
{
namespace engine
{
namespace backend
{

/// Factory of the `RawPoolApi` implemented by the native `libzdbdecode` shared library.
///
/// The library is loaded at runtime (`dlopen`), its whole symbol table is bound eagerly,
/// and it is initialized (`zdx_init`) once. The library is finalized and unloaded
/// when the last reference to the api (including any still open pool) is released.
///
/// All calls into the library are serialized by a process-wide mutex.
///
class NativePoolApi final
{
public:
    struct Make
    {
        using Success = RawPoolApi::Ptr;
        using Failure = std::string;  // human-readable description (`dlerror`, missing symbol, etc.)
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static Make::Result make(const std::string& library_path);

    NativePoolApi() = delete;

};  // NativePoolApi

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx

#endif  // ZFSX_DAEMON_ENGINE_BACKEND_NATIVE_POOL_API_HPP_INCLUDED
