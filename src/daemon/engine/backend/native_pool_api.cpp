//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "native_pool_api.hpp"

#include "logging.hpp"
#include "raw_pool_api.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <dlfcn.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

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

// Mirrors `zdx_result_t` of the `zdbdecode.h` C header.
//
struct ZdxResult
{
    char*       json;
    std::size_t len;
    int         err;
    char*       errmsg;
};

// Opaque `zdx_pool_t`.
//
struct ZdxPool;

struct Symbols
{
    int (*init)();
    void (*fini)();
    const char* (*version)();
    void (*free_result)(ZdxResult*);
    ZdxResult (*list_pools)();
    ZdxPool* (*pool_open)(const char*, int*);
    ZdxPool* (*pool_open_offline)(const char*, const char*, int*);
    void (*pool_close)(ZdxPool*);
    ZdxResult (*pool_datasets)(ZdxPool*);
    ZdxResult (*dsl_root_dir)(ZdxPool*);
    ZdxResult (*dsl_dir_children)(ZdxPool*, std::uint64_t);
    ZdxResult (*dsl_dir_head)(ZdxPool*, std::uint64_t);
    ZdxResult (*dataset_objset)(ZdxPool*, std::uint64_t);
    ZdxResult (*objset_walk)(ZdxPool*, std::uint64_t, const char*);
    ZdxResult (*objset_stat)(ZdxPool*, std::uint64_t, std::uint64_t);
    ZdxResult (*objset_read_data)(ZdxPool*, std::uint64_t, std::uint64_t, std::uint64_t, std::uint64_t);

};  // Symbols

struct SymbolEntry
{
    const char* name;
    void**      address;
};

// The library keeps global (non-reentrant) state, so all calls are serialized,
// regardless of which pool (or api instance) they belong to.
//
std::mutex& callMutex()
{
    static std::mutex mutex;
    return mutex;
}

/// Owns the loaded (and initialized) library.
///
class Library final
{
public:
    using Ptr = std::shared_ptr<Library>;

    Library(void* const handle, const Symbols& symbols)
        : handle_{handle}
        , symbols_{symbols}
    {
        CETL_DEBUG_ASSERT(handle_ != nullptr, "");
    }

    Library(const Library&)                = delete;
    Library(Library&&) noexcept            = delete;
    Library& operator=(const Library&)     = delete;
    Library& operator=(Library&&) noexcept = delete;

    ~Library()
    {
        {
            const std::lock_guard<std::mutex> lock{callMutex()};
            symbols_.fini();
        }
        if (::dlclose(handle_) != 0)
        {
            logger_->warn("Failed to unload backend library (err='{}').", ::dlerror());
        }
        logger_->debug("Backend library unloaded.");
    }

    const Symbols& symbols() const noexcept
    {
        return symbols_;
    }

    /// Copies the result, and then releases it back to the library.
    ///
    /// Should be called with the call mutex locked.
    ///
    RawResult takeResult(ZdxResult& raw) const
    {
        RawResult result;
        result.err = raw.err;
        if (raw.json != nullptr)
        {
            result.json.assign(raw.json, raw.len);
        }
        if (raw.errmsg != nullptr)
        {
            result.errmsg = raw.errmsg;
        }
        symbols_.free_result(&raw);
        return result;
    }

private:
    void* const             handle_;
    const Symbols           symbols_;
    const common::LoggerPtr logger_{common::getLogger("backend")};

};  // Library

class NativePool final : public RawPool
{
public:
    NativePool(Library::Ptr library, ZdxPool* const pool, std::string name)
        : library_{std::move(library)}
        , pool_{pool}
        , name_{std::move(name)}
    {
        CETL_DEBUG_ASSERT(library_, "");
        CETL_DEBUG_ASSERT(pool_ != nullptr, "");
    }

    NativePool(const NativePool&)                = delete;
    NativePool(NativePool&&) noexcept            = delete;
    NativePool& operator=(const NativePool&)     = delete;
    NativePool& operator=(NativePool&&) noexcept = delete;

    ~NativePool() override
    {
        logger_->debug("Closing pool '{}'.", name_);

        const std::lock_guard<std::mutex> lock{callMutex()};
        library_->symbols().pool_close(pool_);
    }

    // MARK: RawPool

    RawResult datasets() override
    {
        return call([this](const Symbols& sym) {
            //
            return sym.pool_datasets(pool_);
        });
    }

    RawResult dslRootDir() override
    {
        return call([this](const Symbols& sym) {
            //
            return sym.dsl_root_dir(pool_);
        });
    }

    RawResult dslDirChildren(const std::uint64_t dir_obj) override
    {
        return call([this, dir_obj](const Symbols& sym) {
            //
            return sym.dsl_dir_children(pool_, dir_obj);
        });
    }

    RawResult dslDirHead(const std::uint64_t dir_obj) override
    {
        return call([this, dir_obj](const Symbols& sym) {
            //
            return sym.dsl_dir_head(pool_, dir_obj);
        });
    }

    RawResult datasetObjset(const std::uint64_t dataset_obj) override
    {
        return call([this, dataset_obj](const Symbols& sym) {
            //
            return sym.dataset_objset(pool_, dataset_obj);
        });
    }

    RawResult objsetWalk(const std::uint64_t objset_id, const std::string& path) override
    {
        return call([this, objset_id, &path](const Symbols& sym) {
            //
            return sym.objset_walk(pool_, objset_id, path.c_str());
        });
    }

    RawResult objsetStat(const std::uint64_t objset_id, const std::uint64_t objid) override
    {
        return call([this, objset_id, objid](const Symbols& sym) {
            //
            return sym.objset_stat(pool_, objset_id, objid);
        });
    }

    RawResult objsetReadData(const std::uint64_t objset_id,
                             const std::uint64_t objid,
                             const std::uint64_t offset,
                             const std::uint64_t limit) override
    {
        return call([this, objset_id, objid, offset, limit](const Symbols& sym) {
            //
            return sym.objset_read_data(pool_, objset_id, objid, offset, limit);
        });
    }

private:
    template <typename Action>
    RawResult call(Action&& action)
    {
        const std::lock_guard<std::mutex> lock{callMutex()};

        ZdxResult raw = std::forward<Action>(action)(library_->symbols());
        return library_->takeResult(raw);
    }

    const Library::Ptr      library_;
    ZdxPool* const          pool_;
    const std::string       name_;
    const common::LoggerPtr logger_{common::getLogger("backend")};

};  // NativePool

class NativePoolApiImpl final : public RawPoolApi
{
public:
    explicit NativePoolApiImpl(Library::Ptr library)
        : library_{std::move(library)}
    {
    }

    // MARK: RawPoolApi

    CETL_NODISCARD OpenPool::Result openPool(const std::string& name) override
    {
        int      err  = 0;
        ZdxPool* pool = nullptr;
        {
            const std::lock_guard<std::mutex> lock{callMutex()};
            pool = library_->symbols().pool_open(name.c_str(), &err);
        }
        return makeOpenResult(name, pool, err);
    }

    CETL_NODISCARD OpenPool::Result openPoolOffline(const std::string&                 name,
                                                    const cetl::optional<std::string>& search_paths) override
    {
        int      err  = 0;
        ZdxPool* pool = nullptr;
        {
            const std::lock_guard<std::mutex> lock{callMutex()};
            pool = library_->symbols().pool_open_offline(name.c_str(),
                                                         search_paths ? search_paths->c_str() : nullptr,
                                                         &err);
        }
        return makeOpenResult(name, pool, err);
    }

    CETL_NODISCARD RawResult listPools() override
    {
        const std::lock_guard<std::mutex> lock{callMutex()};

        ZdxResult raw = library_->symbols().list_pools();
        return library_->takeResult(raw);
    }

    std::string version() override
    {
        const std::lock_guard<std::mutex> lock{callMutex()};

        const char* const version = library_->symbols().version();
        return (version != nullptr) ? version : "unknown";
    }

private:
    OpenPool::Result makeOpenResult(const std::string& name, ZdxPool* const pool, const int err) const
    {
        if (pool == nullptr)
        {
            // Library did not say why - report it as a generic I/O failure.
            return (err != 0) ? err : EIO;
        }

        logger_->debug("Pool '{}' is opened.", name);
        return RawPool::Ptr{std::make_unique<NativePool>(library_, pool, name)};
    }

    const Library::Ptr      library_;
    const common::LoggerPtr logger_{common::getLogger("backend")};

};  // NativePoolApiImpl

}  // namespace

NativePoolApi::Make::Result NativePoolApi::make(const std::string& library_path)
{
    const auto logger = common::getLogger("backend");

    void* const handle = ::dlopen(library_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr)
    {
        const char* const dl_err = ::dlerror();
        return std::string{"dlopen('"} + library_path + "') failed: " + ((dl_err != nullptr) ? dl_err : "?");
    }

    Symbols symbols{};

    // clang-format off
    const SymbolEntry symtable[] = {  // NOLINT(*-avoid-c-arrays)
        {"zdx_init",              reinterpret_cast<void**>(&symbols.init)},               // NOLINT
        {"zdx_fini",              reinterpret_cast<void**>(&symbols.fini)},               // NOLINT
        {"zdx_version",           reinterpret_cast<void**>(&symbols.version)},            // NOLINT
        {"zdx_free_result",       reinterpret_cast<void**>(&symbols.free_result)},        // NOLINT
        {"zdx_list_pools",        reinterpret_cast<void**>(&symbols.list_pools)},         // NOLINT
        {"zdx_pool_open",         reinterpret_cast<void**>(&symbols.pool_open)},          // NOLINT
        {"zdx_pool_open_offline", reinterpret_cast<void**>(&symbols.pool_open_offline)},  // NOLINT
        {"zdx_pool_close",        reinterpret_cast<void**>(&symbols.pool_close)},         // NOLINT
        {"zdx_pool_datasets",     reinterpret_cast<void**>(&symbols.pool_datasets)},      // NOLINT
        {"zdx_dsl_root_dir",      reinterpret_cast<void**>(&symbols.dsl_root_dir)},       // NOLINT
        {"zdx_dsl_dir_children",  reinterpret_cast<void**>(&symbols.dsl_dir_children)},   // NOLINT
        {"zdx_dsl_dir_head",      reinterpret_cast<void**>(&symbols.dsl_dir_head)},       // NOLINT
        {"zdx_dataset_objset",    reinterpret_cast<void**>(&symbols.dataset_objset)},     // NOLINT
        {"zdx_objset_walk",       reinterpret_cast<void**>(&symbols.objset_walk)},        // NOLINT
        {"zdx_objset_stat",       reinterpret_cast<void**>(&symbols.objset_stat)},        // NOLINT
        {"zdx_objset_read_data",  reinterpret_cast<void**>(&symbols.objset_read_data)},   // NOLINT
    };
    // clang-format on

    for (const auto& entry : symtable)
    {
        ::dlerror();  // clear any stale error
        *entry.address = ::dlsym(handle, entry.name);
        if (*entry.address == nullptr)
        {
            const char* const dl_err = ::dlerror();
            std::string       failure{std::string{"dlsym('"} + entry.name + "') failed: " +
                                ((dl_err != nullptr) ? dl_err : "null symbol")};
            (void) ::dlclose(handle);
            return failure;
        }
        logger->trace("Bound '{}' at {}.", entry.name, *entry.address);
    }

    int init_err = 0;
    {
        const std::lock_guard<std::mutex> lock{callMutex()};
        init_err = symbols.init();
    }
    if (init_err != 0)
    {
        (void) ::dlclose(handle);
        return std::string{"zdx_init failed with code "} + std::to_string(init_err);
    }

    logger->info("Backend library '{}' is loaded.", library_path);

    auto library = std::make_shared<Library>(handle, symbols);
    return RawPoolApi::Ptr{std::make_shared<NativePoolApiImpl>(std::move(library))};
}

}  // namespace backend
}  // namespace engine
}  // namespace daemon
}  // namespace zfsx
