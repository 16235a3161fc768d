#pragma once

/**
 * @file husk_loader.hpp
 * @brief Runtime loader: decrypts the payload and registers the protected code
 *
 * The loader is a state machine driven once per process:
 *
 *   INIT -> KEY_RESOLVED -> STRATEGY_SELECTED -> CODE_LOADED
 *        -> NATIVE_READY -> DELEGATED -> RUNNING
 *
 * Any failure moves it to FAILED with a RunError reason. There is no
 * recovery; the caller terminates the process.
 */

#include "husk_axml.hpp"
#include "husk_crypto.hpp"
#include "husk_key_slot.hpp"
#include "husk_memory.hpp"
#include "husk_native_cache.hpp"
#include "husk_payload.hpp"
#include "husk_errors.hpp"
#include "husk_verify.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace husk {

enum class LoaderState : uint8_t {
    Init,
    KeyResolved,
    StrategySelected,
    CodeLoaded,
    NativeReady,
    Delegated,
    Running,
    Failed
};

enum class LoadStrategy : uint8_t {
    InMemory,
    FileBased
};

const char* to_string(LoaderState state) noexcept;
const char* to_string(LoadStrategy strategy) noexcept;

/**
 * @brief Lowest capability level whose code loader accepts several in-memory buffers
 */
constexpr int IN_MEMORY_MIN_LEVEL = 27;

/**
 * @brief Lowest capability level whose in-memory code loader takes a library search path
 */
constexpr int IN_MEMORY_LIBRARY_PATH_MIN_LEVEL = 29;

/**
 * @brief Choose how decrypted code is handed to the platform
 */
LoadStrategy select_strategy(int capability_level) noexcept;

/**
 * @brief Whether an in-memory registration at this level carries the library directory
 *
 * Below it the platform loader is built without a search path and native
 * libraries resolve through the lookup interception alone.
 */
bool in_memory_takes_library_path(int capability_level) noexcept;

/**
 * @brief The process-side services the loader depends on
 *
 * The Android build implements this over JNI; tests implement it in memory.
 */
class RuntimeEnvironment {
public:
    virtual ~RuntimeEnvironment() = default;

    virtual int capability_level() const = 0;

    /**
     * @brief Raw payload container bytes from the installed package
     * @throws LoadError(PayloadCorrupt) when it is absent
     */
    virtual std::vector<uint8_t> read_payload() = 0;

    /**
     * @brief Private per-app directory for files derived from the payload
     */
    virtual std::string code_cache_dir() const = 0;

    /**
     * @brief Register decrypted code units, in order, as one code loader
     *
     * The buffers are wiped after the call returns. library_dir is empty
     * when in_memory_takes_library_path() is false for this level.
     */
    virtual void register_in_memory(const std::vector<std::span<const uint8_t>>& units,
                                    const std::string& library_dir) = 0;

    /**
     * @brief Register code unit files, in order, as one code loader
     */
    virtual void register_files(const std::vector<std::string>& paths,
                                const std::string& library_dir) = 0;
};

/**
 * @brief Values recorded from the hardened manifest
 */
struct LoaderOptions {
    std::string original_application;
    std::string original_factory;
    int min_sdk = 0;
    int target_sdk = 0;
    verify::DebuggerPolicy debugger_policy = verify::DebuggerPolicy::LogOnly;
    std::function<bool()> debugger_probe = verify::is_debugger_present;
    std::string abi = platform::current_abi();
};

/**
 * @brief Loader options from the delegation metadata of a hardened manifest
 *
 * Falls back to the platform application class when none was recorded.
 */
LoaderOptions options_from_manifest(const axml::Document& manifest);

/**
 * @brief What a completed load did
 */
struct LoaderSession {
    int capability_level = 0;
    LoadStrategy strategy = LoadStrategy::FileBased;
    std::string abi;
    std::vector<std::string> code_units;
    std::vector<std::string> code_files;  // FileBased only
    bool debugger_reported = false;
};

/**
 * @brief Loads the protected package contents into the running process
 */
class RuntimeLoader {
public:
    RuntimeLoader(RuntimeEnvironment& env, std::unique_ptr<KeyProvider> keys, LoaderOptions options);
    ~RuntimeLoader();

    RuntimeLoader(const RuntimeLoader&) = delete;
    RuntimeLoader& operator=(const RuntimeLoader&) = delete;

    /**
     * @brief Drive the loader from INIT to NATIVE_READY
     * @throws LoadError on any failure, leaving the loader FAILED
     */
    void load();

    /**
     * @brief Run the reference swap and record DELEGATED
     */
    void enter_delegated(const std::function<void()>& install);

    /**
     * @brief Run the original application's start and record RUNNING
     */
    void enter_running(const std::function<void()>& start);

    LoaderState state() const;
    RunError failure() const;
    const std::string& get_error() const;
    const LoaderSession& session() const;
    const LoaderOptions& options() const;

    /**
     * @brief Resolve a native library through the decrypted cache
     *
     * Returns nullopt before NATIVE_READY and for unprotected names.
     */
    std::optional<std::string> find_library(std::string_view name);

    /**
     * @brief Decrypt one protected asset
     * @return nullopt when the asset is not in the payload
     */
    std::optional<std::vector<uint8_t>> open_asset(const std::string& path);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace husk
