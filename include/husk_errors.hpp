#pragma once

/**
 * @file husk_errors.hpp
 * @brief Build-time and run-time failure taxonomies
 */

#include <stdexcept>
#include <string>
#include <cstdint>
#include <exception>
#include <type_traits>

namespace husk {

/**
 * @brief Failures reported by the packer pipeline
 */
enum class BuildError : uint8_t {
    None = 0,
    ParseError,
    ManifestIncomplete,
    UnsupportedSplitConfiguration,
    SigningUnavailable,
    StubMissing,
    NothingToProtect,
    IoError,
    Cancelled
};

/**
 * @brief Failures reported by the runtime loader and delegation
 *
 * Every value except None is fatal to the process.
 */
enum class RunError : uint8_t {
    None = 0,
    PayloadCorrupt,
    KeyUnavailable,
    AuthenticationFailure,
    UnsupportedPlatformCapability,
    NativeLibraryMissingForAbi,
    OriginalApplicationConstructionFailed,
    DebuggerDetected,
    IoError
};

const char* to_string(BuildError code) noexcept;
const char* to_string(RunError code) noexcept;

/**
 * @brief Exception thrown inside the packer pipeline
 */
class PackError : public std::runtime_error {
public:
    PackError(BuildError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    BuildError code() const noexcept { return code_; }

private:
    BuildError code_;
};

/**
 * @brief Exception thrown inside the runtime loader
 */
class LoadError : public std::runtime_error {
public:
    LoadError(RunError reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    RunError reason() const noexcept { return reason_; }

private:
    RunError reason_;
};

/**
 * @brief Run fn at a boundary no exception may cross
 *
 * A LoadError or any other std::exception escaping fn is handed to
 * on_fatal as (reason, message) and a value-initialised result is
 * returned. on_fatal is expected to end the process.
 */
template <typename Fn, typename OnFatal>
auto guard_boundary(Fn&& fn, OnFatal&& on_fatal) -> decltype(fn()) {
    using Result = decltype(fn());
    try {
        return fn();
    } catch (const LoadError& e) {
        on_fatal(e.reason(), e.what());
    } catch (const std::exception& e) {
        on_fatal(RunError::None, e.what());
    }
    if constexpr (!std::is_void_v<Result>) {
        return Result{};
    }
}

} // namespace husk
