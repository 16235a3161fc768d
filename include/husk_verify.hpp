#pragma once

/**
 * @file husk_verify.hpp
 * @brief Advisory debugger detection
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace husk {
namespace verify {

/**
 * @brief What the loader does when a debugger is attached
 */
enum class DebuggerPolicy : uint8_t {
    Ignore = 0,
    LogOnly,
    AbortProcess
};

/**
 * @brief Manifest spelling of a policy ("ignore", "log", "abort")
 */
const char* to_string(DebuggerPolicy policy) noexcept;
std::optional<DebuggerPolicy> parse_debugger_policy(std::string_view text);

/**
 * @brief Tracer pid from the text of /proc/<pid>/status, 0 when untraced
 */
int tracer_pid(std::string_view status_text);

/**
 * @brief Check if a debugger is attached to this process
 */
bool is_debugger_present();

/**
 * @brief Run the debugger probe and apply a policy to the result
 *
 * Returns whether a debugger was seen. Under AbortProcess a positive probe
 * throws LoadError(RunError::DebuggerDetected). Under Ignore the probe is
 * not run at all.
 */
bool enforce_debugger_policy(DebuggerPolicy policy,
                             const std::function<bool()>& probe = is_debugger_present);

} // namespace verify
} // namespace husk
