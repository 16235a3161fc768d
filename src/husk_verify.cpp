/**
 * @file husk_verify.cpp
 * @brief Advisory debugger detection
 */

#include "../include/husk_verify.hpp"
#include "../include/husk_errors.hpp"
#include "../include/husk_log.hpp"
#include "../include/husk_memory.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace husk {
namespace verify {

const char* to_string(DebuggerPolicy policy) noexcept {
    switch (policy) {
        case DebuggerPolicy::Ignore: return "ignore";
        case DebuggerPolicy::LogOnly: return "log";
        case DebuggerPolicy::AbortProcess: return "abort";
    }
    return "ignore";
}

std::optional<DebuggerPolicy> parse_debugger_policy(std::string_view text) {
    if (text == "ignore") return DebuggerPolicy::Ignore;
    if (text == "log") return DebuggerPolicy::LogOnly;
    if (text == "abort") return DebuggerPolicy::AbortProcess;
    return std::nullopt;
}

int tracer_pid(std::string_view status_text) {
    constexpr std::string_view key = "TracerPid:";

    size_t pos = 0;
    while (pos < status_text.size()) {
        size_t end = status_text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = status_text.size();
        }
        auto line = status_text.substr(pos, end - pos);
        if (line.substr(0, key.size()) == key) {
            auto value = line.substr(key.size());
            size_t first = value.find_first_not_of(" \t");
            if (first == std::string_view::npos) {
                return 0;
            }
            value = value.substr(first);
            int pid = 0;
            auto result = std::from_chars(value.data(), value.data() + value.size(), pid);
            return result.ec == std::errc() ? pid : 0;
        }
        pos = end + 1;
    }
    return 0;
}

bool is_debugger_present() {
    // Must not PTRACE_TRACEME: zygote children would become traceable by their parent
    std::ifstream status("/proc/self/status");
    if (!status) {
        return false;
    }
    std::stringstream buffer;
    buffer << status.rdbuf();
    return tracer_pid(buffer.str()) != 0;
}

bool enforce_debugger_policy(DebuggerPolicy policy, const std::function<bool()>& probe) {
    if (policy == DebuggerPolicy::Ignore) {
        return false;
    }

    bool attached = probe();
    if (platform::is_instrumented()) {
        HUSK_LOGW("Instrumentation framework mapped into process");
    }
    if (!attached) {
        return false;
    }

    if (policy == DebuggerPolicy::AbortProcess) {
        throw LoadError(RunError::DebuggerDetected, "Debugger attached to process");
    }
    HUSK_LOGW("Debugger attached to process");
    return true;
}

} // namespace verify
} // namespace husk
