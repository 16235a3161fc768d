/**
 * @file husk_bootstrap.cpp
 * @brief Once-per-process start of the runtime loader
 */

#include "../include/husk_bootstrap.hpp"
#include "../include/husk_log.hpp"
#include <atomic>
#include <mutex>

namespace husk {
namespace bootstrap {

namespace {

std::once_flag start_once;
std::atomic<bool> start_done{false};
thread_local bool in_start = false;

} // namespace

bool ensure_started(const std::function<void()>& init) {
    if (start_done.load(std::memory_order_acquire)) {
        return false;
    }
    if (in_start) {
        HUSK_LOGD("Nested bootstrap request ignored");
        return false;
    }

    bool ran = false;
    std::call_once(start_once, [&] {
        in_start = true;
        try {
            init();
        } catch (...) {
            in_start = false;
            throw;
        }
        in_start = false;
        ran = true;
        start_done.store(true, std::memory_order_release);
    });
    return ran;
}

bool started() {
    return start_done.load(std::memory_order_acquire);
}

} // namespace bootstrap
} // namespace husk
