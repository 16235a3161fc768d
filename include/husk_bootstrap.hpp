#pragma once

/**
 * @file husk_bootstrap.hpp
 * @brief Once-per-process start of the runtime loader
 *
 * Several early platform hooks may trigger the load (component factory,
 * bootstrap provider, stub application). Only the first one does the work.
 */

#include <functional>

namespace husk {
namespace bootstrap {

/**
 * @brief Run `init` once per process
 *
 * Concurrent callers wait for the first to finish. A call made from inside
 * `init` on the same thread returns false immediately. If `init` throws, the
 * exception reaches the caller that ran it and a later call may retry.
 *
 * @return true if this call ran `init`
 */
bool ensure_started(const std::function<void()>& init);

/**
 * @brief True once an `init` passed to ensure_started has returned
 */
bool started();

} // namespace bootstrap
} // namespace husk
