#pragma once

/**
 * @file husk_memory.hpp
 * @brief Page-level protection for decrypted code held in memory
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace husk {
namespace memory {

bool lock_pages(void* addr, size_t size);
bool unlock_pages(void* addr, size_t size);

/**
 * @brief Exclude a region from core dumps where the platform allows it
 */
bool mark_non_dumpable(void* addr, size_t size);

/**
 * @brief Anonymous mapping for plaintext that must not reach swap or dumps
 *
 * Pages are locked and marked non-dumpable on a best-effort basis and are
 * zeroed before being unmapped.
 */
class ProtectedBuffer {
public:
    ProtectedBuffer() = default;
    explicit ProtectedBuffer(size_t size);
    explicit ProtectedBuffer(std::span<const uint8_t> contents);
    ~ProtectedBuffer();

    ProtectedBuffer(const ProtectedBuffer&) = delete;
    ProtectedBuffer& operator=(const ProtectedBuffer&) = delete;

    ProtectedBuffer(ProtectedBuffer&& other) noexcept;
    ProtectedBuffer& operator=(ProtectedBuffer&& other) noexcept;

    uint8_t* data() { return data_; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    std::span<const uint8_t> view() const { return {data_, size_}; }

    void release();

private:
    uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t mapped_ = 0;
};

} // namespace memory

namespace platform {

/**
 * @brief ABI directory name of the running process ("arm64-v8a", ...)
 */
const char* current_abi() noexcept;

size_t page_size() noexcept;

/**
 * @brief Check /proc/self/maps for known instrumentation frameworks
 */
bool is_instrumented();

} // namespace platform
} // namespace husk
