/**
 * @file husk_memory.cpp
 * @brief Memory protection utilities for decrypted code buffers
 */

#include "../include/husk_memory.hpp"
#include <cstring>
#include <new>
#include <utility>

#include <sys/mman.h>
#include <unistd.h>
#include <errno.h>

namespace husk {
namespace memory {

bool lock_pages(void* addr, size_t size) {
    if (!addr || size == 0) return false;
    return mlock(addr, size) == 0;
}

bool unlock_pages(void* addr, size_t size) {
    if (!addr || size == 0) return false;
    return munlock(addr, size) == 0;
}

bool mark_non_dumpable(void* addr, size_t size) {
    if (!addr || size == 0) return false;

#if defined(__linux__)
    return madvise(addr, size, MADV_DONTDUMP) == 0;
#else
    return false;
#endif
}

static size_t round_to_pages(size_t size) {
    size_t page = platform::page_size();
    return ((size + page - 1) / page) * page;
}

ProtectedBuffer::ProtectedBuffer(size_t size) {
    if (size == 0) return;

    size_t alloc_size = round_to_pages(size);
    void* mem = mmap(nullptr, alloc_size,
                     PROT_READ | PROT_WRITE,
                     MAP_PRIVATE | MAP_ANONYMOUS,
                     -1, 0);
    if (mem == MAP_FAILED) {
        throw std::bad_alloc();
    }

    // Both are advisory; RLIMIT_MEMLOCK is often small on devices
    lock_pages(mem, alloc_size);
    mark_non_dumpable(mem, alloc_size);

    data_ = static_cast<uint8_t*>(mem);
    size_ = size;
    mapped_ = alloc_size;
}

ProtectedBuffer::ProtectedBuffer(std::span<const uint8_t> contents)
    : ProtectedBuffer(contents.size()) {
    if (!contents.empty()) {
        std::memcpy(data_, contents.data(), contents.size());
    }
}

ProtectedBuffer::~ProtectedBuffer() {
    release();
}

ProtectedBuffer::ProtectedBuffer(ProtectedBuffer&& other) noexcept
    : data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      mapped_(std::exchange(other.mapped_, 0)) {}

ProtectedBuffer& ProtectedBuffer::operator=(ProtectedBuffer&& other) noexcept {
    if (this != &other) {
        release();
        data_ = std::exchange(other.data_, nullptr);
        size_ = std::exchange(other.size_, 0);
        mapped_ = std::exchange(other.mapped_, 0);
    }
    return *this;
}

void ProtectedBuffer::release() {
    if (!data_) return;

    // Clear memory before unmapping
    volatile uint8_t* p = data_;
    for (size_t i = 0; i < mapped_; ++i) {
        p[i] = 0;
    }

    unlock_pages(data_, mapped_);
    munmap(data_, mapped_);
    data_ = nullptr;
    size_ = 0;
    mapped_ = 0;
}

} // namespace memory
} // namespace husk
