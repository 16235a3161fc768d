/**
 * @file linux.cpp
 * @brief Linux and Android specific helpers
 */

#include "../../include/husk_memory.hpp"
#include <cstdio>
#include <cstring>
#include <unistd.h>

namespace husk {
namespace platform {

const char* current_abi() noexcept {
#if defined(__aarch64__)
    return "arm64-v8a";
#elif defined(__arm__)
    return "armeabi-v7a";
#elif defined(__x86_64__)
    return "x86_64";
#elif defined(__i386__)
    return "x86";
#elif defined(__riscv) && __riscv_xlen == 64
    return "riscv64";
#else
    return "unknown";
#endif
}

size_t page_size() noexcept {
    long size = sysconf(_SC_PAGESIZE);
    return size > 0 ? static_cast<size_t>(size) : 4096;
}

bool is_instrumented() {
    FILE* maps = fopen("/proc/self/maps", "r");
    if (!maps) {
        return false;
    }

    static const char* const markers[] = {
        "frida", "gum-js-loop", "valgrind", "vgpreload", "xposed", "substrate"
    };

    char line[512];
    bool found = false;
    while (!found && fgets(line, sizeof(line), maps)) {
        for (const char* marker : markers) {
            if (strstr(line, marker)) {
                found = true;
                break;
            }
        }
    }
    fclose(maps);
    return found;
}

} // namespace platform
} // namespace husk
