/**
 * @file husk_native_cache.cpp
 * @brief Decrypted native library cache
 */

#include "../include/husk_native_cache.hpp"
#include "../include/husk_errors.hpp"
#include "../include/husk_log.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace husk {

namespace {

constexpr unsigned LIBRARY_MODE = 0500;

std::string errno_text() {
    return std::strerror(errno);
}

/**
 * @brief Read a previously installed file, empty if absent
 */
std::vector<uint8_t> read_existing(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

} // namespace

std::string native_library_file_name(std::string_view name) {
    std::string file(name);
    if (file.size() > 3 && file.compare(file.size() - 3, 3, ".so") == 0) {
        return file;
    }
    return "lib" + file + ".so";
}

void make_private_directory(const std::string& path) {
    if (path.empty()) {
        throw LoadError(RunError::IoError, "Empty cache directory");
    }

    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        std::string prefix = path.substr(0, pos);
        if (prefix.empty()) {
            continue;
        }
        if (mkdir(prefix.c_str(), 0700) != 0 && errno != EEXIST) {
            throw LoadError(RunError::IoError, "mkdir " + prefix + ": " + errno_text());
        }
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        throw LoadError(RunError::IoError, "Not a directory: " + path);
    }
    if ((st.st_mode & 0777) != 0700 && chmod(path.c_str(), 0700) != 0) {
        throw LoadError(RunError::IoError, "chmod " + path + ": " + errno_text());
    }
}

void install_private_file(const std::string& path, std::span<const uint8_t> data, unsigned mode) {
    std::string temp_name = path + ".XXXXXX";
    int fd = mkstemp(temp_name.data());
    if (fd == -1) {
        throw LoadError(RunError::IoError, "Failed to create " + temp_name + ": " + errno_text());
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string error = errno_text();
            close(fd);
            unlink(temp_name.c_str());
            throw LoadError(RunError::IoError, "Failed to write " + temp_name + ": " + error);
        }
        written += static_cast<size_t>(n);
    }

    if (fsync(fd) != 0 || fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        std::string error = errno_text();
        close(fd);
        unlink(temp_name.c_str());
        throw LoadError(RunError::IoError, "Failed to finalize " + temp_name + ": " + error);
    }
    close(fd);

    if (rename(temp_name.c_str(), path.c_str()) != 0) {
        std::string error = errno_text();
        unlink(temp_name.c_str());
        throw LoadError(RunError::IoError, "Failed to install " + path + ": " + error);
    }
}

NativeLibraryCache::NativeLibraryCache(const PayloadReader& payload, const crypto::Key& key,
                                       std::string abi, const std::string& root_dir)
    : payload_(payload)
    , key_(key)
    , abi_(std::move(abi))
    , directory_(root_dir + "/husk-native/" + abi_) {
    make_private_directory(directory_);
}

NativeLibraryCache::~NativeLibraryCache() {
    crypto::secure_clear(key_);
}

NativeLibraryCache::Slot& NativeLibraryCache::slot_for(const std::string& file_name) {
    std::lock_guard<std::mutex> guard(slots_lock_);
    auto& slot = slots_[file_name];
    if (!slot) {
        slot = std::make_unique<Slot>();
    }
    return *slot;
}

std::optional<std::string> NativeLibraryCache::find_library(std::string_view name) {
    std::string file_name = native_library_file_name(name);
    const PayloadIndexEntry* entry =
        payload_.find(EntryKind::NativeLib, "lib/" + abi_ + "/" + file_name, abi_);

    if (!entry) {
        auto abis = payload_.abis_for_library(file_name);
        if (abis.empty()) {
            return std::nullopt;
        }
        std::string available;
        for (const auto& a : abis) {
            available += (available.empty() ? "" : ", ") + a;
        }
        throw LoadError(RunError::NativeLibraryMissingForAbi,
                        file_name + " is protected for [" + available + "] but not " + abi_);
    }

    Slot& slot = slot_for(file_name);
    std::lock_guard<std::mutex> guard(slot.lock);
    if (!slot.ready) {
        slot.path = materialize(*entry, file_name);
        slot.ready = true;
    }
    return slot.path;
}

std::string NativeLibraryCache::materialize(const PayloadIndexEntry& entry, const std::string& file_name) {
    std::string path = directory_ + "/" + file_name;

    crypto::SecureBuffer existing(read_existing(path));
    if (existing.size() == entry.size) {
        auto digest = crypto::sha256(existing.data());
        if (crypto::constant_time_equal(digest, entry.digest)) {
            HUSK_LOGD("Reusing cached %s", file_name.c_str());
            return path;
        }
    }
    if (existing.size() > 0) {
        HUSK_LOGW("Cached %s failed revalidation, decrypting again", file_name.c_str());
    }

    crypto::SecureBuffer plaintext(payload_.decrypt(entry, key_));
    decryptions_.fetch_add(1);
    install_private_file(path, plaintext.data(), LIBRARY_MODE);

    HUSK_LOGI("Decrypted %s (%zu bytes)", file_name.c_str(), plaintext.size());
    return path;
}

} // namespace husk
