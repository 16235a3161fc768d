#pragma once

/**
 * @file husk_native_cache.hpp
 * @brief On-demand decryption of protected native libraries
 */

#include "husk_crypto.hpp"
#include "husk_payload.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace husk {

/**
 * @brief Library file name for a lookup name ("foo" -> "libfoo.so")
 */
std::string native_library_file_name(std::string_view name);

/**
 * @brief Decrypted native libraries under <root>/husk-native/<abi>/
 *
 * The first lookup of a name decrypts the library into the cache directory;
 * later lookups in the same process return the same path. A file left by an
 * earlier process is reused only when its SHA-256 matches the payload entry.
 * Lookups of one name are serialized, lookups of different names are not.
 */
class NativeLibraryCache {
public:
    NativeLibraryCache(const PayloadReader& payload, const crypto::Key& key,
                       std::string abi, const std::string& root_dir);
    ~NativeLibraryCache();

    NativeLibraryCache(const NativeLibraryCache&) = delete;
    NativeLibraryCache& operator=(const NativeLibraryCache&) = delete;

    /**
     * @brief Path of the decrypted library
     * @return nullopt when the name is not protected at all
     * @throws LoadError(NativeLibraryMissingForAbi) when it is protected for other ABIs only
     * @throws LoadError(AuthenticationFailure, PayloadCorrupt, IoError)
     */
    std::optional<std::string> find_library(std::string_view name);

    const std::string& directory() const { return directory_; }
    const std::string& abi() const { return abi_; }

    /**
     * @brief Number of AEAD decryptions performed so far
     */
    size_t decryptions() const { return decryptions_.load(); }

private:
    struct Slot {
        std::mutex lock;
        std::string path;
        bool ready = false;
    };

    Slot& slot_for(const std::string& file_name);
    std::string materialize(const PayloadIndexEntry& entry, const std::string& file_name);

    const PayloadReader& payload_;
    crypto::Key key_;
    std::string abi_;
    std::string directory_;

    std::mutex slots_lock_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
    std::atomic<size_t> decryptions_{0};
};

/**
 * @brief Create a directory chain with mode 0700 on every created component
 * @throws LoadError(IoError)
 */
void make_private_directory(const std::string& path);

/**
 * @brief Write a file through a temporary name and rename it into place
 *
 * Readers never observe a partially written file at `path`.
 * @throws LoadError(IoError)
 */
void install_private_file(const std::string& path, std::span<const uint8_t> data, unsigned mode);

} // namespace husk
