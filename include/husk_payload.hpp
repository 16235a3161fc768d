#pragma once

/**
 * @file husk_payload.hpp
 * @brief Self-describing container of encrypted package entries
 *
 * Layout (all integers little-endian):
 *
 *   header   magic "HUSKPAYL" | u16 version | u16 flags | u32 entry_count
 *   entry    u8 kind | u8 reserved | u16 path_len | path | u16 abi_len | abi
 *            | nonce[12] | tag[16] | digest[32] | u64 size | ciphertext[size]
 *   trailer  u32 crc32 of every preceding byte
 *
 * CODE entries appear in the order the platform must load them.
 */

#include "husk_crypto.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace husk {

constexpr char PAYLOAD_MAGIC[8] = {'H', 'U', 'S', 'K', 'P', 'A', 'Y', 'L'};
constexpr uint16_t PAYLOAD_VERSION = 1;

/**
 * @brief Fixed location of the container inside a hardened package
 */
constexpr const char* PAYLOAD_ASSET_PATH = "assets/husk/payload.bin";

enum class EntryKind : uint8_t {
    Code = 1,
    NativeLib = 2,
    Asset = 3
};

const char* to_string(EntryKind kind) noexcept;

/**
 * @brief One encrypted entry ready to be serialized
 */
struct PayloadEntry {
    EntryKind kind = EntryKind::Code;
    std::string path;
    std::string abi;  // empty unless NativeLib
    crypto::Nonce nonce{};
    crypto::Tag tag{};
    crypto::Digest digest{};  // SHA-256 of the plaintext
    std::vector<uint8_t> ciphertext;
};

/**
 * @brief Associated data binding a ciphertext to its declared identity
 */
std::vector<uint8_t> entry_aad(EntryKind kind, std::string_view path, std::string_view abi);

/**
 * @brief Encrypt one plaintext into a payload entry
 */
PayloadEntry seal_entry(
    const crypto::Key& key,
    const crypto::Nonce& nonce,
    EntryKind kind,
    const std::string& path,
    const std::string& abi,
    std::span<const uint8_t> plaintext
);

/**
 * @brief Serializes entries into the container format
 */
class PayloadWriter {
public:
    /**
     * @brief Append an entry
     * @throws std::invalid_argument on a duplicate identity or reused nonce
     */
    void add(PayloadEntry entry);

    size_t count() const { return entries_.size(); }

    std::vector<uint8_t> finish() const;

private:
    std::vector<PayloadEntry> entries_;
};

/**
 * @brief Metadata of one entry located by the reader's index scan
 */
struct PayloadIndexEntry {
    EntryKind kind;
    std::string path;
    std::string abi;
    crypto::Nonce nonce;
    crypto::Tag tag;
    crypto::Digest digest;
    size_t offset;  // of the ciphertext within the container
    size_t size;
};

/**
 * @brief Random-access view of a container
 *
 * The trailer checksum is verified before anything else; entries are then
 * indexed without decrypting them. Construction throws
 * LoadError(RunError::PayloadCorrupt) on any structural problem.
 */
class PayloadReader {
public:
    explicit PayloadReader(std::vector<uint8_t> container);

    uint16_t version() const { return version_; }
    const std::vector<PayloadIndexEntry>& entries() const { return entries_; }

    const PayloadIndexEntry* find(EntryKind kind, std::string_view path,
                                  std::string_view abi = {}) const;

    /**
     * @brief CODE entries in stored (load) order
     */
    std::vector<const PayloadIndexEntry*> code_units() const;

    std::vector<const PayloadIndexEntry*> native_libraries(std::string_view abi) const;

    /**
     * @brief ABIs for which a library with this file name is protected
     */
    std::vector<std::string> abis_for_library(std::string_view file_name) const;

    std::span<const uint8_t> ciphertext(const PayloadIndexEntry& entry) const;

    /**
     * @brief Authenticate and decrypt a single entry
     *
     * Throws LoadError(AuthenticationFailure) on tag mismatch and
     * LoadError(PayloadCorrupt) when the plaintext digest disagrees.
     */
    std::vector<uint8_t> decrypt(const PayloadIndexEntry& entry, const crypto::Key& key) const;

private:
    void index();

    std::vector<uint8_t> data_;
    uint16_t version_ = 0;
    std::vector<PayloadIndexEntry> entries_;
    std::unordered_map<std::string, size_t> lookup_;
};

/**
 * @brief File name component of a library path ("lib/x86_64/libfoo.so" -> "libfoo.so")
 */
std::string library_file_name(std::string_view path);

} // namespace husk
