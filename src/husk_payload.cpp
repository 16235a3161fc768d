/**
 * @file husk_payload.cpp
 * @brief Payload container serialization and selective decryption
 */

#include "../include/husk_payload.hpp"
#include "../include/husk_bytes.hpp"
#include "../include/husk_errors.hpp"
#include "../include/husk_zip.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace husk {

namespace {

constexpr size_t HEADER_SIZE = 8 + 2 + 2 + 4;
constexpr size_t TRAILER_SIZE = 4;

std::string lookup_key(EntryKind kind, std::string_view path, std::string_view abi) {
    std::string key;
    key.reserve(path.size() + abi.size() + 3);
    key.push_back(static_cast<char>(kind));
    key.push_back('\0');
    key.append(path);
    key.push_back('\0');
    key.append(abi);
    return key;
}

bool valid_kind(uint8_t kind) {
    return kind >= static_cast<uint8_t>(EntryKind::Code) &&
           kind <= static_cast<uint8_t>(EntryKind::Asset);
}

[[noreturn]] void corrupt(const std::string& what) {
    throw LoadError(RunError::PayloadCorrupt, "Payload corrupt: " + what);
}

} // namespace

const char* to_string(EntryKind kind) noexcept {
    switch (kind) {
        case EntryKind::Code: return "CODE";
        case EntryKind::NativeLib: return "NATIVE_LIB";
        case EntryKind::Asset: return "ASSET";
    }
    return "UNKNOWN";
}

std::vector<uint8_t> entry_aad(EntryKind kind, std::string_view path, std::string_view abi) {
    std::vector<uint8_t> aad;
    ByteWriter w(aad);
    w.str("husk-entry/v1");
    w.u8(0);
    w.u8(static_cast<uint8_t>(kind));
    w.u8(0);
    w.str(path);
    w.u8(0);
    w.str(abi);
    return aad;
}

PayloadEntry seal_entry(
    const crypto::Key& key,
    const crypto::Nonce& nonce,
    EntryKind kind,
    const std::string& path,
    const std::string& abi,
    std::span<const uint8_t> plaintext
) {
    PayloadEntry entry;
    entry.kind = kind;
    entry.path = path;
    entry.abi = abi;
    entry.nonce = nonce;
    entry.digest = crypto::sha256(plaintext);

    auto sealed = crypto::seal(key, nonce, entry_aad(kind, path, abi), plaintext);
    entry.ciphertext = std::move(sealed.ciphertext);
    entry.tag = sealed.tag;
    return entry;
}

std::string library_file_name(std::string_view path) {
    auto slash = path.find_last_of('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

void PayloadWriter::add(PayloadEntry entry) {
    if (entry.path.empty() || entry.path.size() > 0xFFFF || entry.abi.size() > 0xFFFF) {
        throw std::invalid_argument("Invalid payload entry path: " + entry.path);
    }
    if (entry.kind != EntryKind::NativeLib && !entry.abi.empty()) {
        throw std::invalid_argument("ABI is only meaningful for native libraries: " + entry.path);
    }
    for (const auto& existing : entries_) {
        if (existing.kind == entry.kind && existing.path == entry.path && existing.abi == entry.abi) {
            throw std::invalid_argument("Duplicate payload entry: " + entry.path);
        }
        if (existing.nonce == entry.nonce) {
            throw std::invalid_argument("Nonce reused for payload entry: " + entry.path);
        }
    }
    entries_.push_back(std::move(entry));
}

std::vector<uint8_t> PayloadWriter::finish() const {
    std::vector<uint8_t> out;
    ByteWriter w(out);

    w.bytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(PAYLOAD_MAGIC), sizeof(PAYLOAD_MAGIC)));
    w.u16(PAYLOAD_VERSION);
    w.u16(0);
    w.u32(static_cast<uint32_t>(entries_.size()));

    for (const auto& entry : entries_) {
        w.u8(static_cast<uint8_t>(entry.kind));
        w.u8(0);
        w.u16(static_cast<uint16_t>(entry.path.size()));
        w.str(entry.path);
        w.u16(static_cast<uint16_t>(entry.abi.size()));
        w.str(entry.abi);
        w.bytes(entry.nonce);
        w.bytes(entry.tag);
        w.bytes(entry.digest);
        w.u64(entry.ciphertext.size());
        w.bytes(entry.ciphertext);
    }

    w.u32(crc32_of(out));
    return out;
}

PayloadReader::PayloadReader(std::vector<uint8_t> container)
    : data_(std::move(container)) {
    if (data_.size() < HEADER_SIZE + TRAILER_SIZE) {
        corrupt("container too small (" + std::to_string(data_.size()) + " bytes)");
    }

    // Cheap screen before any per-entry work
    size_t body = data_.size() - TRAILER_SIZE;
    uint32_t stored_crc = ByteReader(data_, body).u32();
    if (crc32_of(std::span<const uint8_t>(data_.data(), body)) != stored_crc) {
        corrupt("trailer checksum mismatch");
    }

    index();
}

void PayloadReader::index() {
    size_t body = data_.size() - TRAILER_SIZE;
    ByteReader r(std::span<const uint8_t>(data_.data(), body));

    try {
        auto magic = r.bytes(sizeof(PAYLOAD_MAGIC));
        if (!std::equal(magic.begin(), magic.end(), reinterpret_cast<const uint8_t*>(PAYLOAD_MAGIC))) {
            corrupt("bad magic");
        }
        version_ = r.u16();
        if (version_ != PAYLOAD_VERSION) {
            corrupt("unsupported format version " + std::to_string(version_));
        }
        r.u16();  // flags
        uint32_t count = r.u32();

        entries_.reserve(std::min<uint32_t>(count, 4096));
        for (uint32_t i = 0; i < count; ++i) {
            uint8_t kind = r.u8();
            if (!valid_kind(kind)) {
                corrupt("unknown entry kind " + std::to_string(kind));
            }
            r.u8();

            PayloadIndexEntry entry;
            entry.kind = static_cast<EntryKind>(kind);
            entry.path = r.str(r.u16());
            entry.abi = r.str(r.u16());
            if (entry.path.empty()) {
                corrupt("entry with empty path");
            }
            if (entry.kind != EntryKind::NativeLib && !entry.abi.empty()) {
                corrupt("ABI on non-native entry " + entry.path);
            }

            auto nonce = r.bytes(crypto::NONCE_SIZE);
            std::copy(nonce.begin(), nonce.end(), entry.nonce.begin());
            auto tag = r.bytes(crypto::TAG_SIZE);
            std::copy(tag.begin(), tag.end(), entry.tag.begin());
            auto digest = r.bytes(crypto::DIGEST_SIZE);
            std::copy(digest.begin(), digest.end(), entry.digest.begin());

            uint64_t size = r.u64();
            if (size > r.remaining()) {
                corrupt("entry " + entry.path + " extends past end of container");
            }
            entry.offset = r.position();
            entry.size = static_cast<size_t>(size);
            r.skip(entry.size);

            auto key = lookup_key(entry.kind, entry.path, entry.abi);
            if (!lookup_.emplace(key, entries_.size()).second) {
                corrupt("duplicate entry " + entry.path);
            }
            entries_.push_back(std::move(entry));
        }

        if (!r.at_end()) {
            corrupt("trailing bytes after last entry");
        }
    } catch (const TruncatedInput& e) {
        corrupt(e.what());
    }
}

const PayloadIndexEntry* PayloadReader::find(EntryKind kind, std::string_view path,
                                             std::string_view abi) const {
    auto it = lookup_.find(lookup_key(kind, path, abi));
    return it == lookup_.end() ? nullptr : &entries_[it->second];
}

std::vector<const PayloadIndexEntry*> PayloadReader::code_units() const {
    std::vector<const PayloadIndexEntry*> units;
    for (const auto& entry : entries_) {
        if (entry.kind == EntryKind::Code) {
            units.push_back(&entry);
        }
    }
    return units;
}

std::vector<const PayloadIndexEntry*> PayloadReader::native_libraries(std::string_view abi) const {
    std::vector<const PayloadIndexEntry*> libs;
    for (const auto& entry : entries_) {
        if (entry.kind == EntryKind::NativeLib && entry.abi == abi) {
            libs.push_back(&entry);
        }
    }
    return libs;
}

std::vector<std::string> PayloadReader::abis_for_library(std::string_view file_name) const {
    std::set<std::string> abis;
    for (const auto& entry : entries_) {
        if (entry.kind == EntryKind::NativeLib && library_file_name(entry.path) == file_name) {
            abis.insert(entry.abi);
        }
    }
    return std::vector<std::string>(abis.begin(), abis.end());
}

std::span<const uint8_t> PayloadReader::ciphertext(const PayloadIndexEntry& entry) const {
    return std::span<const uint8_t>(data_.data() + entry.offset, entry.size);
}

std::vector<uint8_t> PayloadReader::decrypt(const PayloadIndexEntry& entry, const crypto::Key& key) const {
    auto plaintext = crypto::open(
        key,
        entry.nonce,
        entry_aad(entry.kind, entry.path, entry.abi),
        ciphertext(entry),
        entry.tag
    );

    auto digest = crypto::sha256(plaintext);
    if (!crypto::constant_time_equal(digest, entry.digest)) {
        crypto::secure_clear(plaintext);
        corrupt("digest mismatch for " + entry.path);
    }
    return plaintext;
}

} // namespace husk
