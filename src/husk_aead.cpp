/**
 * @file husk_aead.cpp
 * @brief AES-256-GCM seal/open and hashing on top of psyfer
 */

#include "../include/husk_crypto.hpp"
#include "../include/husk_errors.hpp"
#include <psyfer.hpp>
#include <algorithm>
#include <cstring>

namespace husk {
namespace crypto {

namespace {

std::span<const std::byte> as_bytes(std::span<const uint8_t> data) {
    return std::span<const std::byte>(reinterpret_cast<const std::byte*>(data.data()), data.size());
}

template <size_t N>
std::array<std::byte, N> to_byte_array(const std::array<uint8_t, N>& in) {
    std::array<std::byte, N> out;
    std::memcpy(out.data(), in.data(), N);
    return out;
}

} // namespace

SealResult seal(
    const Key& key,
    const Nonce& nonce,
    std::span<const uint8_t> aad,
    std::span<const uint8_t> plaintext
) {
    auto cipher_key = to_byte_array(key);
    auto cipher_nonce = to_byte_array(nonce);

    // Encrypted in place
    std::vector<std::byte> data(
        reinterpret_cast<const std::byte*>(plaintext.data()),
        reinterpret_cast<const std::byte*>(plaintext.data() + plaintext.size())
    );

    psyfer::aes256_gcm cipher;
    std::array<std::byte, TAG_SIZE> tag;

    auto err = cipher.encrypt(data, cipher_key, cipher_nonce, tag, as_bytes(aad));
    psyfer::secure_zero_memory(cipher_key.data(), cipher_key.size());
    if (err) {
        throw std::runtime_error("AES-256-GCM encryption failed: " + err.message());
    }

    SealResult result;
    result.ciphertext.assign(
        reinterpret_cast<const uint8_t*>(data.data()),
        reinterpret_cast<const uint8_t*>(data.data() + data.size())
    );
    std::memcpy(result.tag.data(), tag.data(), TAG_SIZE);
    return result;
}

std::vector<uint8_t> open(
    const Key& key,
    const Nonce& nonce,
    std::span<const uint8_t> aad,
    std::span<const uint8_t> ciphertext,
    const Tag& tag
) {
    auto cipher_key = to_byte_array(key);
    auto cipher_nonce = to_byte_array(nonce);
    auto cipher_tag = to_byte_array(tag);

    // Copy ciphertext for in-place decryption
    std::vector<std::byte> data(
        reinterpret_cast<const std::byte*>(ciphertext.data()),
        reinterpret_cast<const std::byte*>(ciphertext.data() + ciphertext.size())
    );

    psyfer::aes256_gcm cipher;
    auto err = cipher.decrypt(data, cipher_key, cipher_nonce, cipher_tag, as_bytes(aad));
    psyfer::secure_zero_memory(cipher_key.data(), cipher_key.size());

    if (err) {
        // Whatever psyfer left in the buffer is unverified
        psyfer::secure_zero_memory(data.data(), data.size());
        throw LoadError(RunError::AuthenticationFailure,
                        "Authentication failed - data may be corrupted or tampered");
    }

    std::vector<uint8_t> plaintext(
        reinterpret_cast<const uint8_t*>(data.data()),
        reinterpret_cast<const uint8_t*>(data.data() + data.size())
    );
    psyfer::secure_zero_memory(data.data(), data.size());
    return plaintext;
}

Digest sha256(std::span<const uint8_t> data) {
    std::array<std::byte, DIGEST_SIZE> hash;
    psyfer::sha256_hasher::hash(as_bytes(data), hash);

    Digest digest;
    std::memcpy(digest.data(), hash.data(), DIGEST_SIZE);
    return digest;
}

std::vector<uint8_t> random_bytes(size_t size) {
    std::vector<std::byte> buffer(size);
    auto err = psyfer::secure_random::generate(buffer);
    if (err) {
        throw std::runtime_error("Secure random generation failed: " + err.message());
    }
    return std::vector<uint8_t>(
        reinterpret_cast<const uint8_t*>(buffer.data()),
        reinterpret_cast<const uint8_t*>(buffer.data() + buffer.size())
    );
}

Key generate_key() {
    auto bytes = random_bytes(KEY_SIZE);
    Key key;
    std::copy(bytes.begin(), bytes.end(), key.begin());
    secure_clear(bytes);
    return key;
}

bool constant_time_equal(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    uint8_t diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<uint8_t>(a[i] ^ b[i]);
    }
    return diff == 0;
}

NonceSequence::NonceSequence() : start_(0), counter_(0) {
    auto prefix = random_bytes(prefix_.size());
    std::copy(prefix.begin(), prefix.end(), prefix_.begin());
}

NonceSequence::NonceSequence(const std::array<uint8_t, 4>& prefix, uint64_t start)
    : prefix_(prefix), start_(start), counter_(start) {}

Nonce NonceSequence::next() {
    Nonce nonce;
    std::copy(prefix_.begin(), prefix_.end(), nonce.begin());
    uint64_t value = counter_++;
    for (size_t i = 0; i < 8; ++i) {
        nonce[NONCE_SIZE - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return nonce;
}

} // namespace crypto
} // namespace husk
