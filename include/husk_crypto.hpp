#pragma once

/**
 * @file husk_crypto.hpp
 * @brief AEAD engine and cryptographic utilities backed by the psyfer library
 */

#include <psyfer.hpp>
#include <vector>
#include <string>
#include <span>
#include <array>
#include <memory>
#include <cstdint>

namespace husk {
namespace crypto {

constexpr size_t KEY_SIZE = 32;
constexpr size_t NONCE_SIZE = 12;
constexpr size_t TAG_SIZE = 16;
constexpr size_t DIGEST_SIZE = 32;

using Key = std::array<uint8_t, KEY_SIZE>;
using Nonce = std::array<uint8_t, NONCE_SIZE>;
using Tag = std::array<uint8_t, TAG_SIZE>;
using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Result of a seal operation
 */
struct SealResult {
    std::vector<uint8_t> ciphertext;
    Tag tag;
};

/**
 * @brief Encrypt and authenticate a blob with AES-256-GCM
 * @param key 256-bit protection key
 * @param nonce 96-bit nonce, never reused under the same key
 * @param aad Associated data bound to the ciphertext
 * @param plaintext Data to encrypt
 * @return Ciphertext (same length as plaintext) and authentication tag
 */
SealResult seal(
    const Key& key,
    const Nonce& nonce,
    std::span<const uint8_t> aad,
    std::span<const uint8_t> plaintext
);

/**
 * @brief Verify and decrypt a blob sealed with seal()
 *
 * Verification and decryption are one step: on a tag mismatch nothing is
 * returned and LoadError(RunError::AuthenticationFailure) is thrown.
 *
 * @param key 256-bit protection key
 * @param nonce Nonce used at seal time
 * @param aad Associated data used at seal time
 * @param ciphertext Encrypted data
 * @param tag Authentication tag
 * @return Plaintext
 */
std::vector<uint8_t> open(
    const Key& key,
    const Nonce& nonce,
    std::span<const uint8_t> aad,
    std::span<const uint8_t> ciphertext,
    const Tag& tag
);

/**
 * @brief SHA-256 of a buffer
 */
Digest sha256(std::span<const uint8_t> data);

/**
 * @brief Generate cryptographically secure random bytes
 * @param size Number of bytes to generate
 * @return Random bytes
 */
std::vector<uint8_t> random_bytes(size_t size);

/**
 * @brief Generate a fresh protection key
 */
Key generate_key();

/**
 * @brief Compare two buffers without early exit
 */
bool constant_time_equal(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept;

/**
 * @brief Securely clear memory
 * @param data Memory to clear
 */
inline void secure_clear(std::span<uint8_t> data) {
    psyfer::secure_zero_memory(data.data(), data.size());
}

/**
 * @brief Per-build nonce generator
 *
 * A random 32-bit prefix chosen once per build followed by a 64-bit
 * big-endian counter. Every nonce drawn from one sequence is distinct.
 */
class NonceSequence {
public:
    NonceSequence();
    NonceSequence(const std::array<uint8_t, 4>& prefix, uint64_t start);

    Nonce next();
    uint64_t issued() const { return counter_ - start_; }

private:
    std::array<uint8_t, 4> prefix_;
    uint64_t start_;
    uint64_t counter_;
};

/**
 * @brief RAII wrapper for secure memory
 */
class SecureBuffer {
public:
    SecureBuffer() = default;
    explicit SecureBuffer(size_t size) : data_(size) {}
    explicit SecureBuffer(std::vector<uint8_t>&& data) : data_(std::move(data)) {}

    ~SecureBuffer() {
        secure_clear(data_);
    }

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept = default;
    SecureBuffer& operator=(SecureBuffer&& other) noexcept = default;

    std::span<uint8_t> data() { return data_; }
    std::span<const uint8_t> data() const { return data_; }
    size_t size() const { return data_.size(); }

private:
    std::vector<uint8_t> data_;
};

} // namespace crypto
} // namespace husk
