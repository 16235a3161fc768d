/**
 * @file test_crypto.cpp
 * @brief Tests for the AEAD engine, nonce sequence and key slots
 */

#undef NDEBUG

#include "../include/husk_crypto.hpp"
#include "../include/husk_errors.hpp"
#include "../include/husk_key_slot.hpp"
#include "fixtures.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>

using namespace husk;

namespace {

crypto::Key test_key(uint8_t seed) {
    crypto::Key key;
    for (size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<uint8_t>(seed + i * 7);
    }
    return key;
}

std::vector<uint8_t> text(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

void test_seal_open() {
    std::cout << "Test: Seal and open...";

    auto key = test_key(1);
    crypto::NonceSequence nonces;
    auto nonce = nonces.next();
    auto aad = text("identity");
    auto plaintext = text("protected code unit contents");

    auto sealed = crypto::seal(key, nonce, aad, plaintext);
    assert(sealed.ciphertext.size() == plaintext.size());
    assert(sealed.ciphertext != plaintext);

    auto opened = crypto::open(key, nonce, aad, sealed.ciphertext, sealed.tag);
    assert(opened == plaintext);

    std::cout << " PASSED" << std::endl;
}

void test_open_rejects_tampering() {
    std::cout << "Test: Open rejects tampering...";

    auto key = test_key(2);
    crypto::NonceSequence nonces;
    auto nonce = nonces.next();
    auto aad = text("classes.dex");
    auto sealed = crypto::seal(key, nonce, aad, text("original bytes"));

    auto expect_auth_failure = [&](const crypto::Key& k, const crypto::Nonce& n,
                                   const std::vector<uint8_t>& a,
                                   const std::vector<uint8_t>& c, const crypto::Tag& t) {
        try {
            crypto::open(k, n, a, c, t);
            assert(false && "tampered input was accepted");
        } catch (const LoadError& e) {
            assert(e.reason() == RunError::AuthenticationFailure);
        }
    };

    auto flipped = sealed.ciphertext;
    flipped[3] ^= 0x01;
    expect_auth_failure(key, nonce, aad, flipped, sealed.tag);

    auto bad_tag = sealed.tag;
    bad_tag[0] ^= 0x80;
    expect_auth_failure(key, nonce, aad, sealed.ciphertext, bad_tag);

    expect_auth_failure(key, nonce, text("classes2.dex"), sealed.ciphertext, sealed.tag);
    expect_auth_failure(test_key(3), nonce, aad, sealed.ciphertext, sealed.tag);
    expect_auth_failure(key, nonces.next(), aad, sealed.ciphertext, sealed.tag);

    std::cout << " PASSED" << std::endl;
}

void test_empty_plaintext() {
    std::cout << "Test: Empty plaintext...";

    auto key = test_key(4);
    crypto::NonceSequence nonces;
    auto nonce = nonces.next();
    auto sealed = crypto::seal(key, nonce, text("empty"), {});
    assert(sealed.ciphertext.empty());
    assert(crypto::open(key, nonce, text("empty"), sealed.ciphertext, sealed.tag).empty());

    std::cout << " PASSED" << std::endl;
}

void test_nonce_sequence() {
    std::cout << "Test: Nonce sequence...";

    crypto::NonceSequence fixed({0xA1, 0xB2, 0xC3, 0xD4}, 0x00000000FFFFFFFFull);
    auto first = fixed.next();
    auto second = fixed.next();

    assert(first[0] == 0xA1 && first[3] == 0xD4);
    // Big-endian counter in the last eight bytes
    assert(first[8] == 0xFF && first[11] == 0xFF && first[7] == 0x00);
    assert(second[7] == 0x01 && second[8] == 0x00 && second[11] == 0x00);
    assert(fixed.issued() == 2);

    crypto::NonceSequence random;
    std::set<crypto::Nonce> seen;
    for (int i = 0; i < 1000; ++i) {
        assert(seen.insert(random.next()).second);
    }

    std::cout << " PASSED" << std::endl;
}

void test_digest_and_compare() {
    std::cout << "Test: Digest and constant-time compare...";

    auto a = crypto::sha256(text("abc"));
    auto b = crypto::sha256(text("abc"));
    auto c = crypto::sha256(text("abd"));
    assert(a.size() == crypto::DIGEST_SIZE);
    assert(crypto::constant_time_equal(a, b));
    assert(!crypto::constant_time_equal(a, c));
    assert(!crypto::constant_time_equal(std::span<const uint8_t>(a.data(), 16), b));

    // SHA-256("abc")
    assert(a[0] == 0xba && a[1] == 0x78 && a[31] == 0xad);

    auto k1 = crypto::generate_key();
    auto k2 = crypto::generate_key();
    assert(k1 != k2);

    std::cout << " PASSED" << std::endl;
}

void test_key_slot_provisioning() {
    std::cout << "Test: Key slot provisioning...";

    auto image = fixtures::make_stub_library("x86_64");
    assert(!key_slots_provisioned(image));

    auto key = crypto::generate_key();
    assert(provision_key_slots(image, key) == 1);
    assert(key_slots_provisioned(image));

    // The raw key never appears contiguously
    assert(std::search(image.begin(), image.end(), key.begin(), key.end()) == image.end());

    auto slot = fixtures::find_provisioned_slot(image);
    assert(slot.has_value());
    assert(unseal_key_slot(*slot) == key);

    // Provisioning twice finds no empty slot
    try {
        provision_key_slots(image, key);
        assert(false && "second provisioning succeeded");
    } catch (const PackError& e) {
        assert(e.code() == BuildError::StubMissing);
    }

    std::cout << " PASSED" << std::endl;
}

void test_key_slot_errors() {
    std::cout << "Test: Key slot errors...";

    std::vector<uint8_t> no_slot = fixtures::bytes("a library without any slot");
    try {
        provision_key_slots(no_slot, crypto::generate_key());
        assert(false && "library without slot accepted");
    } catch (const PackError& e) {
        assert(e.code() == BuildError::StubMissing);
    }
    assert(!key_slots_provisioned(no_slot));

    KeySlot empty = HUSK_KEY_SLOT_INIT;
    try {
        unseal_key_slot(empty);
        assert(false && "empty slot unsealed");
    } catch (const LoadError& e) {
        assert(e.reason() == RunError::KeyUnavailable);
    }

    KeySlot damaged = HUSK_KEY_SLOT_INIT;
    damaged.state = KEY_SLOT_PROVISIONED;
    damaged.marker[0] = 'X';
    try {
        unseal_key_slot(damaged);
        assert(false && "damaged slot unsealed");
    } catch (const LoadError& e) {
        assert(e.reason() == RunError::KeyUnavailable);
    }

    std::cout << " PASSED" << std::endl;
}

int main() {
    std::cout << "Running crypto tests...\n" << std::endl;

    try {
        test_seal_open();
        test_open_rejects_tampering();
        test_empty_plaintext();
        test_nonce_sequence();
        test_digest_and_compare();
        test_key_slot_provisioning();
        test_key_slot_errors();

        std::cout << "\nAll tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
