/**
 * @file test_payload.cpp
 * @brief Tests for the payload container
 */

#undef NDEBUG

#include "../include/husk_bytes.hpp"
#include "../include/husk_errors.hpp"
#include "../include/husk_payload.hpp"
#include "../include/husk_zip.hpp"
#include "fixtures.hpp"
#include <algorithm>
#include <cassert>
#include <cstring>
#include <iostream>

using namespace husk;

namespace {

struct Sealed {
    crypto::Key key = crypto::generate_key();
    crypto::NonceSequence nonces;
    PayloadWriter writer;

    void add(EntryKind kind, const std::string& path, const std::string& abi, const std::string& body) {
        auto plaintext = fixtures::bytes(body);
        writer.add(seal_entry(key, nonces.next(), kind, path, abi, plaintext));
    }
};

Sealed standard_payload() {
    Sealed p;
    p.add(EntryKind::Code, "classes2.dex", "", "second unit");
    p.add(EntryKind::Code, "classes.dex", "", "first unit");
    p.add(EntryKind::NativeLib, "lib/arm64-v8a/libexample.so", "arm64-v8a", "arm64 code");
    p.add(EntryKind::NativeLib, "lib/x86_64/libexample.so", "x86_64", "x86_64 code");
    p.add(EntryKind::Asset, "assets/config.json", "", "{}");
    return p;
}

// Rewrite the trailer after a deliberate modification
void fix_crc(std::vector<uint8_t>& container) {
    size_t body = container.size() - 4;
    uint32_t crc = crc32_of(std::span<const uint8_t>(container.data(), body));
    for (size_t i = 0; i < 4; ++i) {
        container[body + i] = static_cast<uint8_t>(crc >> (8 * i));
    }
}

template <typename Fn>
void expect_load_error(RunError reason, Fn&& fn) {
    try {
        fn();
        assert(false && "expected a load error");
    } catch (const LoadError& e) {
        assert(e.reason() == reason);
    }
}

} // namespace

void test_write_and_index() {
    std::cout << "Test: Write and index...";

    auto p = standard_payload();
    assert(p.writer.count() == 5);
    auto container = p.writer.finish();
    assert(std::memcmp(container.data(), PAYLOAD_MAGIC, sizeof(PAYLOAD_MAGIC)) == 0);

    PayloadReader reader(container);
    assert(reader.version() == PAYLOAD_VERSION);
    assert(reader.entries().size() == 5);

    // Code units keep insertion order, which is load order
    auto units = reader.code_units();
    assert(units.size() == 2);
    assert(units[0]->path == "classes2.dex");
    assert(units[1]->path == "classes.dex");

    assert(reader.native_libraries("x86_64").size() == 1);
    assert(reader.native_libraries("armeabi-v7a").empty());
    assert(reader.find(EntryKind::Asset, "assets/config.json") != nullptr);
    assert(reader.find(EntryKind::Code, "assets/config.json") == nullptr);
    assert(reader.find(EntryKind::NativeLib, "lib/x86_64/libexample.so", "x86_64") != nullptr);
    assert(reader.find(EntryKind::NativeLib, "lib/x86_64/libexample.so", "arm64-v8a") == nullptr);

    auto first = reader.decrypt(*units[1], p.key);
    assert(first == fixtures::bytes("first unit"));

    std::cout << " PASSED" << std::endl;
}

void test_abis_for_library() {
    std::cout << "Test: ABIs for library...";

    auto p = standard_payload();
    PayloadReader reader(p.writer.finish());
    auto abis = reader.abis_for_library("libexample.so");
    assert(abis.size() == 2);
    assert(abis[0] == "arm64-v8a" && abis[1] == "x86_64");
    assert(reader.abis_for_library("libother.so").empty());
    assert(library_file_name("lib/x86_64/libexample.so") == "libexample.so");
    assert(library_file_name("libbare.so") == "libbare.so");

    std::cout << " PASSED" << std::endl;
}

void test_empty_payload() {
    std::cout << "Test: Empty payload...";

    PayloadWriter writer;
    PayloadReader reader(writer.finish());
    assert(reader.entries().empty());
    assert(reader.code_units().empty());

    std::cout << " PASSED" << std::endl;
}

void test_writer_rejects_invalid_entries() {
    std::cout << "Test: Writer rejects invalid entries...";

    Sealed p;
    p.add(EntryKind::Code, "classes.dex", "", "unit");

    bool threw = false;
    try {
        p.add(EntryKind::Code, "classes.dex", "", "again");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Same path under another kind is a different identity
    p.add(EntryKind::Asset, "classes.dex", "", "asset with a confusing name");

    threw = false;
    try {
        crypto::NonceSequence repeat({1, 2, 3, 4}, 0);
        auto nonce = repeat.next();
        p.writer.add(seal_entry(p.key, nonce, EntryKind::Asset, "assets/a", "", fixtures::bytes("a")));
        p.writer.add(seal_entry(p.key, nonce, EntryKind::Asset, "assets/b", "", fixtures::bytes("b")));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        p.add(EntryKind::Code, "classes3.dex", "x86_64", "unit");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASSED" << std::endl;
}

void test_structural_corruption() {
    std::cout << "Test: Structural corruption...";

    auto container = standard_payload().writer.finish();

    auto flipped = container;
    flipped[40] ^= 0x10;
    expect_load_error(RunError::PayloadCorrupt, [&] { PayloadReader r(flipped); });

    auto truncated = container;
    truncated.resize(truncated.size() - 20);
    expect_load_error(RunError::PayloadCorrupt, [&] { PayloadReader r(truncated); });

    expect_load_error(RunError::PayloadCorrupt, [&] { PayloadReader r(std::vector<uint8_t>(6, 0)); });

    auto bad_magic = container;
    bad_magic[0] = 'X';
    fix_crc(bad_magic);
    expect_load_error(RunError::PayloadCorrupt, [&] { PayloadReader r(bad_magic); });

    auto bad_version = container;
    bad_version[8] = 9;
    fix_crc(bad_version);
    expect_load_error(RunError::PayloadCorrupt, [&] { PayloadReader r(bad_version); });

    auto extra_count = container;
    extra_count[12] += 1;
    fix_crc(extra_count);
    expect_load_error(RunError::PayloadCorrupt, [&] { PayloadReader r(extra_count); });

    // A native library relabelled as code keeps an ABI the writer would refuse
    for (EntryKind relabel : {EntryKind::Code, EntryKind::Asset}) {
        Sealed one;
        one.add(EntryKind::NativeLib, "lib/x86_64/libexample.so", "x86_64", "x86_64 code");
        auto relabelled = one.writer.finish();
        assert(relabelled[16] == static_cast<uint8_t>(EntryKind::NativeLib));
        relabelled[16] = static_cast<uint8_t>(relabel);
        fix_crc(relabelled);
        expect_load_error(RunError::PayloadCorrupt, [&] { PayloadReader r(relabelled); });
    }

    std::cout << " PASSED" << std::endl;
}

void test_ciphertext_tampering() {
    std::cout << "Test: Ciphertext tampering...";

    auto p = standard_payload();
    auto container = p.writer.finish();
    PayloadReader clean(container);
    const auto* entry = clean.find(EntryKind::Code, "classes.dex");
    assert(entry != nullptr);

    // A flipped ciphertext bit with a consistent trailer still fails authentication
    auto tampered = container;
    tampered[entry->offset] ^= 0x01;
    fix_crc(tampered);
    PayloadReader reader(tampered);
    const auto* bad = reader.find(EntryKind::Code, "classes.dex");
    expect_load_error(RunError::AuthenticationFailure, [&] { reader.decrypt(*bad, p.key); });

    // Other entries remain readable
    const auto* other = reader.find(EntryKind::Code, "classes2.dex");
    assert(reader.decrypt(*other, p.key) == fixtures::bytes("second unit"));

    // Wrong key
    expect_load_error(RunError::AuthenticationFailure,
                      [&] { clean.decrypt(*entry, crypto::generate_key()); });

    std::cout << " PASSED" << std::endl;
}

void test_identity_binding() {
    std::cout << "Test: Identity binding...";

    Sealed p;
    p.add(EntryKind::Code, "classes.dex", "", "unit one");
    p.add(EntryKind::Code, "classes3.dex", "", "unit three");
    auto container = p.writer.finish();

    // Rename classes3.dex to classes2.dex in place; the path length is unchanged
    const char from[] = "classes3.dex";
    auto it = std::search(container.begin(), container.end(), from, from + sizeof(from) - 1);
    assert(it != container.end());
    *(it + 7) = '2';
    fix_crc(container);

    PayloadReader reader(container);
    const auto* renamed = reader.find(EntryKind::Code, "classes2.dex");
    assert(renamed != nullptr);
    expect_load_error(RunError::AuthenticationFailure, [&] { reader.decrypt(*renamed, p.key); });

    std::cout << " PASSED" << std::endl;
}

int main() {
    std::cout << "Running payload tests...\n" << std::endl;

    try {
        test_write_and_index();
        test_abis_for_library();
        test_empty_payload();
        test_writer_rejects_invalid_entries();
        test_structural_corruption();
        test_ciphertext_tampering();
        test_identity_binding();

        std::cout << "\nAll tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
