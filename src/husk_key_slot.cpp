/**
 * @file husk_key_slot.cpp
 * @brief Key slot provisioning and recovery
 */

#include "../include/husk_key_slot.hpp"
#include "../include/husk_errors.hpp"
#include <algorithm>
#include <cstddef>
#include <cstring>

namespace husk {

namespace {

constexpr size_t STATE_OFFSET = offsetof(KeySlot, state);
constexpr size_t MASK_OFFSET = offsetof(KeySlot, mask);
constexpr size_t SEALED_OFFSET = offsetof(KeySlot, sealed);

uint32_t load_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

} // namespace

size_t provision_key_slots(std::vector<uint8_t>& library, const crypto::Key& key) {
    size_t provisioned = 0;
    auto begin = library.begin();

    while (true) {
        auto it = std::search(begin, library.end(), KEY_SLOT_MARKER, KEY_SLOT_MARKER + sizeof(KEY_SLOT_MARKER));
        if (it == library.end()) {
            break;
        }
        size_t offset = static_cast<size_t>(std::distance(library.begin(), it));
        begin = it + sizeof(KEY_SLOT_MARKER);

        if (offset + sizeof(KeySlot) > library.size()) {
            break;
        }
        uint8_t* slot = library.data() + offset;
        if (load_u32(slot + STATE_OFFSET) != KEY_SLOT_EMPTY) {
            continue;
        }

        auto mask = crypto::random_bytes(crypto::KEY_SIZE);
        for (size_t i = 0; i < crypto::KEY_SIZE; ++i) {
            slot[MASK_OFFSET + i] = mask[i];
            slot[SEALED_OFFSET + i] = key[i] ^ mask[i];
        }
        crypto::secure_clear(mask);

        uint32_t state = KEY_SLOT_PROVISIONED;
        std::memcpy(slot + STATE_OFFSET, &state, sizeof(state));
        ++provisioned;
    }

    if (provisioned == 0) {
        throw PackError(BuildError::StubMissing, "Stub library has no unprovisioned key slot");
    }
    return provisioned;
}

bool key_slots_provisioned(std::span<const uint8_t> library) {
    size_t found = 0;
    auto begin = library.begin();
    while (true) {
        auto it = std::search(begin, library.end(), KEY_SLOT_MARKER, KEY_SLOT_MARKER + sizeof(KEY_SLOT_MARKER));
        if (it == library.end()) {
            break;
        }
        size_t offset = static_cast<size_t>(std::distance(library.begin(), it));
        begin = it + sizeof(KEY_SLOT_MARKER);
        if (offset + sizeof(KeySlot) > library.size()) {
            break;
        }
        // Other occurrences of the marker (string constants) carry no state word
        uint32_t state = load_u32(library.data() + offset + STATE_OFFSET);
        if (state == KEY_SLOT_EMPTY) {
            return false;
        }
        if (state == KEY_SLOT_PROVISIONED) {
            ++found;
        }
    }
    return found > 0;
}

crypto::Key unseal_key_slot(const volatile KeySlot& slot) {
    for (size_t i = 0; i < sizeof(KEY_SLOT_MARKER); ++i) {
        if (slot.marker[i] != KEY_SLOT_MARKER[i]) {
            throw LoadError(RunError::KeyUnavailable, "Key slot marker damaged");
        }
    }
    if (slot.state != KEY_SLOT_PROVISIONED) {
        throw LoadError(RunError::KeyUnavailable, "Key slot was never provisioned");
    }

    crypto::Key key;
    for (size_t i = 0; i < crypto::KEY_SIZE; ++i) {
        key[i] = static_cast<uint8_t>(slot.sealed[i] ^ slot.mask[i]);
    }
    return key;
}

} // namespace husk
