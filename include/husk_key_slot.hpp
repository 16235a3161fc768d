#pragma once

/**
 * @file husk_key_slot.hpp
 * @brief Protection key storage inside the stub native library
 *
 * The stub library carries one KeySlot in its data segment. At pack time
 * the packer locates the slot by its marker and writes the key into it as
 * a random mask plus the masked key, so the raw key bytes never appear
 * contiguously in the shipped file.
 */

#include "husk_crypto.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace husk {

constexpr char KEY_SLOT_MARKER[16] = {'H', 'U', 'S', 'K', '_', 'K', 'E', 'Y',
                                      '_', 'S', 'L', 'O', 'T', '_', 'v', '1'};
constexpr uint32_t KEY_SLOT_EMPTY = 0x54504D45;        // "EMPT"
constexpr uint32_t KEY_SLOT_PROVISIONED = 0x31594B48;  // "HKY1"

struct KeySlot {
    char marker[16];
    uint32_t state;
    uint8_t mask[crypto::KEY_SIZE];
    uint8_t sealed[crypto::KEY_SIZE];
};

static_assert(sizeof(KeySlot) == 16 + 4 + 2 * crypto::KEY_SIZE, "KeySlot must not be padded");

/**
 * @brief Initializer for the slot compiled into the stub
 */
#define HUSK_KEY_SLOT_INIT                                                        \
    { {'H', 'U', 'S', 'K', '_', 'K', 'E', 'Y', '_', 'S', 'L', 'O', 'T', '_', 'v', '1'}, \
      ::husk::KEY_SLOT_EMPTY, {0}, {0} }

/**
 * @brief Write a key into every unprovisioned slot of a stub library image
 * @return Number of slots provisioned
 * @throws PackError(StubMissing) when the image has no unprovisioned slot
 */
size_t provision_key_slots(std::vector<uint8_t>& library, const crypto::Key& key);

/**
 * @brief True if the image has at least one slot and every slot is provisioned
 */
bool key_slots_provisioned(std::span<const uint8_t> library);

/**
 * @brief Recover the key from a slot
 * @throws LoadError(KeyUnavailable) when the slot was never provisioned
 */
crypto::Key unseal_key_slot(const volatile KeySlot& slot);

/**
 * @brief Source of the protection key at run time
 */
class KeyProvider {
public:
    virtual ~KeyProvider() = default;

    /**
     * @throws LoadError(KeyUnavailable)
     */
    virtual crypto::Key resolve() = 0;
};

/**
 * @brief Reads the key from the slot provisioned into the stub library
 */
class EmbeddedKeyProvider : public KeyProvider {
public:
    explicit EmbeddedKeyProvider(const volatile KeySlot& slot) : slot_(slot) {}

    crypto::Key resolve() override { return unseal_key_slot(slot_); }

private:
    const volatile KeySlot& slot_;
};

} // namespace husk
