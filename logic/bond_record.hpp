/*
 * Bond Record - Persistent layout of BondKeyMaterial
 * Pure logic module, no flash access; drivers/flash_key_store does the I/O
 */

#ifndef BOND_RECORD_HPP
#define BOND_RECORD_HPP

#include "types.h"
#include "logic/device_interfaces.hpp"
#include <cstddef>
#include <cstdint>

/*============================================================================
 * Record Layout (64 bytes, little-endian)
 *============================================================================
 *   [0..3]    u32 magic (BOND_RECORD_MAGIC)
 *   [4]       u8  version (BOND_RECORD_VERSION)
 *   [5]       u8  flags (bit 0: has_peer)
 *   [6]       u8  peer address type
 *   [7]       u8  reserved
 *   [8..13]   peer address
 *   [14..15]  reserved
 *   [16..31]  identity root key (IR)
 *   [32..47]  encryption root key (ER)
 *   [48..59]  reserved (0)
 *   [60..63]  u32 CRC-32 over bytes 0..59
 */
static constexpr size_t BOND_RECORD_SIZE = 64;

void bond_record_encode(const BondKeyMaterial &keys, uint8_t out[BOND_RECORD_SIZE]);

/* Returns false on bad magic, unknown version or CRC mismatch (out untouched). */
bool bond_record_decode(const uint8_t in[BOND_RECORD_SIZE], BondKeyMaterial *out);

/* CRC-32 (IEEE 802.3, reflected, init/xorout 0xFFFFFFFF) */
uint32_t crc32_compute(const uint8_t *data, size_t len);

/*============================================================================
 * Key Generation
 *============================================================================
 * Continuous health test on the random source: a block whose bytes are all
 * equal, or which repeats the previous block, is rejected and redrawn. A
 * block that cannot be produced in RNG_MAX_ATTEMPTS tries fails the draw.
 */
class Rng_Health_Test {
public:
    explicit Rng_Health_Test(Random_Source &source) : source_(source) {}

    /* Draw KEY_SIZE bytes. Returns false if the source failed the health test. */
    bool draw_key(uint8_t out[KEY_SIZE]);

    uint32_t rejected_blocks() const { return rejected_; }

private:
    Random_Source &source_;
    uint8_t previous_[KEY_SIZE] = {};
    bool has_previous_ = false;
    uint32_t rejected_ = 0;
};

/* Fresh IR/ER, no bonded peer. Returns false on random source failure. */
bool bond_keys_generate(Rng_Health_Test &rng, BondKeyMaterial *out);

#endif // BOND_RECORD_HPP
