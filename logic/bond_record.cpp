/*
 * Bond Record Implementation
 */

#include "logic/bond_record.hpp"
#include "config.h"
#include <cstring>

static constexpr size_t OFF_MAGIC     = 0;
static constexpr size_t OFF_VERSION   = 4;
static constexpr size_t OFF_FLAGS     = 5;
static constexpr size_t OFF_PEER_TYPE = 6;
static constexpr size_t OFF_PEER_ADDR = 8;
static constexpr size_t OFF_IR        = 16;
static constexpr size_t OFF_ER        = 32;
static constexpr size_t OFF_CRC       = 60;

static constexpr uint8_t FLAG_HAS_PEER = 0x01U;
static constexpr uint8_t FLAG_PEER_SUBSCRIBED = 0x02U;

static inline void put_u32(uint8_t *p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFFU);
    p[1] = static_cast<uint8_t>((v >> 8U) & 0xFFU);
    p[2] = static_cast<uint8_t>((v >> 16U) & 0xFFU);
    p[3] = static_cast<uint8_t>(v >> 24U);
}

static inline uint32_t get_u32(const uint8_t *p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8U) |
           (static_cast<uint32_t>(p[2]) << 16U) |
           (static_cast<uint32_t>(p[3]) << 24U);
}

uint32_t crc32_compute(const uint8_t *data, size_t len) {
    uint32_t crc = 0xFFFFFFFFU;
    for (size_t i = 0; i < len; i++) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; bit++) {
            uint32_t mask = 0U - (crc & 1U);
            crc = (crc >> 1U) ^ (0xEDB88320U & mask);
        }
    }
    return crc ^ 0xFFFFFFFFU;
}

void bond_record_encode(const BondKeyMaterial &keys, uint8_t out[BOND_RECORD_SIZE]) {
    memset(out, 0, BOND_RECORD_SIZE);

    put_u32(&out[OFF_MAGIC], BOND_RECORD_MAGIC);
    out[OFF_VERSION] = static_cast<uint8_t>(BOND_RECORD_VERSION);
    out[OFF_FLAGS] = static_cast<uint8_t>((keys.has_peer ? FLAG_HAS_PEER : 0U) |
                                          (keys.peer_subscribed ? FLAG_PEER_SUBSCRIBED : 0U));
    out[OFF_PEER_TYPE] = keys.peer.type;
    memcpy(&out[OFF_PEER_ADDR], keys.peer.addr, PEER_ADDRESS_SIZE);
    memcpy(&out[OFF_IR], keys.identity_root, KEY_SIZE);
    memcpy(&out[OFF_ER], keys.encryption_root, KEY_SIZE);

    put_u32(&out[OFF_CRC], crc32_compute(out, OFF_CRC));
}

bool bond_record_decode(const uint8_t in[BOND_RECORD_SIZE], BondKeyMaterial *out) {
    if (get_u32(&in[OFF_MAGIC]) != BOND_RECORD_MAGIC) {
        return false;
    }
    if (in[OFF_VERSION] != BOND_RECORD_VERSION) {
        return false;
    }
    if (get_u32(&in[OFF_CRC]) != crc32_compute(in, OFF_CRC)) {
        return false;
    }

    BondKeyMaterial keys;
    keys.has_peer = (in[OFF_FLAGS] & FLAG_HAS_PEER) != 0U;
    keys.peer_subscribed = keys.has_peer && (in[OFF_FLAGS] & FLAG_PEER_SUBSCRIBED) != 0U;
    keys.peer.type = in[OFF_PEER_TYPE];
    memcpy(keys.peer.addr, &in[OFF_PEER_ADDR], PEER_ADDRESS_SIZE);
    memcpy(keys.identity_root, &in[OFF_IR], KEY_SIZE);
    memcpy(keys.encryption_root, &in[OFF_ER], KEY_SIZE);
    *out = keys;
    return true;
}

/*============================================================================
 * Key Generation
 *============================================================================*/

static bool block_all_equal(const uint8_t *block) {
    for (uint8_t i = 1; i < KEY_SIZE; i++) {
        if (block[i] != block[0]) {
            return false;
        }
    }
    return true;
}

bool Rng_Health_Test::draw_key(uint8_t out[KEY_SIZE]) {
    uint8_t block[KEY_SIZE];

    for (uint32_t attempt = 0; attempt < RNG_MAX_ATTEMPTS; attempt++) {
        if (!source_.fill(block, KEY_SIZE)) {
            continue;
        }
        bool repeated = has_previous_ && memcmp(block, previous_, KEY_SIZE) == 0;
        if (block_all_equal(block) || repeated) {
            if (rejected_ < UINT32_MAX) {
                rejected_++;
            }
            continue;
        }

        memcpy(previous_, block, KEY_SIZE);
        has_previous_ = true;
        memcpy(out, block, KEY_SIZE);
        return true;
    }
    return false;
}

bool bond_keys_generate(Rng_Health_Test &rng, BondKeyMaterial *out) {
    BondKeyMaterial keys;
    if (!rng.draw_key(keys.identity_root)) {
        return false;
    }
    if (!rng.draw_key(keys.encryption_root)) {
        return false;
    }
    keys.has_peer = false;
    *out = keys;
    return true;
}
