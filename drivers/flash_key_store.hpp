/*
 * Flash_Key_Store - Bond record in a dedicated 4KB flash sector
 * Sits below the BTstack TLV bank (last two sectors of flash)
 */

#ifndef FLASH_KEY_STORE_HPP
#define FLASH_KEY_STORE_HPP

#include "logic/device_interfaces.hpp"
#include <cstdint>

class Flash_Key_Store final : public Key_Store {
public:
    bool load(BondKeyMaterial *out) override;

    /* Erase + program one page via flash_safe_execute, then verify readback. */
    bool store(const BondKeyMaterial &keys) override;

    static uint32_t flash_offset();
};

#endif // FLASH_KEY_STORE_HPP
