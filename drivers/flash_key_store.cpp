/*
 * Flash_Key_Store Implementation
 */

#include "drivers/flash_key_store.hpp"
#include "logic/bond_record.hpp"
#include "config.h"

#include "pico/stdlib.h"
#include "pico/flash.h"
#include "hardware/flash.h"

#include <cstdio>
#include <cstring>

struct FlashWriteParams {
    uint32_t offset;
    uint8_t page[FLASH_PAGE_SIZE];
};

/* Runs with interrupts masked and XIP paused (flash_safe_execute) */
static void erase_and_program(void *param) {
    const FlashWriteParams *p = static_cast<const FlashWriteParams *>(param);
    flash_range_erase(p->offset, FLASH_SECTOR_SIZE);
    flash_range_program(p->offset, p->page, FLASH_PAGE_SIZE);
}

uint32_t Flash_Key_Store::flash_offset() {
    return PICO_FLASH_SIZE_BYTES - KEY_STORE_SECTOR_FROM_END * FLASH_SECTOR_SIZE;
}

bool Flash_Key_Store::load(BondKeyMaterial *out) {
    const uint8_t *record = reinterpret_cast<const uint8_t *>(XIP_BASE + flash_offset());
    if (!bond_record_decode(record, out)) {
        printf("[KEYS] No valid bond record at 0x%08lX\n",
               static_cast<unsigned long>(flash_offset()));
        return false;
    }
    printf("[KEYS] Bond record loaded (peer=%s)\n", out->has_peer ? "yes" : "no");
    return true;
}

bool Flash_Key_Store::store(const BondKeyMaterial &keys) {
    static FlashWriteParams params;
    params.offset = flash_offset();
    memset(params.page, 0xFF, sizeof(params.page));
    bond_record_encode(keys, params.page);

    int rc = flash_safe_execute(erase_and_program, &params, KEY_STORE_FLASH_TIMEOUT_MS);
    if (rc != PICO_OK) {
        printf("[KEYS] Flash write failed (%d)\n", rc);
        return false;
    }

    BondKeyMaterial readback;
    const uint8_t *record = reinterpret_cast<const uint8_t *>(XIP_BASE + params.offset);
    if (!bond_record_decode(record, &readback)) {
        printf("[KEYS] Readback verify failed\n");
        return false;
    }

    printf("[KEYS] Bond record stored\n");
    return true;
}
