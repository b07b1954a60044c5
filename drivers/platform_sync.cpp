/*
 * Critical section hooks for RP2350 - PRIMASK save/restore
 * Masks the CYW43/BTstack background IRQ as well as every other interrupt
 */

#include "logic/critical_section.hpp"
#include "hardware/sync.h"

uint32_t critical_section_enter() {
    return save_and_disable_interrupts();
}

void critical_section_exit(uint32_t saved) {
    restore_interrupts(saved);
}
