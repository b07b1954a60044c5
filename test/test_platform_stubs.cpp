/*
 * Host stand-ins for drivers/platform_sync.cpp
 * No interrupts on the host: track entries and nesting so tests can
 * check that shared state is only touched inside a critical section.
 */

#include "logic/critical_section.hpp"
#include "test/platform_stubs.hpp"

static uint32_t g_entered = 0;
static int32_t g_depth = 0;

uint32_t critical_section_enter() {
    g_entered++;
    g_depth++;
    return static_cast<uint32_t>(g_depth - 1);
}

void critical_section_exit(uint32_t saved) {
    g_depth = static_cast<int32_t>(saved);
}

uint32_t stub_critical_sections_entered() {
    return g_entered;
}

int32_t stub_critical_section_depth() {
    return g_depth;
}

void stub_reset_critical_sections() {
    g_entered = 0;
    g_depth = 0;
}
