/*
 * Critical Section - brief interrupt masking around shared handoff state
 * Hooks are provided by the platform layer (PRIMASK on target, test stub on host)
 */

#ifndef CRITICAL_SECTION_HPP
#define CRITICAL_SECTION_HPP

#include <cstdint>

/* Disable interrupts, returning the previous mask. Nests. */
uint32_t critical_section_enter();

/* Restore the mask returned by the matching critical_section_enter(). */
void critical_section_exit(uint32_t saved);

class Critical_Section {
public:
    Critical_Section() : saved_(critical_section_enter()) {}
    ~Critical_Section() { critical_section_exit(saved_); }

    Critical_Section(const Critical_Section&) = delete;
    Critical_Section& operator=(const Critical_Section&) = delete;

private:
    uint32_t saved_;
};

#endif // CRITICAL_SECTION_HPP
