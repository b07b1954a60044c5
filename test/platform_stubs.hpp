/*
 * Host implementations of the platform hooks the logic layer links against
 */

#ifndef PLATFORM_STUBS_HPP
#define PLATFORM_STUBS_HPP

#include <cstdint>

/* Critical sections entered since the last reset, and the current nesting depth */
uint32_t stub_critical_sections_entered();
int32_t stub_critical_section_depth();
void stub_reset_critical_sections();

#endif // PLATFORM_STUBS_HPP
