/*
 * Pico_Random_Source - pico_rand entropy (ROSC, TRNG on RP2350, timing jitter)
 */

#ifndef PICO_RANDOM_SOURCE_HPP
#define PICO_RANDOM_SOURCE_HPP

#include "logic/device_interfaces.hpp"

class Pico_Random_Source final : public Random_Source {
public:
    bool fill(uint8_t *out, size_t len) override;
};

#endif // PICO_RANDOM_SOURCE_HPP
