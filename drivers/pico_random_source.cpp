/*
 * Pico_Random_Source Implementation
 */

#include "drivers/pico_random_source.hpp"
#include "pico/rand.h"

#include <cstring>

bool Pico_Random_Source::fill(uint8_t *out, size_t len) {
    if (out == nullptr) {
        return false;
    }

    while (len > 0U) {
        rng_128_t block;
        get_rand_128(&block);

        size_t n = (len < sizeof(block.r)) ? len : sizeof(block.r);
        memcpy(out, block.r, n);
        out += n;
        len -= n;
    }
    return true;
}
