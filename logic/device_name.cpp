/*
 * Device Name Implementation
 */

#include "logic/device_name.hpp"
#include <cstring>

static inline bool is_continuation_byte(uint8_t b) {
    return (b & 0xC0U) == 0x80U;
}

size_t utf8_truncated_length(const char *name, size_t max_len) {
    size_t len = strlen(name);
    if (len <= max_len) {
        return len;
    }

    /* Back up to the first byte of the code point that straddles the limit */
    size_t cut = max_len;
    while (cut > 0U && is_continuation_byte(static_cast<uint8_t>(name[cut]))) {
        cut--;
    }
    return cut;
}

bool device_name_fit(const char *name, size_t max_len, char *out, size_t out_size) {
    if (out_size == 0U) {
        return true;
    }
    if (max_len > out_size - 1U) {
        max_len = out_size - 1U;
    }

    size_t len = utf8_truncated_length(name, max_len);
    memcpy(out, name, len);
    out[len] = '\0';
    return len != strlen(name);
}
