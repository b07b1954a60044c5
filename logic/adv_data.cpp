/*
 * Advertising Data Implementation
 */

#include "logic/adv_data.hpp"
#include "logic/device_name.hpp"
#include <cstring>

const uint8_t HEAD_TRACKING_SERVICE_UUID128[16] = {
    0x10, 0x4A, 0x7E, 0x2B, 0x0D, 0x3C, 0x61, 0x9F,
    0x8A, 0x4E, 0x2D, 0x5B, 0xE0, 0xF3, 0xC7, 0xA1
};

bool adv_build_advertising(const char *name, AdvPayload *out) {
    uint8_t *p = out->data;

    /* Flags */
    p[0] = 2;
    p[1] = AD_TYPE_FLAGS;
    p[2] = AD_FLAG_LE_GENERAL_DISCOVERABLE | AD_FLAG_BR_EDR_NOT_SUPPORTED;
    uint8_t len = 3;

    /* Local name: length byte + type byte + name */
    size_t room = ADV_PAYLOAD_MAX_LEN - len - 2U;
    size_t name_len = strlen(name);
    size_t fit = utf8_truncated_length(name, room);
    if (fit == 0U && name_len > 0U) {
        out->len = 0;
        return false;
    }

    p[len] = static_cast<uint8_t>(fit + 1U);
    p[len + 1U] = (fit == name_len) ? AD_TYPE_NAME_COMPLETE : AD_TYPE_NAME_SHORTENED;
    memcpy(&p[len + 2U], name, fit);
    len = static_cast<uint8_t>(len + 2U + fit);

    out->len = len;
    return true;
}

void adv_build_scan_response(const uint8_t uuid128_le[16], AdvPayload *out) {
    out->data[0] = 17;
    out->data[1] = AD_TYPE_UUID128_COMPLETE;
    memcpy(&out->data[2], uuid128_le, 16);
    out->len = 18;
}
