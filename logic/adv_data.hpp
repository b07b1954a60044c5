/*
 * Advertising Data - Legacy advertising and scan response payloads
 *
 * Advertising:   Flags (LE General Discoverable, BR/EDR not supported)
 *                + Complete Local Name (Shortened Local Name if it does not fit)
 * Scan response: Complete list of 128-bit Service UUIDs (Head Tracking)
 */

#ifndef ADV_DATA_HPP
#define ADV_DATA_HPP

#include "config.h"
#include <cstdint>

/* AD types (Bluetooth Assigned Numbers, Generic Access Profile) */
static constexpr uint8_t AD_TYPE_FLAGS              = 0x01;
static constexpr uint8_t AD_TYPE_UUID128_COMPLETE   = 0x07;
static constexpr uint8_t AD_TYPE_NAME_SHORTENED     = 0x08;
static constexpr uint8_t AD_TYPE_NAME_COMPLETE      = 0x09;

static constexpr uint8_t AD_FLAG_LE_GENERAL_DISCOVERABLE = 0x02;
static constexpr uint8_t AD_FLAG_BR_EDR_NOT_SUPPORTED    = 0x04;

/* Head Tracking service A1C7F3E0-5B2D-4E8A-9F61-3C0D2B7E4A10, little-endian */
extern const uint8_t HEAD_TRACKING_SERVICE_UUID128[16];

struct AdvPayload {
    uint8_t data[ADV_PAYLOAD_MAX_LEN];
    uint8_t len;
};

/*
 * Build the advertising payload for name.
 * Returns false if not even a one-character shortened name fits.
 */
bool adv_build_advertising(const char *name, AdvPayload *out);

/* Build the scan response carrying the 128-bit service UUID. */
void adv_build_scan_response(const uint8_t uuid128_le[16], AdvPayload *out);

#endif // ADV_DATA_HPP
