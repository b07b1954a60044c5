/*
 * Core Type Definitions for Lookpoint Tracker Firmware
 * Shared between sampler, fusion, telemetry and connection logic
 */

#ifndef LOOKPOINT_TYPES_H
#define LOOKPOINT_TYPES_H

#include <stdint.h>
#include <stdbool.h>

/*============================================================================
 * Orientation Sample Flags
 *============================================================================*/

/* Orientation quality indicators - bitfield for uint8_t flags */
#define ORIENT_FLAG_VALID           (1U << 0U)  /* Estimate is usable for telemetry */
#define ORIENT_FLAG_HELD            (1U << 1U)  /* Built from a held (re-stamped) sensor sample */
#define ORIENT_FLAG_STALE           (1U << 2U)  /* Last known orientation, sensor not delivering */
#define ORIENT_FLAG_SENSOR_FAULT    (1U << 3U)  /* Sampler has declared the sensor faulted */
#define ORIENT_FLAG_DRIFT_RESET     (1U << 4U)  /* Filter state was reset on this update */

/*============================================================================
 * Sensor Data Types
 *============================================================================*/

typedef struct {
    float w;
    float x;
    float y;
    float z;
} Quat;

typedef struct {
    float x;
    float y;
    float z;
} Vec3;

/*============================================================================
 * Sampler / Fusion Handoff Types (C++ only)
 *============================================================================*/
#ifdef __cplusplus

enum class SampleStatus : uint8_t {
    Fresh,    /* Read from the bus this tick */
    Held,     /* Last good reading re-stamped after a bus error */
    Faulted   /* Sensor declared faulted, values are last good */
};

/*
 * Raw inertial sample, body frame.
 * accel in m/s^2 (gravity included), gyro in rad/s.
 */
struct RawSample {
    uint64_t timestamp_us = 0;
    Vec3 accel = {0.0f, 0.0f, 0.0f};
    Vec3 gyro = {0.0f, 0.0f, 0.0f};
    SampleStatus status = SampleStatus::Fresh;
};

/*
 * Fused orientation produced once per fusion cycle.
 * Immutable after production; consumed at most once by telemetry.
 */
struct OrientationSample {
    uint64_t timestamp_us = 0;
    Quat q = {1.0f, 0.0f, 0.0f, 0.0f};
    uint32_t sequence = 0;
    uint8_t flags = 0;   /* ORIENT_FLAG_* */

    bool valid() const { return (flags & ORIENT_FLAG_VALID) != 0U; }
};

/*============================================================================
 * Connection Types
 *============================================================================*/

enum class ConnectionState : uint8_t {
    Advertising,
    Connecting,
    Connected,
    Bonded,
    Disconnecting,
    Disconnected
};

static constexpr uint16_t INVALID_CONN_HANDLE = 0xFFFFU;
static constexpr uint8_t KEY_SIZE = 16;
static constexpr uint8_t PEER_ADDRESS_SIZE = 6;

struct PeerAddress {
    uint8_t type = 0;
    uint8_t addr[PEER_ADDRESS_SIZE] = {};
};

/*
 * Identity and encryption root keys handed to the BLE security manager,
 * plus the identity of the bonded peer (if any).
 */
struct BondKeyMaterial {
    uint8_t identity_root[KEY_SIZE] = {};
    uint8_t encryption_root[KEY_SIZE] = {};
    PeerAddress peer;               /* Identity address once resolved */
    bool has_peer = false;
    bool peer_subscribed = false;   /* Orientation CCCD value for the bonded peer */
};

/*============================================================================
 * Fault Taxonomy
 *============================================================================*/

enum class FaultKind : uint8_t {
    None,
    TransientHardware,   /* Sensor bus - retried with backoff */
    Link,                /* Disconnect/timeout - recovered by re-advertising */
    Security,            /* Pairing failure - rate limited, never fatal */
    ResourceExhaustion,  /* RNG / key material - fatal, controlled reset */
    LogicInvariant       /* Credit underflow, impossible transition - fatal */
};

#endif /* __cplusplus */

#endif /* LOOKPOINT_TYPES_H */
