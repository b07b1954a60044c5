/*
 * Sensor Sampler Logic - Tiered fallback for IMU bus errors
 * Pure logic module, no hardware dependencies, testable on host
 */

#ifndef SENSOR_SAMPLER_HPP
#define SENSOR_SAMPLER_HPP

#include "types.h"
#include <cstdint>

/*============================================================================
 * Sampler State
 *============================================================================
 * Tiers (at 100Hz):
 *   NORMAL:  fail_streak == 0                 - fresh samples
 *   HOLD:    1 <= fail_streak <= HOLD_CYCLES  - last good sample re-stamped
 *   FAULTED: fail_streak > HOLD_CYCLES        - Faulted samples, retries back off
 *                                               1, 2, 4 ... MAX_BACKOFF ticks
 *
 * The sensor is reset when the fault is declared and again after every
 * SAMPLER_RESET_RETRIES failed retries while faulted.
 */
struct SamplerState {
    RawSample last_good;
    bool has_good = false;
    uint16_t fail_streak = 0;
    bool faulted = false;
    uint16_t backoff_ticks = 1;        /* Skip interval after the next failed retry */
    uint16_t ticks_until_retry = 0;    /* Ticks left to skip before next bus read */
    uint32_t total_errors = 0;
    uint32_t fault_count = 0;          /* Times the fault state was entered */
    uint16_t faulted_retries = 0;      /* Failed retries since the last reset request */
};

enum class SamplerEvent : uint8_t {
    None,
    FaultDeclared,   /* Hold budget exhausted this tick; reset the sensor */
    ResetDue,        /* Still faulted after SAMPLER_RESET_RETRIES retries */
    Recovered        /* First good read after a declared fault */
};

/*
 * Called once per sampling tick before touching the bus.
 * Returns true if a bus transaction should be attempted; false while backing off.
 */
bool sampler_tick(SamplerState &state);

/*
 * Apply the outcome of a completed bus transaction.
 * reading is only inspected when read_ok is true.
 * Writes the sample to hand to fusion into *out.
 */
SamplerEvent sampler_apply(SamplerState &state, bool read_ok, const RawSample &reading,
                           uint64_t now_us, RawSample *out);

#endif // SENSOR_SAMPLER_HPP
