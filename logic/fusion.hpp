/*
 * Orientation Fusion Engine - Mahony complementary filter
 * Pure logic module, no hardware dependencies, testable on host
 */

#ifndef FUSION_HPP
#define FUSION_HPP

#include "types.h"
#include <cstdint>

/*============================================================================
 * Fusion State
 *============================================================================
 * Everything the filter carries between updates. Two states constructed the
 * same way and fed the same RawSample sequence produce bit-identical output.
 */
struct FusionState {
    Quat q = {1.0f, 0.0f, 0.0f, 0.0f};
    Vec3 integral = {0.0f, 0.0f, 0.0f};   /* Integral feedback (gyro bias estimate, rad/s) */
    uint64_t last_timestamp_us = 0;
    bool initialized = false;              /* Seeded from gravity on first fresh sample */
    uint16_t drift_streak = 0;             /* Consecutive gated updates above residual limit */
    uint32_t sequence = 0;                 /* Next OrientationSample sequence number */
    uint32_t reset_count = 0;
    float last_residual_rad = 0.0f;        /* Angle between measured and predicted gravity */
};

/*============================================================================
 * Fusion Update
 *============================================================================
 * One fusion cycle: (state, raw sample) -> (state', orientation sample).
 *
 *   Fresh:   gyro integration with accelerometer correction when |a| is
 *            within the gate; drift guard may reset attitude from gravity
 *   Held:    last orientation re-stamped, VALID | HELD
 *   Faulted: last orientation re-stamped, STALE | SENSOR_FAULT (not VALID)
 *
 * Returns: ORIENT_FLAG_* written to out->flags.
 */
uint8_t fusion_update(FusionState &state, const RawSample &raw, OrientationSample *out);

#endif // FUSION_HPP
