/*
 * Orientation Fusion Engine Implementation
 */

#include "logic/fusion.hpp"
#include "logic/orientation_math.hpp"
#include "config.h"
#include <cmath>

static inline float vec3_magnitude(const Vec3 &v) {
    return sqrtf(v.x * v.x + v.y * v.y + v.z * v.z);
}

static inline float clampf(float v, float limit) {
    if (v > limit) {
        return limit;
    }
    if (v < -limit) {
        return -limit;
    }
    return v;
}

/* Rebuild attitude from gravity, keeping the current heading. */
static void reset_from_gravity(FusionState &state, const Vec3 &accel) {
    float yaw = 0.0f;
    if (quaternion_is_finite(state.q)) {
        yaw = quaternion_to_euler(state.q).yaw;
    }
    state.q = quaternion_from_gravity(accel, yaw);
    state.integral = {0.0f, 0.0f, 0.0f};
    state.drift_streak = 0;
    if (state.reset_count < UINT32_MAX) {
        state.reset_count++;
    }
}

static void emit(FusionState &state, const RawSample &raw, uint8_t flags,
                 OrientationSample *out) {
    out->timestamp_us = raw.timestamp_us;
    out->q = state.q;
    out->sequence = state.sequence++;
    out->flags = flags;
}

uint8_t fusion_update(FusionState &state, const RawSample &raw, OrientationSample *out) {
    if (raw.status == SampleStatus::Faulted) {
        emit(state, raw, ORIENT_FLAG_STALE | ORIENT_FLAG_SENSOR_FAULT, out);
        return out->flags;
    }

    if (raw.status == SampleStatus::Held) {
        /* Orientation is held, not extrapolated; keep dt bookkeeping current */
        if (raw.timestamp_us > state.last_timestamp_us) {
            state.last_timestamp_us = raw.timestamp_us;
        }
        uint8_t flags = state.initialized ? (ORIENT_FLAG_VALID | ORIENT_FLAG_HELD)
                                          : (ORIENT_FLAG_STALE | ORIENT_FLAG_HELD);
        emit(state, raw, flags, out);
        return out->flags;
    }

    /* === Fresh sample === */
    if (!state.initialized) {
        state.q = quaternion_from_gravity(raw.accel, 0.0f);
        state.integral = {0.0f, 0.0f, 0.0f};
        state.last_timestamp_us = raw.timestamp_us;
        state.initialized = true;
        emit(state, raw, ORIENT_FLAG_VALID, out);
        return out->flags;
    }

    float dt = 0.0f;
    if (raw.timestamp_us > state.last_timestamp_us) {
        dt = static_cast<float>(raw.timestamp_us - state.last_timestamp_us) * 1e-6f;
        state.last_timestamp_us = raw.timestamp_us;
    }
    if (dt > FUSION_MAX_DT_S) {
        dt = FUSION_MAX_DT_S;
    }

    uint8_t flags = ORIENT_FLAG_VALID;
    Vec3 omega = raw.gyro;

    float accel_mag = vec3_magnitude(raw.accel);
    float accel_g = accel_mag / FUSION_GRAVITY_MS2;
    bool accel_gated = (accel_g >= FUSION_ACCEL_GATE_LOW) && (accel_g <= FUSION_ACCEL_GATE_HIGH);

    if (accel_gated) {
        Vec3 a = {raw.accel.x / accel_mag, raw.accel.y / accel_mag, raw.accel.z / accel_mag};
        Vec3 v = quaternion_gravity(state.q);

        /* Error is the rotation taking predicted gravity onto measured gravity */
        Vec3 e = {
            a.y * v.z - a.z * v.y,
            a.z * v.x - a.x * v.z,
            a.x * v.y - a.y * v.x
        };
        float dot = a.x * v.x + a.y * v.y + a.z * v.z;
        state.last_residual_rad = atan2f(vec3_magnitude(e), dot);

        if (state.last_residual_rad > FUSION_DRIFT_RESIDUAL_RAD) {
            if (state.drift_streak < UINT16_MAX) {
                state.drift_streak++;
            }
        } else {
            state.drift_streak = 0;
        }

        if (state.drift_streak >= FUSION_DRIFT_WINDOW) {
            reset_from_gravity(state, raw.accel);
            flags |= ORIENT_FLAG_DRIFT_RESET;
            emit(state, raw, flags, out);
            return out->flags;
        }

        state.integral.x = clampf(state.integral.x + FUSION_KI * e.x * dt, FUSION_INTEGRAL_LIMIT);
        state.integral.y = clampf(state.integral.y + FUSION_KI * e.y * dt, FUSION_INTEGRAL_LIMIT);
        state.integral.z = clampf(state.integral.z + FUSION_KI * e.z * dt, FUSION_INTEGRAL_LIMIT);

        omega.x += FUSION_KP * e.x + state.integral.x;
        omega.y += FUSION_KP * e.y + state.integral.y;
        omega.z += FUSION_KP * e.z + state.integral.z;
    }

    bool omega_finite = std::isfinite(omega.x) && std::isfinite(omega.y) && std::isfinite(omega.z);
    if (!omega_finite || !quaternion_is_finite(state.q)) {
        /* Diverged (NaN gyro input or corrupted state) */
        reset_from_gravity(state, raw.accel);
        flags |= ORIENT_FLAG_DRIFT_RESET;
    } else {
        state.q = quaternion_integrate(state.q, omega, dt);
    }

    emit(state, raw, flags, out);
    return out->flags;
}
