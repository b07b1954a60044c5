/*
 * Orientation Math Implementation
 */

#include "logic/orientation_math.hpp"
#include <cmath>

static constexpr float PI_F = 3.14159265358979323846f;
static constexpr float HALF_PI_F = 1.57079632679489661923f;

/* |sin(pitch)| above this is treated as gimbal lock */
static constexpr float GIMBAL_LOCK_SIN = 0.9999f;

static float wrap_pi(float angle) {
    while (angle > PI_F) {
        angle -= 2.0f * PI_F;
    }
    while (angle < -PI_F) {
        angle += 2.0f * PI_F;
    }
    return angle;
}

bool quaternion_is_finite(Quat q) {
    return std::isfinite(q.w) && std::isfinite(q.x) &&
           std::isfinite(q.y) && std::isfinite(q.z);
}

Quat quaternion_normalize(Quat q) {
    if (!quaternion_is_finite(q)) {
        return {1.0f, 0.0f, 0.0f, 0.0f};
    }

    float norm_sq = q.w * q.w + q.x * q.x + q.y * q.y + q.z * q.z;
    if (norm_sq < 1e-18f) {
        return {1.0f, 0.0f, 0.0f, 0.0f};
    }

    float inv_n = 1.0f / sqrtf(norm_sq);
    return {q.w * inv_n, q.x * inv_n, q.y * inv_n, q.z * inv_n};
}

Quat quaternion_multiply(Quat a, Quat b) {
    return {
        a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z,
        a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y,
        a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x,
        a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w
    };
}

Quat quaternion_integrate(Quat q, Vec3 omega, float dt) {
    Quat omega_q = {0.0f, omega.x, omega.y, omega.z};
    Quat q_dot = quaternion_multiply(q, omega_q);

    float half_dt = 0.5f * dt;
    Quat next = {
        q.w + q_dot.w * half_dt,
        q.x + q_dot.x * half_dt,
        q.y + q_dot.y * half_dt,
        q.z + q_dot.z * half_dt
    };
    return quaternion_normalize(next);
}

Vec3 quaternion_gravity(Quat q) {
    return {
        2.0f * (q.x * q.z - q.w * q.y),
        2.0f * (q.w * q.x + q.y * q.z),
        q.w * q.w - q.x * q.x - q.y * q.y + q.z * q.z
    };
}

EulerAngles quaternion_to_euler(Quat q) {
    q = quaternion_normalize(q);
    EulerAngles e = {};

    float sin_pitch = 2.0f * (q.w * q.y - q.z * q.x);

    if (sin_pitch >= GIMBAL_LOCK_SIN) {
        /* Nose straight up: only yaw - roll is observable */
        e.pitch = HALF_PI_F;
        e.roll = 0.0f;
        e.yaw = wrap_pi(-2.0f * atan2f(q.x, q.w));
        return e;
    }
    if (sin_pitch <= -GIMBAL_LOCK_SIN) {
        /* Nose straight down: only yaw + roll is observable */
        e.pitch = -HALF_PI_F;
        e.roll = 0.0f;
        e.yaw = wrap_pi(2.0f * atan2f(q.x, q.w));
        return e;
    }

    e.pitch = asinf(sin_pitch);
    e.roll = atan2f(2.0f * (q.w * q.x + q.y * q.z),
                    1.0f - 2.0f * (q.x * q.x + q.y * q.y));
    e.yaw = atan2f(2.0f * (q.w * q.z + q.x * q.y),
                   1.0f - 2.0f * (q.y * q.y + q.z * q.z));
    return e;
}

Quat quaternion_from_euler(float yaw, float pitch, float roll) {
    float cy = cosf(yaw * 0.5f);
    float sy = sinf(yaw * 0.5f);
    float cp = cosf(pitch * 0.5f);
    float sp = sinf(pitch * 0.5f);
    float cr = cosf(roll * 0.5f);
    float sr = sinf(roll * 0.5f);

    return {
        cr * cp * cy + sr * sp * sy,
        sr * cp * cy - cr * sp * sy,
        cr * sp * cy + sr * cp * sy,
        cr * cp * sy - sr * sp * cy
    };
}

Quat quaternion_from_gravity(Vec3 accel, float yaw) {
    float norm = sqrtf(accel.x * accel.x + accel.y * accel.y + accel.z * accel.z);
    if (!(norm > 1e-6f)) {
        return quaternion_from_euler(yaw, 0.0f, 0.0f);
    }

    float ax = accel.x / norm;
    float ay = accel.y / norm;
    float az = accel.z / norm;

    float roll = atan2f(ay, az);
    float pitch = atan2f(-ax, sqrtf(ay * ay + az * az));
    return quaternion_normalize(quaternion_from_euler(yaw, pitch, roll));
}
