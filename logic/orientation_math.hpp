/*
 * Orientation Math - quaternion helpers for the fusion engine
 * Pure single-precision functions, no SDK dependencies, testable on host
 */

#ifndef ORIENTATION_MATH_HPP
#define ORIENTATION_MATH_HPP

#include "types.h"

/*============================================================================
 * Euler Angles (diagnostics only)
 *============================================================================
 * Aerospace ZYX convention: yaw about Z, then pitch about Y, then roll about X.
 * Radians. yaw, roll in [-pi, pi], pitch in [-pi/2, pi/2].
 */
struct EulerAngles {
    float yaw;
    float pitch;
    float roll;
};

/*============================================================================
 * Quaternion Normalize
 *============================================================================
 * Returns unit quaternion. Degenerate or non-finite input (norm < 1e-9)
 * yields identity.
 */
Quat quaternion_normalize(Quat q);

/* Hamilton product a * b */
Quat quaternion_multiply(Quat a, Quat b);

/*============================================================================
 * Quaternion Integrate (Euler step)
 *============================================================================
 * q_next = normalize(q + 0.5 * q * (0, omega) * dt), omega in body frame rad/s.
 */
Quat quaternion_integrate(Quat q, Vec3 omega, float dt);

/*============================================================================
 * Gravity Direction
 *============================================================================
 * Unit vector of world "up" expressed in the body frame for attitude q.
 * Matches a normalized accelerometer reading of a device at rest.
 */
Vec3 quaternion_gravity(Quat q);

/*============================================================================
 * Quaternion to Euler
 *============================================================================
 * Singularity safe: when |sin(pitch)| approaches 1 (gimbal lock) roll is
 * folded into yaw and reported as 0, pitch is clamped to +/-pi/2.
 */
EulerAngles quaternion_to_euler(Quat q);

/* Inverse of quaternion_to_euler (ZYX). */
Quat quaternion_from_euler(float yaw, float pitch, float roll);

/*============================================================================
 * Attitude From Gravity
 *============================================================================
 * Roll and pitch from an accelerometer reading, keeping the supplied yaw.
 * Zero-length input yields level attitude.
 */
Quat quaternion_from_gravity(Vec3 accel, float yaw);

/* True if all four components are finite. */
bool quaternion_is_finite(Quat q);

#endif // ORIENTATION_MATH_HPP
