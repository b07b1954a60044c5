/*
 * Device Interfaces - Narrow seams between pure logic and Pico SDK drivers
 * Hardware implementations live in drivers/, host tests provide fakes
 */

#ifndef DEVICE_INTERFACES_HPP
#define DEVICE_INTERFACES_HPP

#include "types.h"
#include <cstddef>
#include <cstdint>

/* Inertial sensor bus. read() and reset() must complete within bounded time. */
class Sensor_Bus {
public:
    virtual ~Sensor_Bus() = default;
    virtual bool read(RawSample *out) = 0;

    /* Hardware reset and report reconfiguration. Returns false if the sensor did not come back. */
    virtual bool reset() = 0;
};

/* Non-volatile storage for BondKeyMaterial. */
class Key_Store {
public:
    virtual ~Key_Store() = default;

    /* Returns false if no valid record is stored (erased, corrupt, old version). */
    virtual bool load(BondKeyMaterial *out) = 0;
    virtual bool store(const BondKeyMaterial &keys) = 0;
};

/* Hardware entropy. Returns false if the source could not deliver. */
class Random_Source {
public:
    virtual ~Random_Source() = default;
    virtual bool fill(uint8_t *out, size_t len) = 0;
};

/* Battery level for the Battery service. */
class Battery_Gauge {
public:
    virtual ~Battery_Gauge() = default;

    /* Returns true if a new reading was taken. */
    virtual bool update(uint32_t now_ms) = 0;
    virtual uint8_t percent() const = 0;
};

#endif // DEVICE_INTERFACES_HPP
