/*
 * IMU_Wrapper - BNO08x on I2C1 as the head tracker's Sensor_Bus
 * Calibrated accelerometer + gyroscope reports; fusion runs on the RP2350
 */

#ifndef IMU_WRAPPER_HPP
#define IMU_WRAPPER_HPP

#include "config.h"
#include "types.h"
#include "logic/device_interfaces.hpp"

#include "pico/stdlib.h"

#include "hardware/gpio.h"
#include "hardware/i2c.h"

#include "bno08x.h"

#include <cstdint>

class IMU_Wrapper final : public Sensor_Bus {
public:
    /*
     * Reset the sensor, bring up I2C, wait for the SH-2 hub to talk, then
     * enable raw reports at SAMPLE_PERIOD_MS. Returns false if the sensor
     * never answered; read() then fails and the sampler degrades.
     */
    bool init();

    /*
     * Drain pending SH-2 events (bounded). Succeeds when a fresh accel or
     * gyro report arrived and both have been seen at least once.
     */
    bool read(RawSample *out) override;

    /*
     * Pulse RST, reopen the SH-2 session at the address init() found and
     * enable reports again. Short hint wait so the main loop stays inside
     * the watchdog window.
     */
    bool reset() override;

    /* Drop whatever queued up during boot. */
    void flush();

private:
    static constexpr uint8_t ADDR_PRIMARY = 0x4B;
    static constexpr uint8_t ADDR_ALTERNATE = 0x4A;
    static constexpr uint16_t REPORT_INTERVAL_MS = SAMPLE_PERIOD_MS;
    static constexpr uint8_t CAL_ACCEL_GYRO = 0x03;
    static constexpr int READ_DRAIN_LIMIT = 10;
    static constexpr int FLUSH_DRAIN_LIMIT = 200;

    static constexpr int WAKE_ATTEMPTS = 20;
    static constexpr int WAKE_POLLING_ATTEMPTS = 5;    /* Last attempts ignore HINTN */
    static constexpr uint32_t WAKE_HINT_TIMEOUT_MS = 1000;
    static constexpr uint32_t I2C_TIMEOUT_US = 100000;
    static constexpr int RECOVER_EVERY = 3;
    static constexpr uint16_t SHTP_HEADER_SIZE = 4;
    static constexpr uint32_t RESET_HINT_TIMEOUT_MS = 100;

    void pulse_reset();
    bool enable_reports();
    bool wait_for_hub(uint8_t *addr_out);
    bool read_shtp_header(uint8_t addr);
    void unstick_bus();
    void attach_i2c_pins();
    bool wait_for_hint(uint32_t timeout_ms);

    BNO08x imu_;
    uint8_t addr_ = ADDR_PRIMARY;
    bool ready_ = false;            /* SH-2 session open and reports enabled */
    Vec3 accel_ = {0.0f, 0.0f, 0.0f};
    Vec3 gyro_ = {0.0f, 0.0f, 0.0f};
    bool have_accel_ = false;
    bool have_gyro_ = false;
};

#endif // IMU_WRAPPER_HPP
