/*
 * IMU_Wrapper Implementation
 */

#include "drivers/imu_wrapper.hpp"

#include "sh2.h"

#include <cstdio>
#include <initializer_list>

/*============================================================================
 * Bring-up
 *============================================================================*/

bool IMU_Wrapper::init() {
    gpio_init(IMU_INT_PIN);
    gpio_set_dir(IMU_INT_PIN, GPIO_IN);
    gpio_pull_up(IMU_INT_PIN);

    gpio_init(IMU_RST_PIN);
    gpio_set_dir(IMU_RST_PIN, GPIO_OUT);
    pulse_reset();

    i2c_init(i2c1, IMU_I2C_FREQ_HZ);
    attach_i2c_pins();

    if (!wait_for_hub(&addr_)) {
        printf("[IMU] SH-2 hub silent after %d attempts\n", WAKE_ATTEMPTS);
        stdio_flush();
        return false;
    }

    if (!imu_.begin(addr_, i2c1)) {
        printf("[IMU] begin() failed at 0x%02X\n", addr_);
        return false;
    }
    if (imu_.prodIds.numEntries > 0) {
        printf("[IMU] BNO08x 0x%02X fw %u.%u.%u part %lu\n", addr_,
               imu_.prodIds.entry[0].swVersionMajor,
               imu_.prodIds.entry[0].swVersionMinor,
               imu_.prodIds.entry[0].swVersionPatch,
               static_cast<unsigned long>(imu_.prodIds.entry[0].swPartNumber));
    }

    if (!enable_reports()) {
        printf("[IMU] Report enable failed\n");
        return false;
    }

    printf("[IMU] Accel + calibrated gyro every %u ms\n", REPORT_INTERVAL_MS);
    stdio_flush();
    return true;
}

void IMU_Wrapper::pulse_reset() {
    gpio_put(IMU_RST_PIN, 0);
    sleep_ms(10);
    gpio_put(IMU_RST_PIN, 1);
    sleep_ms(100);
}

bool IMU_Wrapper::enable_reports() {
    if (!imu_.setCalibrationConfig(CAL_ACCEL_GYRO)) {
        printf("[IMU] Dynamic calibration not enabled\n");
    }
    ready_ = imu_.enableAccelerometer(REPORT_INTERVAL_MS) && imu_.enableGyro(REPORT_INTERVAL_MS);
    return ready_;
}

bool IMU_Wrapper::reset() {
    ready_ = false;
    have_accel_ = false;
    have_gyro_ = false;

    pulse_reset();
    if (!wait_for_hint(RESET_HINT_TIMEOUT_MS) || !read_shtp_header(addr_)) {
        /* Hub still silent; a stuck slave may be holding SDA */
        unstick_bus();
        return false;
    }
    if (!imu_.begin(addr_, i2c1)) {
        return false;
    }
    return enable_reports();
}

bool IMU_Wrapper::wait_for_hint(uint32_t timeout_ms) {
    absolute_time_t deadline = make_timeout_time_ms(timeout_ms);
    while (!time_reached(deadline)) {
        if (!gpio_get(IMU_INT_PIN)) {
            return true;
        }
        sleep_us(100);
    }
    return false;
}

bool IMU_Wrapper::read_shtp_header(uint8_t addr) {
    uint8_t ping = 0;
    if (i2c_write_timeout_us(i2c1, addr, &ping, 1, false, I2C_TIMEOUT_US) < 0) {
        return false;
    }

    uint8_t header[SHTP_HEADER_SIZE] = {0};
    if (i2c_read_timeout_us(i2c1, addr, header, SHTP_HEADER_SIZE, false,
                            I2C_TIMEOUT_US) != SHTP_HEADER_SIZE) {
        return false;
    }

    /* Consume the advertisement body so begin() starts on a packet boundary */
    uint16_t length = static_cast<uint16_t>((header[0] | (header[1] << 8)) & 0x7FFF);
    static uint8_t body[256];
    while (length > SHTP_HEADER_SIZE) {
        uint16_t chunk = static_cast<uint16_t>(length - SHTP_HEADER_SIZE);
        if (chunk > sizeof(body)) {
            chunk = sizeof(body);
        }
        if (i2c_read_timeout_us(i2c1, addr, body, chunk, false, I2C_TIMEOUT_US) != chunk) {
            break;
        }
        length = static_cast<uint16_t>(length - chunk);
    }
    return true;
}

bool IMU_Wrapper::wait_for_hub(uint8_t *addr_out) {
    for (int attempt = 0; attempt < WAKE_ATTEMPTS; attempt++) {
        bool polling = attempt >= WAKE_ATTEMPTS - WAKE_POLLING_ATTEMPTS;
        if (!wait_for_hint(WAKE_HINT_TIMEOUT_MS) && !polling) {
            continue;
        }

        for (uint8_t addr : {ADDR_PRIMARY, ADDR_ALTERNATE}) {
            if (read_shtp_header(addr)) {
                *addr_out = addr;
                return true;
            }
        }

        if ((attempt + 1) % RECOVER_EVERY == 0) {
            printf("[IMU] Attempt %d: recovering bus\n", attempt + 1);
            unstick_bus();
        }
    }
    return false;
}

void IMU_Wrapper::attach_i2c_pins() {
    gpio_set_function(IMU_SDA_PIN, GPIO_FUNC_I2C);
    gpio_set_function(IMU_SCL_PIN, GPIO_FUNC_I2C);
    gpio_pull_up(IMU_SDA_PIN);
    gpio_pull_up(IMU_SCL_PIN);
}

void IMU_Wrapper::unstick_bus() {
    /* Bit-bang SCL until the slave lets go of SDA, then issue a STOP */
    gpio_init(IMU_SDA_PIN);
    gpio_init(IMU_SCL_PIN);
    gpio_set_dir(IMU_SDA_PIN, GPIO_IN);
    gpio_set_dir(IMU_SCL_PIN, GPIO_OUT);

    for (int clock = 0; clock < 9 && !gpio_get(IMU_SDA_PIN); clock++) {
        gpio_put(IMU_SCL_PIN, 0);
        sleep_us(10);
        gpio_put(IMU_SCL_PIN, 1);
        sleep_us(10);
    }

    /* STOP: SDA rises while SCL is high */
    gpio_set_dir(IMU_SDA_PIN, GPIO_OUT);
    gpio_put(IMU_SCL_PIN, 0);
    gpio_put(IMU_SDA_PIN, 0);
    sleep_us(10);
    gpio_put(IMU_SCL_PIN, 1);
    sleep_us(10);
    gpio_put(IMU_SDA_PIN, 1);
    sleep_us(10);

    attach_i2c_pins();
    sleep_ms(100);
}

/*============================================================================
 * Sampling
 *============================================================================*/

bool IMU_Wrapper::read(RawSample *out) {
    if (!ready_) {
        return false;
    }
    bool fresh = false;

    for (int i = 0; i < READ_DRAIN_LIMIT && imu_.getSensorEvent(); i++) {
        switch (imu_.getSensorEventID()) {
            case SH2_ACCELEROMETER:
                accel_ = {imu_.getAccelX(), imu_.getAccelY(), imu_.getAccelZ()};
                have_accel_ = true;
                fresh = true;
                break;
            case SH2_GYROSCOPE_CALIBRATED:
                gyro_ = {imu_.getGyroX(), imu_.getGyroY(), imu_.getGyroZ()};
                have_gyro_ = true;
                fresh = true;
                break;
            default:
                break;
        }
    }

    if (!fresh || !have_accel_ || !have_gyro_) {
        return false;
    }

    out->accel = accel_;
    out->gyro = gyro_;
    out->status = SampleStatus::Fresh;
    return true;
}

void IMU_Wrapper::flush() {
    if (!ready_) {
        return;
    }
    int drained = 0;
    while (drained < FLUSH_DRAIN_LIMIT && imu_.getSensorEvent()) {
        drained++;
    }
}
