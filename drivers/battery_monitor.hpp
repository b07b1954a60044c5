/*
 * Battery_Monitor - LiPo voltage on GP26/ADC0 behind a 200K/100K divider
 * Source of the Battery service level
 */

#ifndef BATTERY_MONITOR_HPP
#define BATTERY_MONITOR_HPP

#include "config.h"
#include "logic/battery_math.hpp"
#include "logic/device_interfaces.hpp"
#include <cstdint>

class Battery_Monitor final : public Battery_Gauge {
public:
    /* Claim the ADC pin. Safe to call again. */
    bool init();

    /*
     * Take one ADC sample if BAT_SAMPLE_INTERVAL_MS has passed since the
     * previous one (the first call always samples).
     * Returns true if the filtered state changed.
     */
    bool update(uint32_t now_ms) override;

    uint8_t percent() const override { return battery_service_level(state_); }

    float voltage() const { return state_.filtered_voltage; }
    bool on_battery() const { return state_.on_battery; }

private:
    BatteryState state_ = {};
    uint32_t last_sample_ms_ = 0;
    bool sampled_ = false;
    bool ready_ = false;
};

#endif // BATTERY_MONITOR_HPP
