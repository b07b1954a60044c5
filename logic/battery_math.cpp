/*
 * Battery Voltage Math Implementation
 */

#include "logic/battery_math.hpp"

/*==============================================================================
 * LiPo discharge curve (open-circuit voltage vs state of charge)
 *============================================================================*/

namespace {

struct CurvePoint {
    float volts;
    float pct;
};

constexpr CurvePoint LIPO_CURVE[] = {
    {3.00f,   0.0f},
    {3.30f,  10.0f},
    {3.60f,  40.0f},
    {3.80f,  70.0f},
    {4.00f,  90.0f},
    {4.20f, 100.0f},
};

constexpr uint8_t LIPO_CURVE_POINTS = sizeof(LIPO_CURVE) / sizeof(LIPO_CURVE[0]);

uint8_t round_pct(float pct) {
    return static_cast<uint8_t>(pct + 0.5f);
}

}  // namespace

/*==============================================================================
 * ADC and filtering
 *============================================================================*/

float battery_raw_to_voltage(uint16_t raw, float vref, uint32_t resolution, float divider) {
    if (resolution == 0U) {
        return 0.0f;
    }
    float pin_volts = static_cast<float>(raw) * vref / static_cast<float>(resolution);
    return pin_volts * divider;
}

void battery_ema_update(BatteryState &state, float voltage, float alpha, float vbus_threshold) {
    /* Above the LiPo range only VBUS can be feeding VSYS */
    state.on_battery = voltage <= vbus_threshold;

    if (state.initialized) {
        state.filtered_voltage += alpha * (voltage - state.filtered_voltage);
        return;
    }
    state.filtered_voltage = voltage;
    state.initialized = true;
}

uint8_t battery_voltage_to_percent(float voltage) {
    if (voltage <= LIPO_CURVE[0].volts) {
        return 0;
    }

    for (uint8_t i = 1; i < LIPO_CURVE_POINTS; i++) {
        const CurvePoint &lo = LIPO_CURVE[i - 1];
        const CurvePoint &hi = LIPO_CURVE[i];
        if (voltage < hi.volts) {
            float t = (voltage - lo.volts) / (hi.volts - lo.volts);
            return round_pct(lo.pct + t * (hi.pct - lo.pct));
        }
    }
    return 100;
}

/*==============================================================================
 * Battery service
 *============================================================================*/

uint8_t battery_service_level(const BatteryState &state) {
    if (!state.initialized || !state.on_battery) {
        return 100;
    }
    return battery_voltage_to_percent(state.filtered_voltage);
}

bool battery_level_should_notify(bool reported, uint8_t last_pct, uint8_t new_pct,
                                 uint8_t hysteresis_pct) {
    if (!reported) {
        return true;
    }
    if (new_pct == last_pct) {
        return false;
    }
    if (new_pct == 0U || new_pct == 100U) {
        return true;
    }
    uint8_t delta = (new_pct > last_pct) ? static_cast<uint8_t>(new_pct - last_pct)
                                         : static_cast<uint8_t>(last_pct - new_pct);
    return delta >= hysteresis_pct;
}
