/*
 * Battery Math - ADC scaling, smoothing and LiPo state of charge
 * Plus the reporting rules of the Battery service. No SDK dependencies.
 */

#ifndef BATTERY_MATH_HPP
#define BATTERY_MATH_HPP

#include <cstdint>

struct BatteryState {
    float filtered_voltage;  /* V, after EMA */
    bool initialized;        /* Seeded by a first sample */
    bool on_battery;         /* False while VBUS holds VSYS above the LiPo range */
};

/* ADC counts to volts at the battery, undoing the divider. 0 if resolution is 0. */
float battery_raw_to_voltage(uint16_t raw, float vref, uint32_t resolution, float divider);

/*
 * Fold one reading into the EMA (the first reading seeds it unsmoothed).
 * on_battery follows the raw reading: above vbus_threshold means USB power.
 */
void battery_ema_update(BatteryState &state, float voltage, float alpha, float vbus_threshold);

/*
 * State of charge 0-100 from a piecewise-linear single-cell LiPo curve:
 *   3.00V 0%, 3.30V 10%, 3.60V 40%, 3.80V 70%, 4.00V 90%, 4.20V 100%
 */
uint8_t battery_voltage_to_percent(float voltage);

/* Battery Level value: 100 until sampled and while on USB power. */
uint8_t battery_service_level(const BatteryState &state);

/*
 * Whether new_pct should replace the published Battery Level. The first
 * report always goes out, later ones need a change of hysteresis_pct or
 * an arrival at 0 or 100.
 */
bool battery_level_should_notify(bool reported, uint8_t last_pct, uint8_t new_pct,
                                 uint8_t hysteresis_pct);

#endif // BATTERY_MATH_HPP
