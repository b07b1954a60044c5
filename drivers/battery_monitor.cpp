/*
 * Battery_Monitor Implementation
 */

#include "drivers/battery_monitor.hpp"
#include "hardware/adc.h"

#include <cstdio>

bool Battery_Monitor::init() {
    if (!ready_) {
        adc_init();
        adc_gpio_init(BAT_ADC_PIN);
        ready_ = true;
        printf("[BAT] ADC%u on GP%u, divider %.1f\n", BAT_ADC_CHANNEL, BAT_ADC_PIN,
               static_cast<double>(BAT_VOLTAGE_DIVIDER));
    }
    return true;
}

bool Battery_Monitor::update(uint32_t now_ms) {
    if (!ready_) {
        return false;
    }
    if (sampled_ && now_ms - last_sample_ms_ < BAT_SAMPLE_INTERVAL_MS) {
        return false;
    }

    adc_select_input(BAT_ADC_CHANNEL);
    float volts = battery_raw_to_voltage(adc_read(), BAT_ADC_VREF, BAT_ADC_RESOLUTION,
                                         BAT_VOLTAGE_DIVIDER);
    battery_ema_update(state_, volts, BAT_EMA_ALPHA, BAT_VBUS_THRESHOLD_V);

    last_sample_ms_ = now_ms;
    sampled_ = true;
    return true;
}
