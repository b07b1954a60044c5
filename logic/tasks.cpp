/*
 * Application Tasks Implementation
 */

#include "logic/tasks.hpp"
#include "logic/battery_math.hpp"
#include "config.h"

static inline uint32_t to_ms(uint64_t now_us) {
    return static_cast<uint32_t>(now_us / 1000U);
}

/*============================================================================
 * Connection
 *============================================================================*/

void Connection_Task::run(uint32_t signals, uint64_t now_us) {
    /* The timer also drains: a wakeup lost before binding must not strand events */
    if ((signals & (SIGNAL_LINK_EVENT | SIGNAL_TIMER)) != 0U) {
        manager_.process_events(now_us);
    }
    if ((signals & SIGNAL_TIMER) != 0U) {
        manager_.poll(now_us);
    }
}

/*============================================================================
 * Sampler
 *============================================================================*/

void Sampler_Task::run(uint32_t signals, uint64_t now_us) {
    if ((signals & SIGNAL_TIMER) == 0U) {
        return;
    }
    if (!sampler_tick(state_)) {
        return;  /* Backing off after fault */
    }

    RawSample reading;
    bool ok = bus_.read(&reading);
    if (ok) {
        reading.timestamp_us = now_us;
    }

    RawSample out;
    SamplerEvent event = sampler_apply(state_, ok, reading, now_us, &out);

    if (event == SamplerEvent::FaultDeclared) {
        faults_.report(FaultKind::TransientHardware, "SENSOR_FAULT", state_.fail_streak, to_ms(now_us));
        reset_sensor(now_us);
    } else if (event == SamplerEvent::ResetDue) {
        reset_sensor(now_us);
    } else if (event == SamplerEvent::Recovered) {
        diag_.emit("SENSOR_RECOVERED", DiagCode::Info, state_.fault_count, to_ms(now_us));
    }

    raw_out_.post(out);
    scheduler_.signal(TaskId::Fusion, SIGNAL_RAW_SAMPLE);
}

void Sampler_Task::reset_sensor(uint64_t now_us) {
    if (resets_ < UINT32_MAX) {
        resets_++;
    }
    bool ok = bus_.reset();
    diag_.emit("SENSOR_RESET", ok ? DiagCode::Info : DiagCode::Warning, resets_, to_ms(now_us));
}

/*============================================================================
 * Fusion
 *============================================================================*/

void Fusion_Task::run(uint32_t signals, uint64_t now_us) {
    if ((signals & SIGNAL_RAW_SAMPLE) == 0U) {
        return;
    }

    RawSample raw;
    if (!raw_in_.take(&raw)) {
        return;
    }

    uint8_t flags = fusion_update(state_, raw, &latest_);
    if ((flags & ORIENT_FLAG_DRIFT_RESET) != 0U) {
        diag_.emit("FUSION_RESET", DiagCode::Warning, state_.reset_count, to_ms(now_us));
    }

    fused_out_.post(latest_);
    scheduler_.signal(TaskId::Notifier, SIGNAL_FUSED_SAMPLE);
}

/*============================================================================
 * Notifier
 *============================================================================*/

void Notifier_Task::run(uint32_t signals, uint64_t now_us) {
    if ((signals & SIGNAL_FUSED_SAMPLE) == 0U) {
        return;
    }
    OrientationSample sample;
    if (fused_in_.take(&sample)) {
        notifier_.offer(sample, now_us);
    }
}

/*============================================================================
 * Battery
 *============================================================================*/

void Battery_Task::run(uint32_t signals, uint64_t now_us) {
    if ((signals & SIGNAL_TIMER) == 0U) {
        return;
    }
    if (!gauge_.update(to_ms(now_us))) {
        return;
    }

    uint8_t level = gauge_.percent();
    if (battery_level_should_notify(reported_, last_level_, level, BAT_NOTIFY_HYSTERESIS_PCT)) {
        link_.set_battery_level(level);
        last_level_ = level;
        reported_ = true;
    }
}
