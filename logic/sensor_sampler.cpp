/*
 * Sensor Sampler Logic - Tiered fallback implementation
 */

#include "logic/sensor_sampler.hpp"
#include "config.h"

bool sampler_tick(SamplerState &state) {
    if (state.ticks_until_retry > 0U) {
        state.ticks_until_retry--;
        return false;
    }
    return true;
}

SamplerEvent sampler_apply(SamplerState &state, bool read_ok, const RawSample &reading,
                           uint64_t now_us, RawSample *out) {
    /* ================================================================
     * GOOD READ: back to NORMAL
     * ================================================================ */
    if (read_ok) {
        bool was_faulted = state.faulted;

        state.last_good = reading;
        state.last_good.status = SampleStatus::Fresh;
        state.has_good = true;
        state.fail_streak = 0;
        state.faulted = false;
        state.backoff_ticks = 1;
        state.ticks_until_retry = 0;
        state.faulted_retries = 0;

        *out = state.last_good;
        return was_faulted ? SamplerEvent::Recovered : SamplerEvent::None;
    }

    /* ================================================================
     * BUS ERROR: advance failure counter and apply tier logic
     * ================================================================ */
    if (state.fail_streak < UINT16_MAX) {
        state.fail_streak++;
    }
    if (state.total_errors < UINT32_MAX) {
        state.total_errors++;
    }

    *out = state.last_good;
    out->timestamp_us = now_us;

    /* HOLD: re-stamp last good sample */
    if (state.fail_streak <= SAMPLER_HOLD_CYCLES) {
        out->status = state.has_good ? SampleStatus::Held : SampleStatus::Faulted;
        return SamplerEvent::None;
    }

    /* FAULTED: keep retrying, spacing attempts out */
    out->status = SampleStatus::Faulted;

    SamplerEvent event = SamplerEvent::None;
    if (!state.faulted) {
        state.faulted = true;
        state.backoff_ticks = 1;
        if (state.fault_count < UINT32_MAX) {
            state.fault_count++;
        }
        state.faulted_retries = 0;
        event = SamplerEvent::FaultDeclared;
    } else if (++state.faulted_retries >= SAMPLER_RESET_RETRIES) {
        state.faulted_retries = 0;
        event = SamplerEvent::ResetDue;
    }

    state.ticks_until_retry = state.backoff_ticks;
    uint32_t next_backoff = static_cast<uint32_t>(state.backoff_ticks) * 2U;
    state.backoff_ticks = static_cast<uint16_t>(
        (next_backoff > SAMPLER_MAX_BACKOFF_TICKS) ? SAMPLER_MAX_BACKOFF_TICKS : next_backoff);

    return event;
}
