/*
 * Telemetry Notifier Implementation
 */

#include "logic/telemetry.hpp"
#include "logic/critical_section.hpp"
#include <cmath>

static constexpr uint64_t TELEMETRY_MAX_AGE_US = static_cast<uint64_t>(TELEMETRY_PERIOD_MS) * 1000U;

static inline void put_u16(uint8_t *p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFFU);
    p[1] = static_cast<uint8_t>(v >> 8U);
}

static inline void put_u32(uint8_t *p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFFU);
    p[1] = static_cast<uint8_t>((v >> 8U) & 0xFFU);
    p[2] = static_cast<uint8_t>((v >> 16U) & 0xFFU);
    p[3] = static_cast<uint8_t>(v >> 24U);
}

int16_t telemetry_to_q14(float v) {
    if (std::isnan(v)) {
        return 0;
    }
    float scaled = roundf(v * static_cast<float>(TELEMETRY_Q14_ONE));
    if (scaled >= 32767.0f) {
        return INT16_MAX;
    }
    if (scaled <= -32768.0f) {
        return INT16_MIN;
    }
    return static_cast<int16_t>(scaled);
}

void encode_telemetry(const OrientationSample &sample, uint8_t out[TELEMETRY_PACKET_SIZE]) {
    put_u16(&out[0], static_cast<uint16_t>(sample.sequence & 0xFFFFU));
    out[2] = sample.flags;
    out[3] = 0;
    put_u32(&out[4], static_cast<uint32_t>(sample.timestamp_us / 1000U));
    put_u16(&out[8],  static_cast<uint16_t>(telemetry_to_q14(sample.q.w)));
    put_u16(&out[10], static_cast<uint16_t>(telemetry_to_q14(sample.q.x)));
    put_u16(&out[12], static_cast<uint16_t>(telemetry_to_q14(sample.q.y)));
    put_u16(&out[14], static_cast<uint16_t>(telemetry_to_q14(sample.q.z)));
}

/*============================================================================
 * Gating
 *============================================================================*/

bool Telemetry_Notifier::gate_open() const {
    return handle_ != INVALID_CONN_HANDLE && bonded_ && subscribed_;
}

void Telemetry_Notifier::set_connection(uint16_t handle) {
    handle_ = handle;
}

void Telemetry_Notifier::set_bonded(bool bonded, uint64_t now_us) {
    bonded_ = bonded;
    try_send(now_us);
}

void Telemetry_Notifier::set_subscribed(bool subscribed, uint64_t now_us) {
    subscribed_ = subscribed;
    try_send(now_us);
}

/*============================================================================
 * Sample / Credit Inputs
 *============================================================================*/

void Telemetry_Notifier::offer(const OrientationSample &sample, uint64_t now_us) {
    {
        Critical_Section cs;
        if (has_pending_ && stats_.coalesced < UINT32_MAX) {
            stats_.coalesced++;
        }
        pending_ = sample;
        has_pending_ = true;
    }
    try_send(now_us);
}

void Telemetry_Notifier::grant_credits(uint16_t handle, uint8_t count, uint64_t now_us) {
    if (handle != handle_ || handle == INVALID_CONN_HANDLE) {
        return;
    }
    {
        Critical_Section cs;
        credits_ = count;
        credit_requested_ = false;
    }
    try_send(now_us);
}

void Telemetry_Notifier::on_link_down() {
    Critical_Section cs;
    has_pending_ = false;
    credits_ = 0;
    credit_requested_ = false;
    subscribed_ = false;
    bonded_ = false;
    handle_ = INVALID_CONN_HANDLE;
}

/*============================================================================
 * Send Rule
 *============================================================================*/

bool Telemetry_Notifier::try_send(uint64_t now_us) {
    if (!has_pending_) {
        return false;
    }

    if (!gate_open()) {
        has_pending_ = false;
        if (stats_.dropped_gated < UINT32_MAX) {
            stats_.dropped_gated++;
        }
        return false;
    }

    uint64_t age_us = (now_us > pending_.timestamp_us) ? now_us - pending_.timestamp_us : 0U;
    if (!pending_.valid() || age_us > TELEMETRY_MAX_AGE_US) {
        has_pending_ = false;
        if (stats_.dropped_stale < UINT32_MAX) {
            stats_.dropped_stale++;
        }
        return false;
    }

    if (credits_ == 0U) {
        if (!credit_requested_ && link_.request_credit(handle_)) {
            credit_requested_ = true;
            if (stats_.credit_requests < UINT32_MAX) {
                stats_.credit_requests++;
            }
        }
        return false;
    }

    uint8_t packet[TELEMETRY_PACKET_SIZE];
    encode_telemetry(pending_, packet);

    if (!link_.send_notification(handle_, packet, TELEMETRY_PACKET_SIZE)) {
        /* Controller out of buffers - wait for the next report */
        if (stats_.send_failures < UINT32_MAX) {
            stats_.send_failures++;
        }
        credits_ = 0;
        if (!credit_requested_ && link_.request_credit(handle_)) {
            credit_requested_ = true;
            if (stats_.credit_requests < UINT32_MAX) {
                stats_.credit_requests++;
            }
        }
        return false;
    }

    {
        Critical_Section cs;
        credits_--;
        has_pending_ = false;
    }
    if (stats_.sent < UINT32_MAX) {
        stats_.sent++;
    }
    return true;
}
