/*
 * Telemetry Notifier - Single-slot coalescing + credit flow control
 *
 * Newest orientation sample wins. A sample is sent only while the link is
 * bonded and subscribed, a credit is available, and the sample is VALID and
 * younger than one telemetry period. Nothing is ever queued behind a busy link.
 */

#ifndef TELEMETRY_HPP
#define TELEMETRY_HPP

#include "types.h"
#include "config.h"
#include "logic/link_adapter.hpp"
#include <cstdint>

/*============================================================================
 * Wire Format (16 bytes, little-endian)
 *============================================================================
 *   [0..1]   u16 sequence (low 16 bits of OrientationSample::sequence)
 *   [2]      u8  ORIENT_FLAG_*
 *   [3]      u8  reserved (0)
 *   [4..7]   u32 timestamp_ms
 *   [8..15]  i16 qw, qx, qy, qz  Q14 (16384 = 1.0), saturated
 */
void encode_telemetry(const OrientationSample &sample, uint8_t out[TELEMETRY_PACKET_SIZE]);

/* Quaternion component to Q14, rounded and saturated. NaN encodes as 0. */
int16_t telemetry_to_q14(float v);

struct TelemetryStats {
    uint32_t sent = 0;
    uint32_t coalesced = 0;       /* Pending sample overwritten before send */
    uint32_t dropped_stale = 0;   /* Older than TELEMETRY_PERIOD_MS or not VALID */
    uint32_t dropped_gated = 0;   /* Link not bonded/subscribed */
    uint32_t credit_requests = 0;
    uint32_t send_failures = 0;   /* Controller refused despite credit */
};

class Telemetry_Notifier {
public:
    explicit Telemetry_Notifier(Link_Adapter &link) : link_(link) {}

    Telemetry_Notifier(const Telemetry_Notifier&) = delete;
    Telemetry_Notifier& operator=(const Telemetry_Notifier&) = delete;

    /* Gating inputs, owned by the Connection Manager */
    void set_connection(uint16_t handle);
    void set_bonded(bool bonded, uint64_t now_us);
    void set_subscribed(bool subscribed, uint64_t now_us);

    /* Replace the pending sample, then try to send. */
    void offer(const OrientationSample &sample, uint64_t now_us);

    /* Buffer-available report: credits := count for the live handle. */
    void grant_credits(uint16_t handle, uint8_t count, uint64_t now_us);

    /* Discard pending sample, credits, subscription and request state. */
    void on_link_down();

    /* Apply the send rule once. Returns true if a notification went out. */
    bool try_send(uint64_t now_us);

    uint8_t credits() const { return credits_; }
    bool has_pending() const { return has_pending_; }
    bool credit_requested() const { return credit_requested_; }
    bool subscribed() const { return subscribed_; }
    bool bonded() const { return bonded_; }
    TelemetryStats stats() const { return stats_; }

private:
    bool gate_open() const;

    Link_Adapter &link_;

    OrientationSample pending_;
    bool has_pending_ = false;

    uint16_t handle_ = INVALID_CONN_HANDLE;
    bool bonded_ = false;
    bool subscribed_ = false;
    uint8_t credits_ = 0;
    bool credit_requested_ = false;

    TelemetryStats stats_;
};

#endif // TELEMETRY_HPP
