/*
 * Link Controller Adapter - ISR-side event capture + task-side command surface
 *
 * BLE stack callbacks run in interrupt context. Each entry point appends one
 * fixed-size LinkEvent to a small ring and wakes the Connection task; all
 * interpretation happens later in task context.
 */

#ifndef LINK_ADAPTER_HPP
#define LINK_ADAPTER_HPP

#include "types.h"
#include "config.h"
#include "logic/link_controller.hpp"
#include "logic/scheduler.hpp"
#include <cstdint>

enum class LinkEventType : uint8_t {
    Connected,
    LinkReady,
    Disconnected,
    PairingRequest,
    PairingComplete,
    EncryptionChanged,
    BufferAvailable,
    SubscriptionChanged,
    IdentityResolved
};

/*
 * Fixed-size event record. Field use by type:
 *   Connected:           handle, peer
 *   Disconnected:        handle, status = HCI reason
 *   PairingComplete:     handle, status = SM status, flag = success
 *   EncryptionChanged:   handle, flag = encrypted, bonded
 *   BufferAvailable:     handle, count
 *   SubscriptionChanged: handle, flag = subscribed
 *   IdentityResolved:    handle, peer = identity address behind a private address
 */
struct LinkEvent {
    LinkEventType type = LinkEventType::Connected;
    uint16_t handle = INVALID_CONN_HANDLE;
    PeerAddress peer;
    uint8_t status = 0;
    uint8_t count = 0;
    bool flag = false;
    bool bonded = false;
};

class Link_Adapter {
public:
    Link_Adapter(Link_Controller &controller, Scheduler &scheduler)
        : controller_(controller), scheduler_(scheduler) {}

    Link_Adapter(const Link_Adapter&) = delete;
    Link_Adapter& operator=(const Link_Adapter&) = delete;

    /*========================================================================
     * Interrupt context - O(1), never blocks
     *========================================================================*/
    void on_connected(uint16_t handle, const PeerAddress &peer);
    void on_link_ready(uint16_t handle);
    void on_disconnected(uint16_t handle, uint8_t reason);
    void on_pairing_request(uint16_t handle);
    void on_pairing_complete(uint16_t handle, bool success, uint8_t status);
    void on_encryption_changed(uint16_t handle, bool encrypted, bool bonded);
    void on_buffer_available(uint16_t handle, uint8_t count);
    void on_subscription_changed(uint16_t handle, bool subscribed);
    void on_identity_resolved(uint16_t handle, const PeerAddress &identity);

    /*========================================================================
     * Task context
     *========================================================================*/

    /* Oldest queued event. Returns false if the ring is empty. */
    bool pop(LinkEvent *out);

    /* Returns true (once) if events were lost since the last call. */
    bool take_overflow();

    uint32_t dropped_events() const { return dropped_; }

    /* Count from the most recent buffer-available report. */
    uint8_t last_reported_credits() const { return last_reported_credits_; }

    bool start_advertising() { return controller_.start_advertising(); }
    void stop_advertising() { controller_.stop_advertising(); }
    bool send_notification(uint16_t handle, const uint8_t *data, uint16_t len) {
        return controller_.notify(handle, data, len);
    }
    bool request_credit(uint16_t handle) { return controller_.request_send_credit(handle); }
    void disconnect(uint16_t handle) { controller_.disconnect(handle); }
    void confirm_pairing(uint16_t handle) { controller_.confirm_pairing(handle); }
    void decline_pairing(uint16_t handle) { controller_.decline_pairing(handle); }
    void request_link_parameters(uint16_t handle) { controller_.request_link_parameters(handle); }
    void set_identity_keys(const BondKeyMaterial &keys) { controller_.set_identity_keys(keys); }
    void forget_bonds() { controller_.forget_bonds(); }
    void set_battery_level(uint8_t percent) { controller_.set_battery_level(percent); }

private:
    void push(const LinkEvent &event);

    Link_Controller &controller_;
    Scheduler &scheduler_;

    /* Ring (multi-entry: connect/disconnect ordering must be preserved) */
    LinkEvent ring_[LINK_EVENT_QUEUE_DEPTH] = {};
    volatile uint32_t head_ = 0;    /* Next write */
    volatile uint32_t count_ = 0;
    volatile bool overflow_ = false;
    uint32_t dropped_ = 0;
    volatile uint8_t last_reported_credits_ = 0;
};

#endif // LINK_ADAPTER_HPP
