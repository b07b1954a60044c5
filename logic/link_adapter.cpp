/*
 * Link Controller Adapter Implementation
 */

#include "logic/link_adapter.hpp"
#include "logic/critical_section.hpp"

void Link_Adapter::push(const LinkEvent &event) {
    {
        Critical_Section cs;
        if (count_ >= LINK_EVENT_QUEUE_DEPTH) {
            /* Ring full - drop, task side resynchronises via overflow flag */
            overflow_ = true;
            if (dropped_ < UINT32_MAX) {
                dropped_++;
            }
        } else {
            ring_[head_] = event;
            head_ = (head_ + 1U) % LINK_EVENT_QUEUE_DEPTH;
            count_ = count_ + 1U;
        }
    }
    scheduler_.signal(TaskId::Connection, SIGNAL_LINK_EVENT);
}

void Link_Adapter::on_connected(uint16_t handle, const PeerAddress &peer) {
    LinkEvent ev;
    ev.type = LinkEventType::Connected;
    ev.handle = handle;
    ev.peer = peer;
    push(ev);
}

void Link_Adapter::on_link_ready(uint16_t handle) {
    LinkEvent ev;
    ev.type = LinkEventType::LinkReady;
    ev.handle = handle;
    push(ev);
}

void Link_Adapter::on_disconnected(uint16_t handle, uint8_t reason) {
    LinkEvent ev;
    ev.type = LinkEventType::Disconnected;
    ev.handle = handle;
    ev.status = reason;
    push(ev);
}

void Link_Adapter::on_pairing_request(uint16_t handle) {
    LinkEvent ev;
    ev.type = LinkEventType::PairingRequest;
    ev.handle = handle;
    push(ev);
}

void Link_Adapter::on_pairing_complete(uint16_t handle, bool success, uint8_t status) {
    LinkEvent ev;
    ev.type = LinkEventType::PairingComplete;
    ev.handle = handle;
    ev.flag = success;
    ev.status = status;
    push(ev);
}

void Link_Adapter::on_encryption_changed(uint16_t handle, bool encrypted, bool bonded) {
    LinkEvent ev;
    ev.type = LinkEventType::EncryptionChanged;
    ev.handle = handle;
    ev.flag = encrypted;
    ev.bonded = bonded;
    push(ev);
}

void Link_Adapter::on_buffer_available(uint16_t handle, uint8_t count) {
    last_reported_credits_ = count;

    LinkEvent ev;
    ev.type = LinkEventType::BufferAvailable;
    ev.handle = handle;
    ev.count = count;
    push(ev);
}

void Link_Adapter::on_subscription_changed(uint16_t handle, bool subscribed) {
    LinkEvent ev;
    ev.type = LinkEventType::SubscriptionChanged;
    ev.handle = handle;
    ev.flag = subscribed;
    push(ev);
}

void Link_Adapter::on_identity_resolved(uint16_t handle, const PeerAddress &identity) {
    LinkEvent ev;
    ev.type = LinkEventType::IdentityResolved;
    ev.handle = handle;
    ev.peer = identity;
    push(ev);
}

bool Link_Adapter::pop(LinkEvent *out) {
    Critical_Section cs;
    if (count_ == 0U) {
        return false;
    }
    uint32_t tail = (head_ + LINK_EVENT_QUEUE_DEPTH - count_) % LINK_EVENT_QUEUE_DEPTH;
    *out = ring_[tail];
    count_ = count_ - 1U;
    return true;
}

bool Link_Adapter::take_overflow() {
    Critical_Section cs;
    bool lost = overflow_;
    overflow_ = false;
    return lost;
}
