/*
 * Pairing Guard Implementation
 */

#include "logic/pairing_guard.hpp"
#include <cstring>

bool peer_address_equal(const PeerAddress &a, const PeerAddress &b) {
    return a.type == b.type && memcmp(a.addr, b.addr, PEER_ADDRESS_SIZE) == 0;
}

/* Wrap-safe: true while now_ms is before deadline_ms */
static inline bool before(uint32_t now_ms, uint32_t deadline_ms) {
    return static_cast<int32_t>(deadline_ms - now_ms) > 0;
}

const Pairing_Guard::Entry *Pairing_Guard::find(const PeerAddress &peer) const {
    for (const Entry &e : entries_) {
        if (e.in_use && peer_address_equal(e.peer, peer)) {
            return &e;
        }
    }
    return nullptr;
}

Pairing_Guard::Entry &Pairing_Guard::find_or_evict(const PeerAddress &peer) {
    Entry *victim = &entries_[0];
    for (Entry &e : entries_) {
        if (e.in_use && peer_address_equal(e.peer, peer)) {
            return e;
        }
        if (!e.in_use) {
            if (victim->in_use) {
                victim = &e;
            }
        } else if (victim->in_use && e.last_used < victim->last_used) {
            victim = &e;
        }
    }

    *victim = Entry();
    victim->peer = peer;
    victim->in_use = true;
    return *victim;
}

bool Pairing_Guard::is_locked(const PeerAddress &peer, uint32_t now_ms) const {
    const Entry *e = find(peer);
    return e != nullptr && e->locked && before(now_ms, e->locked_until_ms);
}

uint32_t Pairing_Guard::lockout_remaining_ms(const PeerAddress &peer, uint32_t now_ms) const {
    if (!is_locked(peer, now_ms)) {
        return 0;
    }
    return find(peer)->locked_until_ms - now_ms;
}

bool Pairing_Guard::record_failure(const PeerAddress &peer, uint32_t now_ms) {
    Entry &e = find_or_evict(peer);
    e.last_used = ++use_counter_;

    if (e.locked && !before(now_ms, e.locked_until_ms)) {
        /* Lockout served - start counting again, keep the escalation */
        e.locked = false;
        e.failures = 0;
    }

    if (e.failures < UINT8_MAX) {
        e.failures++;
    }
    if (e.failures < PAIRING_MAX_FAILURES) {
        return false;
    }

    /* Lockout: 60s, 120s, 240s ... capped */
    if (e.lockouts < 31U) {
        e.lockouts++;
    }
    uint64_t duration = static_cast<uint64_t>(PAIRING_LOCKOUT_MS) << (e.lockouts - 1U);
    if (duration > PAIRING_LOCKOUT_MAX_MS) {
        duration = PAIRING_LOCKOUT_MAX_MS;
    }

    e.locked = true;
    e.locked_until_ms = now_ms + static_cast<uint32_t>(duration);
    e.failures = 0;
    return true;
}

void Pairing_Guard::record_success(const PeerAddress &peer) {
    for (Entry &e : entries_) {
        if (e.in_use && peer_address_equal(e.peer, peer)) {
            e = Entry();
            return;
        }
    }
}

uint8_t Pairing_Guard::failures(const PeerAddress &peer) const {
    const Entry *e = find(peer);
    return (e != nullptr) ? e->failures : 0U;
}

uint8_t Pairing_Guard::tracked_peers() const {
    uint8_t n = 0;
    for (const Entry &e : entries_) {
        if (e.in_use) {
            n++;
        }
    }
    return n;
}
