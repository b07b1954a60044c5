/*
 * Pairing Guard - Per-peer pairing failure rate limiting
 *
 * PAIRING_MAX_FAILURES consecutive failures lock a peer out for
 * PAIRING_LOCKOUT_MS, doubling per repeated lockout up to PAIRING_LOCKOUT_MAX_MS.
 * PAIRING_GUARD_PEERS peers tracked, least-recently-used evicted.
 */

#ifndef PAIRING_GUARD_HPP
#define PAIRING_GUARD_HPP

#include "types.h"
#include "config.h"
#include <cstdint>

class Pairing_Guard {
public:
    /* True while the peer's lockout window is open. */
    bool is_locked(const PeerAddress &peer, uint32_t now_ms) const;

    /* Milliseconds until the peer may pair again, 0 if not locked. */
    uint32_t lockout_remaining_ms(const PeerAddress &peer, uint32_t now_ms) const;

    /* Returns true if this failure started a lockout. */
    bool record_failure(const PeerAddress &peer, uint32_t now_ms);

    /* Successful pairing forgets the peer entirely. */
    void record_success(const PeerAddress &peer);

    uint8_t failures(const PeerAddress &peer) const;
    uint8_t tracked_peers() const;

private:
    struct Entry {
        PeerAddress peer;
        bool in_use = false;
        bool locked = false;
        uint8_t failures = 0;
        uint8_t lockouts = 0;          /* Lockouts served, drives the doubling */
        uint32_t locked_until_ms = 0;
        uint32_t last_used = 0;        /* LRU stamp */
    };

    const Entry *find(const PeerAddress &peer) const;
    Entry &find_or_evict(const PeerAddress &peer);

    Entry entries_[PAIRING_GUARD_PEERS];
    uint32_t use_counter_ = 0;
};

bool peer_address_equal(const PeerAddress &a, const PeerAddress &b);

#endif // PAIRING_GUARD_HPP
