/*
 * Unit tests for per-peer pairing rate limiting
 */

#include <gtest/gtest.h>
#include "logic/pairing_guard.hpp"
#include "test/fakes.hpp"

static void fail_n(Pairing_Guard &guard, const PeerAddress &peer, uint32_t n, uint32_t now_ms) {
    for (uint32_t i = 0; i < n; i++) {
        guard.record_failure(peer, now_ms);
    }
}

// ============================================================================
// Test Suite: PairingGuard_Lockout
// ============================================================================

TEST(PairingGuard_Lockout, UnknownPeerNotLocked) {
    Pairing_Guard guard;
    EXPECT_FALSE(guard.is_locked(make_peer(1), 0));
    EXPECT_EQ(guard.failures(make_peer(1)), 0U);
    EXPECT_EQ(guard.lockout_remaining_ms(make_peer(1), 0), 0U);
}

TEST(PairingGuard_Lockout, LocksOnMaxFailures) {
    Pairing_Guard guard;
    PeerAddress peer = make_peer(1);

    for (uint32_t i = 1; i < PAIRING_MAX_FAILURES; i++) {
        EXPECT_FALSE(guard.record_failure(peer, 1000));
        EXPECT_EQ(guard.failures(peer), i);
    }
    EXPECT_TRUE(guard.record_failure(peer, 1000));
    EXPECT_TRUE(guard.is_locked(peer, 1000));
    EXPECT_EQ(guard.lockout_remaining_ms(peer, 1000), PAIRING_LOCKOUT_MS);
    EXPECT_EQ(guard.lockout_remaining_ms(peer, 31000), PAIRING_LOCKOUT_MS - 30000U);
}

TEST(PairingGuard_Lockout, ExpiresAfterWindow) {
    Pairing_Guard guard;
    PeerAddress peer = make_peer(1);
    fail_n(guard, peer, PAIRING_MAX_FAILURES, 0);

    EXPECT_TRUE(guard.is_locked(peer, PAIRING_LOCKOUT_MS - 1U));
    EXPECT_FALSE(guard.is_locked(peer, PAIRING_LOCKOUT_MS));
}

TEST(PairingGuard_Lockout, RepeatedLockoutsDouble) {
    Pairing_Guard guard;
    PeerAddress peer = make_peer(1);
    uint32_t now = 0;

    fail_n(guard, peer, PAIRING_MAX_FAILURES, now);
    EXPECT_EQ(guard.lockout_remaining_ms(peer, now), PAIRING_LOCKOUT_MS);

    now += PAIRING_LOCKOUT_MS;
    fail_n(guard, peer, PAIRING_MAX_FAILURES, now);
    EXPECT_EQ(guard.lockout_remaining_ms(peer, now), 2U * PAIRING_LOCKOUT_MS);

    now += 2U * PAIRING_LOCKOUT_MS;
    fail_n(guard, peer, PAIRING_MAX_FAILURES, now);
    EXPECT_EQ(guard.lockout_remaining_ms(peer, now), 4U * PAIRING_LOCKOUT_MS);
}

TEST(PairingGuard_Lockout, DoublingIsCapped) {
    Pairing_Guard guard;
    PeerAddress peer = make_peer(1);
    uint32_t now = 0;

    for (int round = 0; round < 10; round++) {
        fail_n(guard, peer, PAIRING_MAX_FAILURES, now);
        now += guard.lockout_remaining_ms(peer, now);
    }
    fail_n(guard, peer, PAIRING_MAX_FAILURES, now);
    EXPECT_EQ(guard.lockout_remaining_ms(peer, now), PAIRING_LOCKOUT_MAX_MS);
}

TEST(PairingGuard_Lockout, SuccessForgetsPeer) {
    Pairing_Guard guard;
    PeerAddress peer = make_peer(1);
    fail_n(guard, peer, PAIRING_MAX_FAILURES - 1U, 0);
    ASSERT_EQ(guard.tracked_peers(), 1U);

    guard.record_success(peer);

    EXPECT_EQ(guard.failures(peer), 0U);
    EXPECT_EQ(guard.tracked_peers(), 0U);
}

TEST(PairingGuard_Lockout, WrapSafeClock) {
    Pairing_Guard guard;
    PeerAddress peer = make_peer(1);
    uint32_t now = UINT32_MAX - 1000U;
    fail_n(guard, peer, PAIRING_MAX_FAILURES, now);

    EXPECT_TRUE(guard.is_locked(peer, now + 30000U));
    EXPECT_FALSE(guard.is_locked(peer, now + PAIRING_LOCKOUT_MS));
}

// ============================================================================
// Test Suite: PairingGuard_Peers
// ============================================================================

TEST(PairingGuard_Peers, AddressTypeDistinguishesPeers) {
    Pairing_Guard guard;
    PeerAddress public_addr = make_peer(1, 0);
    PeerAddress random_addr = make_peer(1, 1);

    fail_n(guard, public_addr, PAIRING_MAX_FAILURES, 0);
    EXPECT_TRUE(guard.is_locked(public_addr, 0));
    EXPECT_FALSE(guard.is_locked(random_addr, 0));
}

TEST(PairingGuard_Peers, LeastRecentlyUsedEvicted) {
    Pairing_Guard guard;
    for (uint8_t i = 0; i < PAIRING_GUARD_PEERS; i++) {
        guard.record_failure(make_peer(i), 0);
    }
    /* Touch peer 0 so peer 1 becomes the oldest */
    guard.record_failure(make_peer(0), 0);

    guard.record_failure(make_peer(0x80), 0);

    EXPECT_EQ(guard.tracked_peers(), PAIRING_GUARD_PEERS);
    EXPECT_EQ(guard.failures(make_peer(0)), 2U);
    EXPECT_EQ(guard.failures(make_peer(1)), 0U);
    EXPECT_EQ(guard.failures(make_peer(0x80)), 1U);
}
