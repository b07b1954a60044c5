/*
 * Connection & Pairing Manager - Connection state machine and key lifecycle
 *
 *   Disconnected -> Advertising -> Connecting -> Connected -> Bonded
 *                        ^                                      |
 *                        +---- Disconnected <- Disconnecting <--+  (any state)
 *
 * Runs in task context only, driven by Link Adapter events.
 */

#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

#include "types.h"
#include "logic/bond_record.hpp"
#include "logic/device_interfaces.hpp"
#include "logic/diag_log.hpp"
#include "logic/fault_monitor.hpp"
#include "logic/link_adapter.hpp"
#include "logic/pairing_guard.hpp"
#include "logic/telemetry.hpp"
#include <cstdint>

struct ConnectionStats {
    uint32_t connections = 0;
    uint32_t disconnections = 0;
    uint32_t pairings_ok = 0;
    uint32_t pairings_failed = 0;
    uint32_t pairings_declined = 0;   /* Malformed or locked out, no crypto work */
    uint32_t unexpected_events = 0;
    uint32_t resyncs = 0;             /* Forced disconnects after event loss */
    uint8_t last_disconnect_reason = 0;
};

class Connection_Manager {
public:
    Connection_Manager(Link_Adapter &link, Telemetry_Notifier &notifier,
                       Key_Store &key_store, Random_Source &random,
                       Diag_Log &diag, Fault_Monitor &faults);

    Connection_Manager(const Connection_Manager&) = delete;
    Connection_Manager& operator=(const Connection_Manager&) = delete;

    /*
     * Boot: load (or generate and store) key material, hand it to the
     * controller, start advertising. Returns false on a fatal fault.
     */
    bool start(uint64_t now_us);

    /* Drain and handle every queued link event. */
    void process_events(uint64_t now_us);

    /* Handle one event. */
    void handle_event(const LinkEvent &event, uint64_t now_us);

    /* Periodic housekeeping: retry advertising after a failed start. */
    void poll(uint64_t now_us);

    /* Local disconnect: Connecting/Connected/Bonded -> Disconnecting. */
    void request_disconnect();

    /* Suppress re-advertising after the next disconnect. */
    void set_stay_idle(bool idle);

    /*
     * Forget bonds, regenerate IR/ER, store, drop the connection and stop
     * advertising. The new keys take effect after the restart the caller
     * performs once restart_pending() and the link is down.
     * Returns false on a fatal fault.
     */
    bool repair(uint64_t now_us);

    bool restart_pending() const { return restart_pending_; }

    ConnectionState state() const { return state_; }
    uint16_t handle() const { return handle_; }
    const PeerAddress &peer() const { return peer_; }
    const BondKeyMaterial &keys() const { return keys_; }
    const Pairing_Guard &pairing_guard() const { return guard_; }
    ConnectionStats stats() const { return stats_; }

private:
    void on_connected(const LinkEvent &event, uint64_t now_us);
    void on_link_ready(const LinkEvent &event, uint64_t now_us);
    void on_disconnected(const LinkEvent &event, uint64_t now_us);
    void on_pairing_request(const LinkEvent &event, uint64_t now_us);
    void on_pairing_complete(const LinkEvent &event, uint64_t now_us);
    void on_encryption_changed(const LinkEvent &event, uint64_t now_us);
    void on_subscription_changed(const LinkEvent &event, uint64_t now_us);
    void on_identity_resolved(const LinkEvent &event, uint64_t now_us);

    bool generate_keys(uint64_t now_us);
    void store_keys(uint64_t now_us);
    bool refuse_if_locked(uint64_t now_us);
    void enter_bonded(uint64_t now_us, bool new_bond);
    bool is_stored_peer() const;
    void remember_peer(uint64_t now_us);
    void restore_subscription(uint64_t now_us);
    void begin_advertising(uint64_t now_us);
    void resync(uint64_t now_us);
    void unexpected(const LinkEvent &event, uint64_t now_us);
    bool is_live(uint16_t handle) const;

    static uint32_t to_ms(uint64_t now_us) { return static_cast<uint32_t>(now_us / 1000U); }

    Link_Adapter &link_;
    Telemetry_Notifier &notifier_;
    Key_Store &key_store_;
    Rng_Health_Test rng_;
    Diag_Log &diag_;
    Fault_Monitor &faults_;

    ConnectionState state_ = ConnectionState::Disconnected;
    uint16_t handle_ = INVALID_CONN_HANDLE;
    PeerAddress peer_;
    BondKeyMaterial keys_;
    Pairing_Guard guard_;
    bool stay_idle_ = false;
    bool new_bond_ = false;          /* Bonded by pairing on the current link */
    bool restart_pending_ = false;   /* Re-pair done, reboot to load new IR/ER */
    ConnectionStats stats_;
};

const char *connection_state_name(ConnectionState state);

#endif // CONNECTION_MANAGER_HPP
