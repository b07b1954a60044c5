/*
 * Connection & Pairing Manager Implementation
 */

#include "logic/connection_manager.hpp"

Connection_Manager::Connection_Manager(Link_Adapter &link, Telemetry_Notifier &notifier,
                                       Key_Store &key_store, Random_Source &random,
                                       Diag_Log &diag, Fault_Monitor &faults)
    : link_(link), notifier_(notifier), key_store_(key_store), rng_(random),
      diag_(diag), faults_(faults) {}

/*============================================================================
 * Boot / Key Material
 *============================================================================*/

bool Connection_Manager::start(uint64_t now_us) {
    BondKeyMaterial loaded;
    if (key_store_.load(&loaded)) {
        keys_ = loaded;
        diag_.emit("KEYS_LOADED", DiagCode::Info, keys_.has_peer ? 1U : 0U, to_ms(now_us));
    } else {
        diag_.emit("KEYS_ABSENT", DiagCode::Warning, 0, to_ms(now_us));
        if (!generate_keys(now_us)) {
            return false;
        }
    }

    link_.set_identity_keys(keys_);
    begin_advertising(now_us);
    return true;
}

bool Connection_Manager::generate_keys(uint64_t now_us) {
    BondKeyMaterial fresh;
    if (!bond_keys_generate(rng_, &fresh)) {
        faults_.report(FaultKind::ResourceExhaustion, "RNG_FAIL",
                       rng_.rejected_blocks(), to_ms(now_us));
        return false;
    }

    keys_ = fresh;
    /* On failure the keys stay valid for this boot; a bonded host must re-pair after reset */
    store_keys(now_us);
    diag_.emit("KEYS_GENERATED", DiagCode::Info, 0, to_ms(now_us));
    return true;
}

void Connection_Manager::store_keys(uint64_t now_us) {
    if (!key_store_.store(keys_)) {
        faults_.report(FaultKind::TransientHardware, "KEY_STORE_FAIL", 0, to_ms(now_us));
    }
}

bool Connection_Manager::repair(uint64_t now_us) {
    link_.forget_bonds();
    if (!generate_keys(now_us)) {
        return false;
    }

    /* The controller derives IRK and DHK from IR/ER only at power-on */
    restart_pending_ = true;
    diag_.emit("RESTART_PENDING", DiagCode::Info, 0, to_ms(now_us));
    if (state_ == ConnectionState::Advertising) {
        link_.stop_advertising();
        state_ = ConnectionState::Disconnected;
    }
    request_disconnect();
    return true;
}

/*============================================================================
 * Commands
 *============================================================================*/

void Connection_Manager::begin_advertising(uint64_t now_us) {
    if (stay_idle_ || restart_pending_) {
        state_ = ConnectionState::Disconnected;
        return;
    }
    if (link_.start_advertising()) {
        state_ = ConnectionState::Advertising;
    } else {
        state_ = ConnectionState::Disconnected;
        faults_.report(FaultKind::Link, "ADV_FAIL", 0, to_ms(now_us));
    }
}

void Connection_Manager::poll(uint64_t now_us) {
    if (state_ == ConnectionState::Disconnected && !stay_idle_ && !faults_.fatal()) {
        begin_advertising(now_us);
    }
}

void Connection_Manager::request_disconnect() {
    switch (state_) {
        case ConnectionState::Connecting:
        case ConnectionState::Connected:
        case ConnectionState::Bonded:
            state_ = ConnectionState::Disconnecting;
            link_.disconnect(handle_);
            break;
        case ConnectionState::Advertising:
        case ConnectionState::Disconnecting:
        case ConnectionState::Disconnected:
            break;
    }
}

void Connection_Manager::set_stay_idle(bool idle) {
    stay_idle_ = idle;
    if (idle && state_ == ConnectionState::Advertising) {
        link_.stop_advertising();
        state_ = ConnectionState::Disconnected;
    }
}

/*============================================================================
 * Event Processing
 *============================================================================*/

bool Connection_Manager::is_live(uint16_t handle) const {
    return handle_ != INVALID_CONN_HANDLE && handle == handle_;
}

void Connection_Manager::process_events(uint64_t now_us) {
    LinkEvent event;
    while (link_.pop(&event)) {
        handle_event(event, now_us);
    }

    /* Dropped events were newer than everything just drained */
    if (link_.take_overflow()) {
        resync(now_us);
    }
}

void Connection_Manager::resync(uint64_t now_us) {
    if (stats_.resyncs < UINT32_MAX) {
        stats_.resyncs++;
    }
    faults_.report(FaultKind::Link, "LINK_OVERFLOW", link_.dropped_events(), to_ms(now_us));

    if (handle_ != INVALID_CONN_HANDLE) {
        state_ = ConnectionState::Disconnecting;
        link_.disconnect(handle_);
    } else if (state_ == ConnectionState::Advertising || state_ == ConnectionState::Disconnected) {
        begin_advertising(now_us);
    }
}

void Connection_Manager::unexpected(const LinkEvent &event, uint64_t now_us) {
    if (stats_.unexpected_events < UINT32_MAX) {
        stats_.unexpected_events++;
    }
    diag_.emit("LINK_UNEXPECTED", DiagCode::Warning,
               (static_cast<uint32_t>(event.type) << 16U) | event.handle, to_ms(now_us));
}

void Connection_Manager::handle_event(const LinkEvent &event, uint64_t now_us) {
    switch (event.type) {
        case LinkEventType::Connected:
            on_connected(event, now_us);
            return;
        case LinkEventType::LinkReady:
            on_link_ready(event, now_us);
            return;
        case LinkEventType::Disconnected:
            on_disconnected(event, now_us);
            return;
        case LinkEventType::PairingRequest:
            on_pairing_request(event, now_us);
            return;
        case LinkEventType::PairingComplete:
            on_pairing_complete(event, now_us);
            return;
        case LinkEventType::EncryptionChanged:
            on_encryption_changed(event, now_us);
            return;
        case LinkEventType::BufferAvailable:
            /* Stale handles are ignored by the notifier */
            notifier_.grant_credits(event.handle, event.count, now_us);
            return;
        case LinkEventType::SubscriptionChanged:
            on_subscription_changed(event, now_us);
            return;
        case LinkEventType::IdentityResolved:
            on_identity_resolved(event, now_us);
            return;
    }

    faults_.report(FaultKind::LogicInvariant, "LINK_EVENT_TYPE",
                   static_cast<uint32_t>(event.type), to_ms(now_us));
}

void Connection_Manager::on_connected(const LinkEvent &event, uint64_t now_us) {
    if (state_ != ConnectionState::Advertising) {
        /* Single connection only - refuse the stray link */
        unexpected(event, now_us);
        if (!is_live(event.handle)) {
            link_.disconnect(event.handle);
        }
        return;
    }

    handle_ = event.handle;
    peer_ = event.peer;
    state_ = ConnectionState::Connecting;
    if (stats_.connections < UINT32_MAX) {
        stats_.connections++;
    }

    notifier_.set_connection(handle_);
    diag_.emit("CONNECTED", DiagCode::Info, handle_, to_ms(now_us));

    /* Locked-out peers are dropped before the security manager runs */
    if (refuse_if_locked(now_us)) {
        return;
    }
    link_.request_link_parameters(handle_);
}

bool Connection_Manager::refuse_if_locked(uint64_t now_us) {
    uint32_t now_ms = to_ms(now_us);
    if (!guard_.is_locked(peer_, now_ms)) {
        return false;
    }
    if (stats_.pairings_declined < UINT32_MAX) {
        stats_.pairings_declined++;
    }
    faults_.report(FaultKind::Security, "PAIR_LOCKED", guard_.lockout_remaining_ms(peer_, now_ms), now_ms);
    request_disconnect();
    return true;
}

void Connection_Manager::on_link_ready(const LinkEvent &event, uint64_t now_us) {
    if (state_ != ConnectionState::Connecting || !is_live(event.handle)) {
        unexpected(event, now_us);
        return;
    }
    state_ = ConnectionState::Connected;
}

void Connection_Manager::on_disconnected(const LinkEvent &event, uint64_t now_us) {
    /* Refused links and repeated reports for a link already torn down */
    if (!is_live(event.handle)) {
        unexpected(event, now_us);
        return;
    }

    state_ = ConnectionState::Disconnecting;
    notifier_.on_link_down();

    handle_ = INVALID_CONN_HANDLE;
    peer_ = PeerAddress();
    new_bond_ = false;
    stats_.last_disconnect_reason = event.status;
    if (stats_.disconnections < UINT32_MAX) {
        stats_.disconnections++;
    }
    state_ = ConnectionState::Disconnected;
    diag_.emit("DISCONNECTED", DiagCode::Info, event.status, to_ms(now_us));

    begin_advertising(now_us);
}

void Connection_Manager::on_pairing_request(const LinkEvent &event, uint64_t now_us) {
    if (!is_live(event.handle) || state_ != ConnectionState::Connected) {
        link_.decline_pairing(event.handle);
        if (stats_.pairings_declined < UINT32_MAX) {
            stats_.pairings_declined++;
        }
        faults_.report(FaultKind::Security, "PAIR_MALFORMED", event.handle, to_ms(now_us));
        return;
    }

    if (guard_.is_locked(peer_, to_ms(now_us))) {
        link_.decline_pairing(event.handle);
        if (stats_.pairings_declined < UINT32_MAX) {
            stats_.pairings_declined++;
        }
        faults_.report(FaultKind::Security, "PAIR_LOCKED",
                       guard_.lockout_remaining_ms(peer_, to_ms(now_us)), to_ms(now_us));
        return;
    }

    link_.confirm_pairing(event.handle);
}

void Connection_Manager::on_pairing_complete(const LinkEvent &event, uint64_t now_us) {
    if (!is_live(event.handle) || state_ != ConnectionState::Connected) {
        unexpected(event, now_us);
        return;
    }

    if (event.flag) {
        guard_.record_success(peer_);
        if (stats_.pairings_ok < UINT32_MAX) {
            stats_.pairings_ok++;
        }
        enter_bonded(now_us, true);
        return;
    }

    if (stats_.pairings_failed < UINT32_MAX) {
        stats_.pairings_failed++;
    }
    faults_.report(FaultKind::Security, "PAIR_FAILED", event.status, to_ms(now_us));

    if (guard_.record_failure(peer_, to_ms(now_us))) {
        diag_.emit("PAIR_LOCKOUT", DiagCode::Warning,
                   guard_.lockout_remaining_ms(peer_, to_ms(now_us)), to_ms(now_us));
        request_disconnect();
    }
}

void Connection_Manager::on_encryption_changed(const LinkEvent &event, uint64_t now_us) {
    if (!is_live(event.handle)) {
        unexpected(event, now_us);
        return;
    }

    if (!event.flag) {
        /* Re-encryption refused: host lost its bond, it may pair again */
        faults_.report(FaultKind::Security, "ENCRYPTION_FAIL", event.status, to_ms(now_us));
        return;
    }

    if (state_ == ConnectionState::Connected && event.bonded) {
        enter_bonded(now_us, false);
    }
}

void Connection_Manager::on_subscription_changed(const LinkEvent &event, uint64_t now_us) {
    if (!is_live(event.handle)) {
        return;
    }
    notifier_.set_subscribed(event.flag, now_us);

    /* CCCD value persists across connections for the bonded peer */
    if (state_ == ConnectionState::Bonded && is_stored_peer() &&
        keys_.peer_subscribed != event.flag) {
        keys_.peer_subscribed = event.flag;
        store_keys(now_us);
    }
}

void Connection_Manager::on_identity_resolved(const LinkEvent &event, uint64_t now_us) {
    if (!is_live(event.handle)) {
        unexpected(event, now_us);
        return;
    }
    peer_ = event.peer;

    switch (state_) {
        case ConnectionState::Connecting:
        case ConnectionState::Connected:
            refuse_if_locked(now_us);
            break;
        case ConnectionState::Bonded:
            if (new_bond_) {
                remember_peer(now_us);
            } else {
                restore_subscription(now_us);
            }
            break;
        case ConnectionState::Advertising:
        case ConnectionState::Disconnecting:
        case ConnectionState::Disconnected:
            break;
    }
}

/*
 * new_bond: keys were just exchanged on this link. Re-encryption with an
 * existing bond never writes flash.
 */
void Connection_Manager::enter_bonded(uint64_t now_us, bool new_bond) {
    state_ = ConnectionState::Bonded;
    new_bond_ = new_bond;

    if (new_bond) {
        remember_peer(now_us);
    } else {
        restore_subscription(now_us);
    }

    diag_.emit("BONDED", DiagCode::Info, handle_, to_ms(now_us));
    notifier_.set_bonded(true, now_us);
}

bool Connection_Manager::is_stored_peer() const {
    return keys_.has_peer && peer_address_equal(keys_.peer, peer_);
}

void Connection_Manager::remember_peer(uint64_t now_us) {
    bool subscribed = notifier_.subscribed();
    if (is_stored_peer() && keys_.peer_subscribed == subscribed) {
        return;
    }
    keys_.peer = peer_;
    keys_.has_peer = true;
    keys_.peer_subscribed = subscribed;
    store_keys(now_us);
}

void Connection_Manager::restore_subscription(uint64_t now_us) {
    if (!is_stored_peer() || !keys_.peer_subscribed || notifier_.subscribed()) {
        return;
    }
    notifier_.set_subscribed(true, now_us);
    diag_.emit("SUBSCRIPTION_RESTORED", DiagCode::Info, handle_, to_ms(now_us));
}

const char *connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Advertising:   return "ADV";
        case ConnectionState::Connecting:    return "CONNECTING";
        case ConnectionState::Connected:     return "CONNECTED";
        case ConnectionState::Bonded:        return "BONDED";
        case ConnectionState::Disconnecting: return "DISCONNECTING";
        case ConnectionState::Disconnected:  return "DISCONNECTED";
    }
    return "?";
}
