/*
 * Link_Controller - Command surface of the BLE host/controller stack
 * Implemented over BTstack in drivers/btstack_link; called from task context only
 */

#ifndef LINK_CONTROLLER_HPP
#define LINK_CONTROLLER_HPP

#include "types.h"
#include <cstdint>

class Link_Controller {
public:
    virtual ~Link_Controller() = default;

    virtual bool start_advertising() = 0;
    virtual void stop_advertising() = 0;

    /* Queue one orientation notification. Returns false if the controller had no buffer. */
    virtual bool notify(uint16_t handle, const uint8_t *data, uint16_t len) = 0;

    /* Ask for a buffer-available event. Returns false if the request was not accepted. */
    virtual bool request_send_credit(uint16_t handle) = 0;

    virtual void disconnect(uint16_t handle) = 0;

    virtual void confirm_pairing(uint16_t handle) = 0;
    virtual void decline_pairing(uint16_t handle) = 0;

    /* Connection interval, peripheral latency, supervision timeout from config.h */
    virtual void request_link_parameters(uint16_t handle) = 0;

    virtual void set_identity_keys(const BondKeyMaterial &keys) = 0;
    virtual void forget_bonds() = 0;

    virtual void set_battery_level(uint8_t percent) = 0;
};

#endif // LINK_CONTROLLER_HPP
