/*
 * Btstack_Link - Link_Controller over BTstack (CYW43439, threadsafe background)
 *
 * BTstack callbacks run from the CYW43 async context IRQ and only forward to
 * the Link_Adapter ISR entry points. Commands from task context take the
 * async context lock.
 */

#ifndef BTSTACK_LINK_HPP
#define BTSTACK_LINK_HPP

#include "logic/adv_data.hpp"
#include "logic/link_adapter.hpp"
#include "logic/link_controller.hpp"

#include "btstack.h"

#include <cstdint>

class Btstack_Link final : public Link_Controller {
public:
    Btstack_Link() = default;

    /* Disable copy/move */
    Btstack_Link(const Btstack_Link&) = delete;
    Btstack_Link& operator=(const Btstack_Link&) = delete;

    /*
     * Register HCI/SM/ATT handlers and GATT services, build GAP payloads.
     * Does not power the radio. Returns false if the device name cannot be advertised.
     */
    bool init(Link_Adapter &adapter, const char *device_name, const char *serial_number);

    /* Power on the controller once identity keys and advertising are configured. */
    void power_on();

    bool start_advertising() override;
    void stop_advertising() override;
    bool notify(uint16_t handle, const uint8_t *data, uint16_t len) override;
    bool request_send_credit(uint16_t handle) override;
    void disconnect(uint16_t handle) override;
    void confirm_pairing(uint16_t handle) override;
    void decline_pairing(uint16_t handle) override;
    void request_link_parameters(uint16_t handle) override;
    void set_identity_keys(const BondKeyMaterial &keys) override;
    void forget_bonds() override;
    void set_battery_level(uint8_t percent) override;

private:
    static void packet_handler(uint8_t packet_type, uint16_t channel,
                               uint8_t *packet, uint16_t size);
    static uint16_t att_read_callback(hci_con_handle_t con_handle, uint16_t att_handle,
                                      uint16_t offset, uint8_t *buffer, uint16_t buffer_size);
    static int att_write_callback(hci_con_handle_t con_handle, uint16_t att_handle,
                                  uint16_t transaction_mode, uint16_t offset,
                                  uint8_t *buffer, uint16_t buffer_size);

    void handle_hci_event(uint8_t *packet);

    static Btstack_Link *instance_;

    Link_Adapter *adapter_ = nullptr;
    btstack_packet_callback_registration_t hci_callback_ = {};
    btstack_packet_callback_registration_t sm_callback_ = {};

    char name_[DEVICE_NAME_MAX_LEN + 1U] = {};
    AdvPayload adv_data_ = {};
    AdvPayload scan_response_ = {};

    volatile hci_con_handle_t con_handle_ = HCI_CON_HANDLE_INVALID;
};

#endif // BTSTACK_LINK_HPP
