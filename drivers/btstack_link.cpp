/*
 * Btstack_Link Implementation
 */

#include "drivers/btstack_link.hpp"
#include "logic/device_name.hpp"
#include "config.h"

#include "pico/cyw43_arch.h"
#include "pico/async_context.h"

/* Generated from drivers/lookpoint.gatt */
#include "lookpoint.h"

#include <cstdio>
#include <cstring>

#define ORIENTATION_VALUE_HANDLE \
    ATT_CHARACTERISTIC_A1C7F3E1_5B2D_4E8A_9F61_3C0D2B7E4A10_01_VALUE_HANDLE
#define ORIENTATION_CCCD_HANDLE \
    ATT_CHARACTERISTIC_A1C7F3E1_5B2D_4E8A_9F61_3C0D2B7E4A10_01_CLIENT_CONFIGURATION_HANDLE

Btstack_Link *Btstack_Link::instance_ = nullptr;

/* BTstack is not reentrant: task-context calls hold the async context lock */
class Stack_Lock {
public:
    Stack_Lock() { async_context_acquire_lock_blocking(cyw43_arch_async_context()); }
    ~Stack_Lock() { async_context_release_lock(cyw43_arch_async_context()); }

    Stack_Lock(const Stack_Lock&) = delete;
    Stack_Lock& operator=(const Stack_Lock&) = delete;
};

/*============================================================================
 * Setup
 *============================================================================*/

bool Btstack_Link::init(Link_Adapter &adapter, const char *device_name,
                        const char *serial_number) {
    instance_ = this;
    adapter_ = &adapter;

    if (device_name_fit(device_name, DEVICE_NAME_MAX_LEN, name_, sizeof(name_))) {
        printf("[BLE] Warning: device name truncated to \"%s\" (%u byte limit)\n",
               name_, DEVICE_NAME_MAX_LEN);
    }
    if (!adv_build_advertising(name_, &adv_data_)) {
        printf("[BLE] Device name does not fit advertising payload\n");
        return false;
    }
    adv_build_scan_response(HEAD_TRACKING_SERVICE_UUID128, &scan_response_);

    l2cap_init();
    sm_init();
    sm_set_io_capabilities(IO_CAPABILITY_NO_INPUT_NO_OUTPUT);
    sm_set_authentication_requirements(SM_AUTHREQ_SECURE_CONNECTION | SM_AUTHREQ_BONDING);

    att_server_init(profile_data, att_read_callback, att_write_callback);

    device_information_service_server_init();
    device_information_service_server_set_manufacturer_name(DEVICE_MANUFACTURER);
    device_information_service_server_set_model_number(DEVICE_MODEL);
    device_information_service_server_set_serial_number(serial_number);
    device_information_service_server_set_hardware_revision(DEVICE_HW_REVISION);
    device_information_service_server_set_firmware_revision(DEVICE_FW_REVISION);

    battery_service_server_init(100);

    hci_callback_.callback = &packet_handler;
    hci_add_event_handler(&hci_callback_);
    sm_callback_.callback = &packet_handler;
    sm_add_event_handler(&sm_callback_);
    att_server_register_packet_handler(packet_handler);

    printf("[BLE] GATT ready, name \"%s\", serial %s\n", name_, serial_number);
    return true;
}

void Btstack_Link::power_on() {
    hci_power_control(HCI_POWER_ON);
}

/*============================================================================
 * Interrupt Context (CYW43 async context)
 *============================================================================*/

void Btstack_Link::packet_handler(uint8_t packet_type, uint16_t channel,
                                  uint8_t *packet, uint16_t size) {
    UNUSED(channel);
    UNUSED(size);
    if (packet_type != HCI_EVENT_PACKET || instance_ == nullptr) {
        return;
    }
    instance_->handle_hci_event(packet);
}

void Btstack_Link::handle_hci_event(uint8_t *packet) {
    switch (hci_event_packet_get_type(packet)) {
        case BTSTACK_EVENT_STATE:
            if (btstack_event_state_get_state(packet) == HCI_STATE_WORKING) {
                bd_addr_t local_addr;
                gap_local_bd_addr(local_addr);
                printf("[BLE] Stack up, address %s\n", bd_addr_to_str(local_addr));
            }
            break;

        case HCI_EVENT_LE_META: {
            if (hci_event_le_meta_get_subevent_code(packet) != HCI_SUBEVENT_LE_CONNECTION_COMPLETE) {
                break;
            }
            if (hci_subevent_le_connection_complete_get_status(packet) != ERROR_CODE_SUCCESS) {
                break;
            }
            hci_con_handle_t handle = hci_subevent_le_connection_complete_get_connection_handle(packet);
            PeerAddress peer;
            bd_addr_t addr;
            peer.type = hci_subevent_le_connection_complete_get_peer_address_type(packet);
            hci_subevent_le_connection_complete_get_peer_address(packet, addr);
            memcpy(peer.addr, addr, PEER_ADDRESS_SIZE);
            con_handle_ = handle;
            adapter_->on_connected(handle, peer);
            break;
        }

        case ATT_EVENT_CONNECTED:
            adapter_->on_link_ready(att_event_connected_get_handle(packet));
            break;

        case HCI_EVENT_DISCONNECTION_COMPLETE: {
            hci_con_handle_t handle = hci_event_disconnection_complete_get_connection_handle(packet);
            if (handle == con_handle_) {
                con_handle_ = HCI_CON_HANDLE_INVALID;
            }
            adapter_->on_disconnected(handle, hci_event_disconnection_complete_get_reason(packet));
            break;
        }

        case SM_EVENT_JUST_WORKS_REQUEST:
            adapter_->on_pairing_request(sm_event_just_works_request_get_handle(packet));
            break;

        case SM_EVENT_PAIRING_COMPLETE: {
            uint8_t status = sm_event_pairing_complete_get_status(packet);
            adapter_->on_pairing_complete(sm_event_pairing_complete_get_handle(packet),
                                          status == ERROR_CODE_SUCCESS, status);
            break;
        }

        case SM_EVENT_IDENTITY_RESOLVING_SUCCEEDED: {
            /* Known host on a resolvable private address */
            PeerAddress identity;
            bd_addr_t addr;
            identity.type = sm_event_identity_resolving_succeeded_get_identity_addr_type(packet);
            sm_event_identity_resolving_succeeded_get_identity_address(packet, addr);
            memcpy(identity.addr, addr, PEER_ADDRESS_SIZE);
            adapter_->on_identity_resolved(
                sm_event_identity_resolving_succeeded_get_handle(packet), identity);
            break;
        }

        case SM_EVENT_IDENTITY_CREATED: {
            /* Identity distributed during a fresh pairing */
            PeerAddress identity;
            bd_addr_t addr;
            identity.type = sm_event_identity_created_get_identity_addr_type(packet);
            sm_event_identity_created_get_identity_address(packet, addr);
            memcpy(identity.addr, addr, PEER_ADDRESS_SIZE);
            adapter_->on_identity_resolved(sm_event_identity_created_get_handle(packet), identity);
            break;
        }

        case SM_EVENT_REENCRYPTION_COMPLETE: {
            /* Re-encryption uses stored LTK: success implies an existing bond */
            uint8_t status = sm_event_reencryption_complete_get_status(packet);
            adapter_->on_encryption_changed(sm_event_reencryption_complete_get_handle(packet),
                                            status == ERROR_CODE_SUCCESS, true);
            break;
        }

        case ATT_EVENT_CAN_SEND_NOW:
            /* One event per request = one buffer */
            if (con_handle_ != HCI_CON_HANDLE_INVALID) {
                adapter_->on_buffer_available(con_handle_, 1);
            }
            break;

        default:
            break;
    }
}

uint16_t Btstack_Link::att_read_callback(hci_con_handle_t con_handle, uint16_t att_handle,
                                         uint16_t offset, uint8_t *buffer,
                                         uint16_t buffer_size) {
    UNUSED(con_handle);
    if (att_handle == ATT_CHARACTERISTIC_GAP_DEVICE_NAME_01_VALUE_HANDLE && instance_ != nullptr) {
        return att_read_callback_handle_blob(reinterpret_cast<const uint8_t *>(instance_->name_),
                                             static_cast<uint16_t>(strlen(instance_->name_)),
                                             offset, buffer, buffer_size);
    }
    return 0;
}

int Btstack_Link::att_write_callback(hci_con_handle_t con_handle, uint16_t att_handle,
                                     uint16_t transaction_mode, uint16_t offset,
                                     uint8_t *buffer, uint16_t buffer_size) {
    UNUSED(transaction_mode);
    UNUSED(offset);
    if (att_handle != ORIENTATION_CCCD_HANDLE || instance_ == nullptr || buffer_size < 2U) {
        return 0;
    }

    uint16_t cccd = little_endian_read_16(buffer, 0);
    bool subscribed = (cccd & GATT_CLIENT_CHARACTERISTICS_CONFIGURATION_NOTIFICATION) != 0U;
    instance_->adapter_->on_subscription_changed(con_handle, subscribed);
    return 0;
}

/*============================================================================
 * Task Context Commands
 *============================================================================*/

bool Btstack_Link::start_advertising() {
    Stack_Lock lock;
    bd_addr_t null_addr = {0};
    gap_advertisements_set_params(LINK_ADV_INTERVAL_MIN, LINK_ADV_INTERVAL_MAX,
                                  0 /* ADV_IND */, 0, null_addr, 0x07, 0x00);
    gap_advertisements_set_data(adv_data_.len, adv_data_.data);
    gap_scan_response_set_data(scan_response_.len, scan_response_.data);
    gap_advertisements_enable(1);
    return true;
}

void Btstack_Link::stop_advertising() {
    Stack_Lock lock;
    gap_advertisements_enable(0);
}

bool Btstack_Link::notify(uint16_t handle, const uint8_t *data, uint16_t len) {
    Stack_Lock lock;
    return att_server_notify(handle, ORIENTATION_VALUE_HANDLE, data, len) == ERROR_CODE_SUCCESS;
}

bool Btstack_Link::request_send_credit(uint16_t handle) {
    Stack_Lock lock;
    att_server_request_can_send_now_event(handle);
    return true;
}

void Btstack_Link::disconnect(uint16_t handle) {
    Stack_Lock lock;
    uint8_t status = gap_disconnect(handle);
    if (status != ERROR_CODE_SUCCESS) {
        printf("[BLE] Disconnect 0x%04X failed (0x%02X)\n", handle, status);
    }
}

void Btstack_Link::confirm_pairing(uint16_t handle) {
    Stack_Lock lock;
    sm_just_works_confirm(handle);
}

void Btstack_Link::decline_pairing(uint16_t handle) {
    Stack_Lock lock;
    sm_bonding_decline(handle);
}

void Btstack_Link::request_link_parameters(uint16_t handle) {
    Stack_Lock lock;
    int rc = gap_request_connection_parameter_update(handle,
                                                     LINK_CONN_INTERVAL_MIN, LINK_CONN_INTERVAL_MAX,
                                                     LINK_PERIPHERAL_LATENCY, LINK_SUPERVISION_TIMEOUT);
    if (rc != 0) {
        printf("[BLE] Connection parameter request failed (%d)\n", rc);
    }
}

void Btstack_Link::set_identity_keys(const BondKeyMaterial &keys) {
    Stack_Lock lock;
    sm_key_t ir;
    sm_key_t er;
    memcpy(ir, keys.identity_root, KEY_SIZE);
    memcpy(er, keys.encryption_root, KEY_SIZE);
    sm_set_ir(ir);
    sm_set_er(er);
}

void Btstack_Link::forget_bonds() {
    Stack_Lock lock;
    for (int i = 0; i < le_device_db_max_count(); i++) {
        int addr_type = BD_ADDR_TYPE_UNKNOWN;
        bd_addr_t addr;
        sm_key_t irk;
        le_device_db_info(i, &addr_type, addr, irk);
        if (addr_type != BD_ADDR_TYPE_UNKNOWN) {
            gap_delete_bonding(static_cast<bd_addr_type_t>(addr_type), addr);
        }
    }
    printf("[BLE] Bonds cleared\n");
}

void Btstack_Link::set_battery_level(uint8_t percent) {
    Stack_Lock lock;
    battery_service_server_set_battery_value(percent);
}
