/*
 * BTstack configuration - LE peripheral only, one central, bonded with Secure Connections
 */

#ifndef LOOKPOINT_BTSTACK_CONFIG_H
#define LOOKPOINT_BTSTACK_CONFIG_H

#ifndef ENABLE_BLE
#error Bluetooth LE must be enabled for the tracker firmware
#endif

/* Port */
#define HAVE_EMBEDDED_TIME_MS
#define HAVE_ASSERT
#define HCI_OUTGOING_PRE_BUFFER_SIZE 4
#define HCI_ACL_CHUNK_SIZE_ALIGNMENT 4

/* Features */
#define ENABLE_LE_PERIPHERAL
#define ENABLE_LE_SECURE_CONNECTIONS
#define ENABLE_MICRO_ECC_FOR_LE_SECURE_CONNECTIONS
#define ENABLE_LE_DATA_LENGTH_EXTENSION
#define ENABLE_PRINTF_HEXDUMP
#define ENABLE_LOG_ERROR
#define ENABLE_SOFTWARE_AES128

/* Memory: one connection, a few bonds */
#define HCI_ACL_PAYLOAD_SIZE (255 + 4)
#define MAX_NR_HCI_CONNECTIONS 1
#define MAX_NR_SM_LOOKUP_ENTRIES 3
#define MAX_NR_WHITELIST_ENTRIES 4
#define MAX_NR_LE_DEVICE_DB_ENTRIES 4
#define MAX_NR_GATT_CLIENTS 0
#define MAX_ATT_DB_SIZE 512

/* Flash TLV: bonds and LTKs */
#define NVM_NUM_DEVICE_DB_ENTRIES 4

/* CYW43439 controller */
#define MAX_NR_CONTROLLER_ACL_BUFFERS 3
#define MAX_NR_CONTROLLER_SCO_PACKETS 3
#define ENABLE_HCI_CONTROLLER_TO_HOST_FLOW_CONTROL
#define HCI_HOST_ACL_PACKET_LEN (255 + 4)
#define HCI_HOST_ACL_PACKET_NUM 3
#define HCI_HOST_SCO_PACKET_LEN 120
#define HCI_HOST_SCO_PACKET_NUM 3

#endif /* LOOKPOINT_BTSTACK_CONFIG_H */
