/*
 * Hardware Configuration for Lookpoint Tracker Firmware (RP2350 / Pico 2 W)
 * Head-tracking peripheral - single core cooperative runtime
 */

#ifndef LOOKPOINT_CONFIG_H
#define LOOKPOINT_CONFIG_H

/*============================================================================
 * I2C1 - BNO08x IMU
 *============================================================================*/
#define IMU_SDA_PIN             2U
#define IMU_SCL_PIN             3U
#define IMU_RST_PIN             5U       /* Active low, hardware reset recovery */
#define IMU_INT_PIN             4U       /* HINTN: sensor asserts LOW when ready */
#define IMU_I2C_FREQ_HZ         400000U  /* 400kHz Fast Mode */

/*============================================================================
 * System Timing
 *============================================================================*/
#define SYS_CLOCK_KHZ           150000U
#define SAMPLE_PERIOD_MS        10U      /* 100Hz sensor sampling */
#define BATTERY_TASK_PERIOD_MS  1000U    /* Battery characteristic refresh */
#define CONNECTION_TASK_PERIOD_MS 100U   /* Advertising retry / housekeeping */
#define REPAIR_RESTART_TIMEOUT_MS 1000U  /* Re-pair: restart even if the disconnect never completes */
#define HEARTBEAT_INTERVAL_MS   5000U    /* Status line on stdio */
#define WATCHDOG_TIMEOUT_MS     500U     /* Main loop stall = reboot */
#define IDLE_SLEEP_MAX_US       2000U    /* Upper bound on idle wait between scheduler passes */

/*============================================================================
 * Sensor Sampler - Fault Tiers
 *============================================================================*/
#define SAMPLER_HOLD_CYCLES         10U  /* Hold last good sample for N failed reads (100ms) */
#define SAMPLER_MAX_BACKOFF_TICKS   32U  /* Retry interval cap once faulted (320ms) */
#define SAMPLER_RESET_RETRIES       8U   /* Failed faulted retries between sensor resets */

/*============================================================================
 * Orientation Fusion (Mahony complementary filter)
 *============================================================================*/
#define FUSION_KP                   1.0f    /* Proportional gain on gravity error */
#define FUSION_KI                   0.02f   /* Integral gain (gyro bias estimate) */
#define FUSION_GRAVITY_MS2          9.80665f
#define FUSION_ACCEL_GATE_LOW       0.85f   /* |a| in g below which correction is skipped */
#define FUSION_ACCEL_GATE_HIGH      1.15f   /* |a| in g above which correction is skipped */
#define FUSION_MAX_DT_S             0.05f   /* Clamp integration step (5 sample periods) */
#define FUSION_DRIFT_RESIDUAL_RAD   0.35f   /* ~20 deg gravity disagreement */
#define FUSION_DRIFT_WINDOW         50U     /* Consecutive gated updates before reset (0.5s) */
#define FUSION_INTEGRAL_LIMIT       0.1f    /* rad/s clamp on bias estimate */

/*============================================================================
 * Telemetry
 *============================================================================*/
#define TELEMETRY_PERIOD_MS         20U     /* Sample older than this is stale */
#define TELEMETRY_PACKET_SIZE       16U     /* Fixed binary record */
#define TELEMETRY_Q14_ONE           16384   /* Fixed-point 1.0 for quaternion components */

/*============================================================================
 * Link Controller Adapter
 *============================================================================*/
#define LINK_EVENT_QUEUE_DEPTH      8U      /* ISR -> task event ring */
#define LINK_ADV_INTERVAL_MIN       0x0030U /* 30ms in 0.625ms units */
#define LINK_ADV_INTERVAL_MAX       0x0060U /* 60ms */
#define LINK_CONN_INTERVAL_MIN      6U      /* 7.5ms in 1.25ms units */
#define LINK_CONN_INTERVAL_MAX      12U     /* 15ms */
#define LINK_PERIPHERAL_LATENCY     0U
#define LINK_SUPERVISION_TIMEOUT    200U    /* 2s in 10ms units */

/*============================================================================
 * Connection & Pairing
 *============================================================================*/
#define PAIRING_MAX_FAILURES        5U      /* Consecutive failures before lockout */
#define PAIRING_LOCKOUT_MS          60000U  /* First lockout window */
#define PAIRING_LOCKOUT_MAX_MS      960000U /* Lockout doubling cap (16 min) */
#define PAIRING_GUARD_PEERS         4U      /* Tracked peer addresses (LRU) */
#define RNG_MAX_ATTEMPTS            3U      /* Health-test retries before fatal fault */

/*============================================================================
 * Key Storage (flash)
 *============================================================================*/
#define KEY_STORE_SECTOR_FROM_END   3U      /* Sectors below end of flash; BTstack TLV uses last 2 */
#define BOND_RECORD_MAGIC           0x4C4B5059U /* 'LKPY' */
#define BOND_RECORD_VERSION         1U
#define KEY_STORE_FLASH_TIMEOUT_MS  100U    /* flash_safe_execute lockout timeout */

/*============================================================================
 * GAP / Device Identity
 *============================================================================*/
#define DEVICE_NAME                 "Lookpoint Tracker"
#define DEVICE_NAME_MAX_LEN         19U     /* Bytes, UTF-8 */
#define ADV_PAYLOAD_MAX_LEN         31U
#define DEVICE_MANUFACTURER         "Sauerstoff.ca"
#define DEVICE_MODEL                "Lookpoint-01"
#define DEVICE_HW_REVISION          "PICO2W-BNO085"
#define DEVICE_FW_REVISION          "0.2.0"

/*============================================================================
 * Diagnostic Log
 *============================================================================*/
#define DIAG_LOG_CAPACITY           32U     /* Entries in the diagnostic ring */
#define DIAG_EVENT_COOLDOWN_MS      1000U   /* Per-tag deduplication window */
#define DIAG_DEDUP_ENTRIES          16U

/*============================================================================
 * Battery Monitoring (ADC)
 *============================================================================*/
#define BAT_ADC_PIN             26U      /* GP26 - BAT_ADC via 200K/100K divider */
#define BAT_ADC_CHANNEL         0U       /* ADC input 0 (GP26 = ADC0) */
#define BAT_VOLTAGE_DIVIDER     3.0f     /* R(200K) + R(100K) = VCC/3 */
#define BAT_ADC_VREF            3.3f     /* ADC reference voltage */
#define BAT_ADC_RESOLUTION      4096U    /* 12-bit ADC */
#define BAT_EMA_ALPHA           0.05f    /* EMA smoothing (~20 sample lag) */
#define BAT_SAMPLE_INTERVAL_MS  1000U    /* Sample every 1s */
#define BAT_VBUS_THRESHOLD_V    4.5f     /* Above = USB power (no battery) */
#define BAT_NOTIFY_HYSTERESIS_PCT 2U     /* Battery Level characteristic update step */

#endif /* LOOKPOINT_CONFIG_H */
