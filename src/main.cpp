/*
 * Lookpoint Tracker Firmware - Main Entry Point
 * Brings up stdio, IMU, radio and key storage, then runs the cooperative scheduler
 */

#include "config.h"
#include "types.h"

#include "drivers/battery_monitor.hpp"
#include "drivers/btstack_link.hpp"
#include "drivers/flash_key_store.hpp"
#include "drivers/imu_wrapper.hpp"
#include "drivers/pico_random_source.hpp"
#include "drivers/stdio_diag.hpp"
#include "logic/connection_manager.hpp"
#include "logic/diag_log.hpp"
#include "logic/fault_monitor.hpp"
#include "logic/link_adapter.hpp"
#include "logic/mailbox.hpp"
#include "logic/orientation_math.hpp"
#include "logic/scheduler.hpp"
#include "logic/tasks.hpp"
#include "logic/telemetry.hpp"

#include "pico/stdlib.h"
#include "pico/stdio_usb.h"
#include "pico/cyw43_arch.h"
#include "pico/unique_id.h"
#include "hardware/watchdog.h"
#include "hardware/clocks.h"

#include <cstdio>

static constexpr uint32_t DIAG_DRAIN_PER_PASS = 4;
static constexpr float RAD_TO_DEG = 57.2957795f;

static uint64_t clock_us() {
    return time_us_64();
}

[[noreturn]]
static void controlled_reset(Diag_Log &diag, Stdio_Diag &diag_out, const Fault_Monitor &faults) {
    diag_out.drain(diag, DIAG_LOG_CAPACITY);
    diag_out.report_fatal(faults);
    watchdog_reboot(0, 0, 10);
    while (true) {
        tight_loop_contents();
    }
}

/* Re-pair: new IR/ER are only picked up by the controller at power-on */
[[noreturn]]
static void identity_restart(Diag_Log &diag, Stdio_Diag &diag_out) {
    diag_out.drain(diag, DIAG_LOG_CAPACITY);
    printf("[SYS] Restarting with new identity keys\n");
    stdio_flush();
    watchdog_reboot(0, 0, 10);
    while (true) {
        tight_loop_contents();
    }
}

/* Single-character console commands over USB CDC */
static void handle_console(Connection_Manager &manager, bool &stay_idle, uint64_t now_us) {
    int c = getchar_timeout_us(0);
    if (c == PICO_ERROR_TIMEOUT) {
        return;
    }

    switch (c) {
        case 'd':
            printf("[CMD] Disconnect\n");
            manager.request_disconnect();
            break;
        case 'i':
            stay_idle = !stay_idle;
            printf("[CMD] Stay idle: %s\n", stay_idle ? "on" : "off");
            manager.set_stay_idle(stay_idle);
            break;
        case 'r':
            printf("[CMD] Re-pair: clearing bonds and regenerating keys\n");
            if (manager.repair(now_us)) {
                printf("[CMD] Restart once the link is down\n");
            }
            break;
        default:
            break;
    }
}

int main() {
    set_sys_clock_khz(SYS_CLOCK_KHZ, true);
    stdio_init_all();

    // Wait for USB host serial connection (up to 5s), then proceed regardless.
    // Without this, early printf output is buffered and lost.
    for (int i = 0; i < 50 && !stdio_usb_connected(); i++) {
        sleep_ms(100);
    }

    printf("\n========================================\n");
    printf("Lookpoint Tracker Firmware %s\n", DEVICE_FW_REVISION);
    printf("Build: %s %s\n", __DATE__, __TIME__);
    printf("Board: %s\n", PICO_BOARD);
    printf("SDK:   %s\n", PICO_SDK_VERSION_STRING);
    printf("Clock: %lu kHz\n", static_cast<unsigned long>(SYS_CLOCK_KHZ));
    printf("========================================\n\n");
    if (watchdog_caused_reboot()) {
        printf("[SYS] Previous reset caused by watchdog\n");
    }
    stdio_flush();

    /* Radio first: BTstack runs inside the CYW43 async context */
    if (cyw43_arch_init() != 0) {
        printf("[BLE] cyw43_arch_init failed - rebooting\n");
        stdio_flush();
        watchdog_reboot(0, 0, 1000);
        while (true) {
            tight_loop_contents();
        }
    }

    static Diag_Log diag;
    static Stdio_Diag diag_out;
    static Fault_Monitor faults(diag);
    static Scheduler scheduler(clock_us);

    static Btstack_Link radio;
    static Link_Adapter link(radio, scheduler);
    static Telemetry_Notifier notifier(link);
    static Flash_Key_Store key_store;
    static Pico_Random_Source random_source;
    static Connection_Manager manager(link, notifier, key_store, random_source, diag, faults);

    static IMU_Wrapper imu;
    static Battery_Monitor battery;
    static Mailbox<RawSample> raw_box;
    static Mailbox<OrientationSample> fused_box;

    // Sensor failure is non-fatal: the sampler declares the fault and keeps retrying
    bool imu_ok = imu.init();
    if (!imu_ok) {
        printf("[IMU] Init FAILED - running degraded, telemetry withheld\n");
    }
    battery.init();
    stdio_flush();

    static char serial[2 * PICO_UNIQUE_BOARD_ID_SIZE_BYTES + 1];
    pico_get_unique_board_id_string(serial, sizeof(serial));

    if (!radio.init(link, DEVICE_NAME, serial)) {
        faults.report(FaultKind::LogicInvariant, "GAP_CONFIG", 0, 0);
        controlled_reset(diag, diag_out, faults);
    }

    uint64_t now = time_us_64();
    if (!manager.start(now)) {
        controlled_reset(diag, diag_out, faults);
    }

    static Connection_Task connection_task(manager);
    static Sampler_Task sampler_task(imu, raw_box, scheduler, faults, diag);
    static Fusion_Task fusion_task(raw_box, fused_box, scheduler, diag);
    static Notifier_Task notifier_task(fused_box, notifier);
    static Battery_Task battery_task(battery, link);

    now = time_us_64();
    bool tasks_ok =
        scheduler.add_task(TaskId::Connection, "conn", connection_task,
                           CONNECTION_TASK_PERIOD_MS * 1000U, now) &&
        scheduler.add_task(TaskId::Sampler, "sampler", sampler_task,
                           SAMPLE_PERIOD_MS * 1000U, now) &&
        scheduler.add_task(TaskId::Fusion, "fusion", fusion_task, 0, now) &&
        scheduler.add_task(TaskId::Notifier, "notifier", notifier_task, 0, now) &&
        scheduler.add_task(TaskId::Battery, "battery", battery_task,
                           BATTERY_TASK_PERIOD_MS * 1000U, now);
    if (!tasks_ok) {
        faults.report(FaultKind::LogicInvariant, "TASK_TABLE", 0, 0);
        controlled_reset(diag, diag_out, faults);
    }

    /* Link events from here on find the Connection task bound */
    radio.power_on();
    printf("[BLE] Powered on, advertising as \"%s\"\n", DEVICE_NAME);
    stdio_flush();

    if (imu_ok) {
        imu.flush();
    }

    watchdog_enable(WATCHDOG_TIMEOUT_MS, true);
    printf("[SYS] Watchdog %lu ms, entering scheduler loop\n",
           static_cast<unsigned long>(WATCHDOG_TIMEOUT_MS));
    stdio_flush();

    bool stay_idle = false;
    uint64_t restart_deadline_us = 0;
    uint32_t last_heartbeat_ms = to_ms_since_boot(get_absolute_time());

    while (true) {
        watchdog_update();

        now = time_us_64();
        uint32_t ran = scheduler.run_once(now);

        diag_out.drain(diag, DIAG_DRAIN_PER_PASS);
        if (faults.fatal()) {
            controlled_reset(diag, diag_out, faults);
        }

        handle_console(manager, stay_idle, now);
        if (manager.restart_pending()) {
            if (restart_deadline_us == 0) {
                restart_deadline_us = now + static_cast<uint64_t>(REPAIR_RESTART_TIMEOUT_MS) * 1000U;
            }
            if (manager.state() == ConnectionState::Disconnected || now >= restart_deadline_us) {
                identity_restart(diag, diag_out);
            }
        }

        uint32_t now_ms = to_ms_since_boot(get_absolute_time());
        if ((now_ms - last_heartbeat_ms) >= HEARTBEAT_INTERVAL_MS) {
            last_heartbeat_ms = now_ms;

            const OrientationSample &o = fusion_task.latest();
            EulerAngles e = quaternion_to_euler(o.q);
            TelemetryStats ts = notifier.stats();
            TaskStats sampler_stats = scheduler.stats(TaskId::Sampler);
            TaskStats fusion_stats = scheduler.stats(TaskId::Fusion);

            printf("[heartbeat] uptime=%lu ms  state=%s  credits=%u  sent=%lu coalesced=%lu "
                   "stale=%lu gated=%lu  overruns=%lu  run_max=%lu/%lu us  "
                   "ypr=%.1f/%.1f/%.1f  flags=0x%02X  bus_err=%lu  bat=%.2fV(%u%%)\n",
                   static_cast<unsigned long>(now_ms),
                   connection_state_name(manager.state()),
                   notifier.credits(),
                   static_cast<unsigned long>(ts.sent),
                   static_cast<unsigned long>(ts.coalesced),
                   static_cast<unsigned long>(ts.dropped_stale),
                   static_cast<unsigned long>(ts.dropped_gated),
                   static_cast<unsigned long>(sampler_stats.overruns),
                   static_cast<unsigned long>(sampler_stats.max_run_us),
                   static_cast<unsigned long>(fusion_stats.max_run_us),
                   static_cast<double>(e.yaw * RAD_TO_DEG),
                   static_cast<double>(e.pitch * RAD_TO_DEG),
                   static_cast<double>(e.roll * RAD_TO_DEG),
                   o.flags,
                   static_cast<unsigned long>(sampler_task.state().total_errors),
                   static_cast<double>(battery.voltage()),
                   battery.percent());
            stdio_flush();
        }

        /* Nothing ran: sleep until the next deadline or an interrupt */
        if (ran == 0U && !scheduler.has_pending()) {
            uint64_t next = scheduler.next_deadline_us();
            now = time_us_64();
            if (next > now) {
                uint64_t wait = next - now;
                if (wait > IDLE_SLEEP_MAX_US) {
                    wait = IDLE_SLEEP_MAX_US;
                }
                best_effort_wfe_or_timeout(make_timeout_time_us(wait));
            }
        }
    }
}
