/*
 * Integration tests for the task set on a host scheduler
 * Sampler -> Fusion -> Notifier chaining, sensor fault reporting, battery refresh
 */

#include <gtest/gtest.h>
#include <cstring>
#include "logic/tasks.hpp"
#include "config.h"
#include "test/fakes.hpp"

constexpr uint16_t HANDLE = 0x0040;
constexpr uint64_t TICK_US = static_cast<uint64_t>(SAMPLE_PERIOD_MS) * 1000U;

static uint64_t zero_clock() {
    return 0;
}

/* The data-path tasks bound to a scheduler, driven tick by tick */
struct Pipeline_Rig {
    Fake_Sensor_Bus bus;
    Fake_Link_Controller controller;
    Fake_Battery_Gauge gauge;

    Scheduler scheduler{zero_clock};
    Diag_Log diag;
    Fault_Monitor faults{diag};
    Link_Adapter link{controller, scheduler};
    Telemetry_Notifier notifier{link};

    Mailbox<RawSample> raw_box;
    Mailbox<OrientationSample> fused_box;

    Sampler_Task sampler{bus, raw_box, scheduler, faults, diag};
    Fusion_Task fusion{raw_box, fused_box, scheduler, diag};
    Notifier_Task notify{fused_box, notifier};
    Battery_Task battery{gauge, link};

    uint64_t now_us = 0;
    uint32_t last_ran = 0;

    Pipeline_Rig() {
        scheduler.add_task(TaskId::Sampler, "sampler", sampler, static_cast<uint32_t>(TICK_US), 0);
        scheduler.add_task(TaskId::Fusion, "fusion", fusion, 0, 0);
        scheduler.add_task(TaskId::Notifier, "notifier", notify, 0, 0);
        scheduler.add_task(TaskId::Battery, "battery", battery, BATTERY_TASK_PERIOD_MS * 1000U, 0);
    }

    void open_gate() {
        notifier.set_connection(HANDLE);
        notifier.set_bonded(true, now_us);
        notifier.set_subscribed(true, now_us);
    }

    void tick(uint32_t n = 1) {
        for (uint32_t i = 0; i < n; i++) {
            now_us += TICK_US;
            last_ran = scheduler.run_once(now_us);
        }
    }

    bool diag_contains(const char *tag) {
        DiagEntry e;
        bool found = false;
        while (diag.pop(&e)) {
            if (strcmp(e.tag, tag) == 0) {
                found = true;
            }
        }
        return found;
    }
};

// ============================================================================
// Test Suite: Tasks_Pipeline
// ============================================================================

TEST(Tasks_Pipeline, OneTickRunsWholeChain) {
    Pipeline_Rig rig;
    rig.open_gate();
    rig.notifier.grant_credits(HANDLE, 1, 0);

    rig.tick();

    EXPECT_EQ(rig.last_ran, 3U);
    EXPECT_EQ(rig.bus.reads, 1);
    EXPECT_EQ(rig.scheduler.stats(TaskId::Fusion).runs, 1U);
    EXPECT_EQ(rig.scheduler.stats(TaskId::Notifier).runs, 1U);

    ASSERT_EQ(rig.controller.notifications, 1);
    EXPECT_EQ(rig.controller.last_notify_handle, HANDLE);
    EXPECT_EQ(rig.controller.last_packet[2] & ORIENT_FLAG_VALID, ORIENT_FLAG_VALID);
    EXPECT_FALSE(rig.raw_box.full());
    EXPECT_FALSE(rig.fused_box.full());
}

TEST(Tasks_Pipeline, SamplesStampedWithTickTime) {
    Pipeline_Rig rig;
    rig.tick(3);
    EXPECT_EQ(rig.fusion.latest().timestamp_us, 3U * TICK_US);
    EXPECT_EQ(rig.fusion.latest().sequence, 2U);
}

TEST(Tasks_Pipeline, ClosedGateDropsEverySample) {
    Pipeline_Rig rig;
    rig.tick(5);

    EXPECT_EQ(rig.notifier.stats().dropped_gated, 5U);
    EXPECT_EQ(rig.controller.notifications, 0);
    EXPECT_EQ(rig.controller.credit_requests, 0);
}

TEST(Tasks_Pipeline, NoCreditRequestsOnce) {
    Pipeline_Rig rig;
    rig.open_gate();

    rig.tick(4);

    EXPECT_EQ(rig.controller.credit_requests, 1);
    EXPECT_EQ(rig.controller.notifications, 0);
    EXPECT_TRUE(rig.notifier.has_pending());
    EXPECT_EQ(rig.notifier.stats().coalesced, 3U);
}

// ============================================================================
// Test Suite: Tasks_SensorFault
// ============================================================================

TEST(Tasks_SensorFault, HoldKeepsOrientationValid) {
    Pipeline_Rig rig;
    rig.tick();
    rig.bus.fail = true;

    rig.tick(SAMPLER_HOLD_CYCLES);

    EXPECT_EQ(rig.faults.count(FaultKind::TransientHardware), 0U);
    uint8_t flags = rig.fusion.latest().flags;
    EXPECT_EQ(flags & ORIENT_FLAG_VALID, ORIENT_FLAG_VALID);
    EXPECT_EQ(flags & ORIENT_FLAG_HELD, ORIENT_FLAG_HELD);
}

TEST(Tasks_SensorFault, FaultReportedOnceAndNotSent) {
    Pipeline_Rig rig;
    rig.tick();
    rig.open_gate();
    rig.bus.fail = true;

    rig.tick(SAMPLER_HOLD_CYCLES + 1U);

    EXPECT_EQ(rig.faults.count(FaultKind::TransientHardware), 1U);
    EXPECT_FALSE(rig.faults.fatal());
    EXPECT_EQ(rig.fusion.latest().flags, ORIENT_FLAG_STALE | ORIENT_FLAG_SENSOR_FAULT);

    /* A credit arriving now must not push out a faulted orientation */
    rig.notifier.grant_credits(HANDLE, 1, rig.now_us);
    EXPECT_EQ(rig.controller.notifications, 0);

    rig.tick(20);
    EXPECT_EQ(rig.faults.count(FaultKind::TransientHardware), 1U);
    EXPECT_TRUE(rig.diag_contains("SENSOR_FAULT"));
}

TEST(Tasks_SensorFault, RecoveryLogged) {
    Pipeline_Rig rig;
    rig.tick();
    rig.bus.fail = true;
    rig.tick(SAMPLER_HOLD_CYCLES + 1U);
    ASSERT_TRUE(rig.sampler.state().faulted);

    rig.bus.fail = false;
    for (int i = 0; i < 64 && rig.sampler.state().faulted; i++) {
        rig.tick();
    }

    EXPECT_FALSE(rig.sampler.state().faulted);
    EXPECT_TRUE(rig.diag_contains("SENSOR_RECOVERED"));
    EXPECT_EQ(rig.fusion.latest().flags & ORIENT_FLAG_VALID, ORIENT_FLAG_VALID);
}

TEST(Tasks_SensorFault, SensorResetWhenFaultDeclared) {
    Pipeline_Rig rig;
    rig.tick();
    rig.bus.fail = true;

    rig.tick(SAMPLER_HOLD_CYCLES);
    EXPECT_EQ(rig.bus.resets, 0);

    rig.tick();
    EXPECT_EQ(rig.bus.resets, 1);
    EXPECT_EQ(rig.sampler.resets(), 1U);
    EXPECT_TRUE(rig.diag_contains("SENSOR_RESET"));
}

TEST(Tasks_SensorFault, ResetRepeatsWhileFaulted) {
    Pipeline_Rig rig;
    rig.tick();
    rig.bus.fail = true;
    rig.bus.reset_result = false;

    rig.tick(700);

    EXPECT_GE(rig.bus.resets, 3);
    EXPECT_EQ(rig.faults.count(FaultKind::TransientHardware), 1U);
    EXPECT_TRUE(rig.sampler.state().faulted);
}

TEST(Tasks_SensorFault, ResetRestoresLostConfiguration) {
    Pipeline_Rig rig;
    rig.tick();
    rig.bus.fail = true;
    rig.bus.reset_clears_failure = true;

    rig.tick(SAMPLER_HOLD_CYCLES + 1U);
    ASSERT_TRUE(rig.sampler.state().faulted);

    for (int i = 0; i < 8 && rig.sampler.state().faulted; i++) {
        rig.tick();
    }

    EXPECT_FALSE(rig.sampler.state().faulted);
    EXPECT_EQ(rig.bus.resets, 1);
    EXPECT_TRUE(rig.diag_contains("SENSOR_RECOVERED"));
}

// ============================================================================
// Test Suite: Tasks_Connection
// ============================================================================

/* Connection task over a manager and fake controller, not yet bound */
struct Connection_Rig {
    Fake_Link_Controller controller;
    Fake_Key_Store key_store;
    Fake_Random_Source random;
    Scheduler scheduler{zero_clock};
    Diag_Log diag;
    Fault_Monitor faults{diag};
    Link_Adapter link{controller, scheduler};
    Telemetry_Notifier notifier{link};
    Connection_Manager manager{link, notifier, key_store, random, diag, faults};
    Connection_Task task{manager};
};

TEST(Tasks_Connection, EventBeforeBindHandledOnFirstPass) {
    Connection_Rig rig;
    ASSERT_TRUE(rig.manager.start(0));

    /* Radio is up and a host connects before the task table is built */
    rig.link.on_connected(HANDLE, make_peer(1));
    ASSERT_TRUE(rig.scheduler.add_task(TaskId::Connection, "conn", rig.task,
                                       CONNECTION_TASK_PERIOD_MS * 1000U, 0));

    EXPECT_EQ(rig.scheduler.run_once(1000), 1U);
    EXPECT_EQ(rig.manager.state(), ConnectionState::Connecting);
    EXPECT_EQ(rig.manager.handle(), HANDLE);
}

TEST(Tasks_Connection, TimerDrainsQueuedEvents) {
    Connection_Rig rig;
    ASSERT_TRUE(rig.manager.start(0));
    rig.link.on_connected(HANDLE, make_peer(1));

    rig.task.run(SIGNAL_TIMER, 100000);

    EXPECT_EQ(rig.manager.state(), ConnectionState::Connecting);
    LinkEvent ev;
    EXPECT_FALSE(rig.link.pop(&ev));
}

// ============================================================================
// Test Suite: Tasks_Battery
// ============================================================================

TEST(Tasks_Battery, RunsOncePerPeriod) {
    Pipeline_Rig rig;
    const uint32_t ticks_per_period = BATTERY_TASK_PERIOD_MS / SAMPLE_PERIOD_MS;

    rig.tick(ticks_per_period - 1U);
    EXPECT_EQ(rig.gauge.updates, 0);

    rig.tick();
    EXPECT_EQ(rig.gauge.updates, 1);
    EXPECT_EQ(rig.gauge.last_update_ms, BATTERY_TASK_PERIOD_MS);
    ASSERT_EQ(rig.controller.battery_levels.size(), 1U);
    EXPECT_EQ(rig.controller.battery_levels[0], 100);
    EXPECT_EQ(rig.battery.reported_level(), 100);
}

TEST(Tasks_Battery, HysteresisOnLevelChanges) {
    Pipeline_Rig rig;
    rig.gauge.level = 80;
    rig.battery.run(SIGNAL_TIMER, 1000000);

    rig.gauge.level = 79;
    rig.battery.run(SIGNAL_TIMER, 2000000);
    EXPECT_EQ(rig.battery.reported_level(), 80);

    rig.gauge.level = 78;
    rig.battery.run(SIGNAL_TIMER, 3000000);

    ASSERT_EQ(rig.controller.battery_levels.size(), 2U);
    EXPECT_EQ(rig.controller.battery_levels[1], 78);
}

TEST(Tasks_Battery, NoSampleNoReport) {
    Pipeline_Rig rig;
    rig.gauge.sample_ready = false;
    rig.battery.run(SIGNAL_TIMER, 1000000);
    rig.battery.run(SIGNAL_LINK_EVENT, 2000000);

    EXPECT_EQ(rig.gauge.updates, 1);
    EXPECT_TRUE(rig.controller.battery_levels.empty());
}
