/*
 * Application Tasks - The fixed task set bound to the cooperative scheduler
 *
 *   Connection  <- link events, 100ms housekeeping timer
 *   Sampler     <- 100Hz timer           -> raw mailbox    -> wakes Fusion
 *   Fusion      <- raw mailbox           -> fused mailbox  -> wakes Notifier
 *   Notifier    <- fused mailbox
 *   Battery     <- 1Hz timer             -> Battery Level characteristic
 */

#ifndef TASKS_HPP
#define TASKS_HPP

#include "types.h"
#include "logic/connection_manager.hpp"
#include "logic/device_interfaces.hpp"
#include "logic/diag_log.hpp"
#include "logic/fault_monitor.hpp"
#include "logic/fusion.hpp"
#include "logic/link_adapter.hpp"
#include "logic/mailbox.hpp"
#include "logic/scheduler.hpp"
#include "logic/sensor_sampler.hpp"
#include "logic/telemetry.hpp"
#include <cstdint>

class Connection_Task final : public Task {
public:
    explicit Connection_Task(Connection_Manager &manager) : manager_(manager) {}
    void run(uint32_t signals, uint64_t now_us) override;

private:
    Connection_Manager &manager_;
};

class Sampler_Task final : public Task {
public:
    Sampler_Task(Sensor_Bus &bus, Mailbox<RawSample> &raw_out, Scheduler &scheduler,
                 Fault_Monitor &faults, Diag_Log &diag)
        : bus_(bus), raw_out_(raw_out), scheduler_(scheduler), faults_(faults), diag_(diag) {}

    void run(uint32_t signals, uint64_t now_us) override;

    const SamplerState &state() const { return state_; }
    uint32_t resets() const { return resets_; }

private:
    void reset_sensor(uint64_t now_us);

    Sensor_Bus &bus_;
    Mailbox<RawSample> &raw_out_;
    Scheduler &scheduler_;
    Fault_Monitor &faults_;
    Diag_Log &diag_;
    SamplerState state_;
    uint32_t resets_ = 0;
};

class Fusion_Task final : public Task {
public:
    Fusion_Task(Mailbox<RawSample> &raw_in, Mailbox<OrientationSample> &fused_out,
                Scheduler &scheduler, Diag_Log &diag)
        : raw_in_(raw_in), fused_out_(fused_out), scheduler_(scheduler), diag_(diag) {}

    void run(uint32_t signals, uint64_t now_us) override;

    const FusionState &state() const { return state_; }
    const OrientationSample &latest() const { return latest_; }

private:
    Mailbox<RawSample> &raw_in_;
    Mailbox<OrientationSample> &fused_out_;
    Scheduler &scheduler_;
    Diag_Log &diag_;
    FusionState state_;
    OrientationSample latest_;
};

class Notifier_Task final : public Task {
public:
    Notifier_Task(Mailbox<OrientationSample> &fused_in, Telemetry_Notifier &notifier)
        : fused_in_(fused_in), notifier_(notifier) {}

    void run(uint32_t signals, uint64_t now_us) override;

private:
    Mailbox<OrientationSample> &fused_in_;
    Telemetry_Notifier &notifier_;
};

class Battery_Task final : public Task {
public:
    Battery_Task(Battery_Gauge &gauge, Link_Adapter &link) : gauge_(gauge), link_(link) {}

    void run(uint32_t signals, uint64_t now_us) override;

    uint8_t reported_level() const { return last_level_; }

private:
    Battery_Gauge &gauge_;
    Link_Adapter &link_;
    bool reported_ = false;
    uint8_t last_level_ = 0;
};

#endif // TASKS_HPP
