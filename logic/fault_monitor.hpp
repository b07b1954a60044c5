/*
 * Fault_Monitor - Fault taxonomy counters + latch for fatal faults
 *
 *   TransientHardware, Link, Security: counted, logged, absorbed
 *   ResourceExhaustion, LogicInvariant: latched; main loop resets the device
 */

#ifndef FAULT_MONITOR_HPP
#define FAULT_MONITOR_HPP

#include "types.h"
#include "logic/diag_log.hpp"
#include <cstdint>

static constexpr uint8_t FAULT_KIND_COUNT = static_cast<uint8_t>(FaultKind::LogicInvariant) + 1U;

class Fault_Monitor {
public:
    explicit Fault_Monitor(Diag_Log &diag) : diag_(diag) {}

    Fault_Monitor(const Fault_Monitor&) = delete;
    Fault_Monitor& operator=(const Fault_Monitor&) = delete;

    /* Record a fault. The first fatal fault is latched; later ones only count. */
    void report(FaultKind kind, const char *tag, uint32_t value, uint32_t now_ms);

    static bool is_fatal(FaultKind kind) {
        return kind == FaultKind::ResourceExhaustion || kind == FaultKind::LogicInvariant;
    }

    bool fatal() const { return fatal_kind_ != FaultKind::None; }
    FaultKind fatal_kind() const { return fatal_kind_; }
    const char *fatal_tag() const { return fatal_tag_; }
    uint32_t fatal_value() const { return fatal_value_; }

    uint32_t count(FaultKind kind) const;

private:
    Diag_Log &diag_;
    uint32_t counts_[FAULT_KIND_COUNT] = {};
    FaultKind fatal_kind_ = FaultKind::None;
    const char *fatal_tag_ = "";
    uint32_t fatal_value_ = 0;
};

const char *fault_kind_name(FaultKind kind);

#endif // FAULT_MONITOR_HPP
