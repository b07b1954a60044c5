/*
 * Fault_Monitor Implementation
 */

#include "logic/fault_monitor.hpp"

void Fault_Monitor::report(FaultKind kind, const char *tag, uint32_t value, uint32_t now_ms) {
    uint8_t idx = static_cast<uint8_t>(kind);
    if (kind == FaultKind::None || idx >= FAULT_KIND_COUNT) {
        return;
    }

    if (counts_[idx] < UINT32_MAX) {
        counts_[idx]++;
    }

    if (is_fatal(kind)) {
        if (!fatal()) {
            fatal_kind_ = kind;
            fatal_tag_ = tag;
            fatal_value_ = value;
        }
        diag_.emit(tag, DiagCode::Fatal, value, now_ms);
        return;
    }

    diag_.emit(tag, DiagCode::Fault, value, now_ms);
}

uint32_t Fault_Monitor::count(FaultKind kind) const {
    uint8_t idx = static_cast<uint8_t>(kind);
    if (idx >= FAULT_KIND_COUNT) {
        return 0;
    }
    return counts_[idx];
}

const char *fault_kind_name(FaultKind kind) {
    switch (kind) {
        case FaultKind::None:               return "none";
        case FaultKind::TransientHardware:  return "transient_hw";
        case FaultKind::Link:               return "link";
        case FaultKind::Security:           return "security";
        case FaultKind::ResourceExhaustion: return "resource_exhaustion";
        case FaultKind::LogicInvariant:     return "logic_invariant";
    }
    return "?";
}
