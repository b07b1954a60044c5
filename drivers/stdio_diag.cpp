/*
 * Stdio_Diag Implementation
 */

#include "drivers/stdio_diag.hpp"
#include "pico/stdlib.h"

#include <cstdio>

static const char *code_name(DiagCode code) {
    switch (code) {
        case DiagCode::Info:    return "INFO";
        case DiagCode::Warning: return "WARN";
        case DiagCode::Fault:   return "FAULT";
        case DiagCode::Fatal:   return "FATAL";
    }
    return "?";
}

uint32_t Stdio_Diag::drain(Diag_Log &log, uint32_t max_entries) {
    uint32_t count = 0;
    DiagEntry entry;

    while (count < max_entries && log.pop(&entry)) {
        printf("[DIAG] t=%lu tag=%s code=%s value=%lu\n",
               static_cast<unsigned long>(entry.timestamp_ms),
               entry.tag,
               code_name(entry.code),
               static_cast<unsigned long>(entry.value));
        count++;
    }
    return count;
}

void Stdio_Diag::report_fatal(const Fault_Monitor &faults) {
    printf("[FATAL] kind=%s tag=%s value=%lu - resetting\n",
           fault_kind_name(faults.fatal_kind()),
           faults.fatal_tag(),
           static_cast<unsigned long>(faults.fatal_value()));
    stdio_flush();
}
