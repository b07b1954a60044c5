/*
 * Stdio_Diag - Drains the diagnostic ring to USB CDC stdio
 */

#ifndef STDIO_DIAG_HPP
#define STDIO_DIAG_HPP

#include "logic/diag_log.hpp"
#include "logic/fault_monitor.hpp"
#include <cstdint>

class Stdio_Diag {
public:
    /* Print up to max_entries queued events. Returns the number printed. */
    uint32_t drain(Diag_Log &log, uint32_t max_entries);

    /* Latched fatal fault, printed and flushed before reset. */
    void report_fatal(const Fault_Monitor &faults);
};

#endif // STDIO_DIAG_HPP
