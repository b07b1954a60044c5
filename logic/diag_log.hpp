/*
 * Diag_Log - Fire-and-forget diagnostic event ring
 * Task context only. Per-tag deduplication, drained to stdio by the main loop
 */

#ifndef DIAG_LOG_HPP
#define DIAG_LOG_HPP

#include "config.h"
#include <cstdint>

/* Event codes carried alongside the tag */
enum class DiagCode : uint8_t {
    Info,
    Warning,
    Fault,
    Fatal
};

struct DiagEntry {
    uint32_t timestamp_ms;
    const char *tag;      /* Static string, never copied */
    DiagCode code;
    uint32_t value;
};

struct DiagStats {
    uint32_t emitted;
    uint32_t deduplicated;   /* Suppressed inside the per-tag cooldown */
    uint32_t dropped;        /* Ring full */
};

class Diag_Log {
public:
    Diag_Log() = default;

    /* Disable copy/move */
    Diag_Log(const Diag_Log&) = delete;
    Diag_Log& operator=(const Diag_Log&) = delete;

    /**
     * @brief Record a diagnostic event.
     * Events are deduplicated by tag (DIAG_EVENT_COOLDOWN_MS per unique tag).
     * Fatal events bypass deduplication. Non-blocking, O(1).
     * @return true if queued, false if deduplicated or ring full
     */
    bool emit(const char *tag, DiagCode code, uint32_t value, uint32_t now_ms);

    /* Oldest queued event. Returns false if empty. */
    bool pop(DiagEntry *out);

    uint32_t pending() const;
    DiagStats stats() const { return stats_; }

    static uint32_t hash_tag(const char *tag);

private:
    struct EventEntry {
        uint32_t tag_hash;
        uint32_t last_time_ms;
        bool used;
    };

    bool is_duplicate(uint32_t tag_hash, uint32_t now_ms) const;
    void record(uint32_t tag_hash, uint32_t now_ms);

    /* Ring buffer (SPSC, both ends in task context) */
    DiagEntry buffer_[DIAG_LOG_CAPACITY] = {};
    uint32_t write_idx_ = 0;
    uint32_t read_idx_ = 0;
    uint32_t count_ = 0;

    /* Event deduplication */
    EventEntry event_cache_[DIAG_DEDUP_ENTRIES] = {};
    uint32_t event_cache_idx_ = 0;

    DiagStats stats_ = {};
};

#endif // DIAG_LOG_HPP
