/*
 * Diag_Log Implementation
 */

#include "logic/diag_log.hpp"

uint32_t Diag_Log::hash_tag(const char *tag) {
    /* djb2 */
    uint32_t hash = 5381U;
    while (*tag != '\0') {
        hash = ((hash << 5U) + hash) + static_cast<uint8_t>(*tag);
        tag++;
    }
    return hash;
}

bool Diag_Log::is_duplicate(uint32_t tag_hash, uint32_t now_ms) const {
    for (const EventEntry &entry : event_cache_) {
        if (entry.used && entry.tag_hash == tag_hash) {
            return (now_ms - entry.last_time_ms) < DIAG_EVENT_COOLDOWN_MS;
        }
    }
    return false;
}

void Diag_Log::record(uint32_t tag_hash, uint32_t now_ms) {
    for (EventEntry &entry : event_cache_) {
        if (entry.used && entry.tag_hash == tag_hash) {
            entry.last_time_ms = now_ms;
            return;
        }
    }
    /* New tag - overwrite oldest slot round-robin */
    event_cache_[event_cache_idx_] = {tag_hash, now_ms, true};
    event_cache_idx_ = (event_cache_idx_ + 1U) % DIAG_DEDUP_ENTRIES;
}

bool Diag_Log::emit(const char *tag, DiagCode code, uint32_t value, uint32_t now_ms) {
    if (tag == nullptr) {
        return false;
    }

    uint32_t tag_hash = hash_tag(tag);
    if (code != DiagCode::Fatal && is_duplicate(tag_hash, now_ms)) {
        if (stats_.deduplicated < UINT32_MAX) {
            stats_.deduplicated++;
        }
        return false;
    }

    if (count_ >= DIAG_LOG_CAPACITY) {
        if (stats_.dropped < UINT32_MAX) {
            stats_.dropped++;
        }
        return false;
    }

    buffer_[write_idx_] = {now_ms, tag, code, value};
    write_idx_ = (write_idx_ + 1U) % DIAG_LOG_CAPACITY;
    count_++;

    record(tag_hash, now_ms);

    if (stats_.emitted < UINT32_MAX) {
        stats_.emitted++;
    }
    return true;
}

bool Diag_Log::pop(DiagEntry *out) {
    if (count_ == 0U) {
        return false;
    }
    *out = buffer_[read_idx_];
    read_idx_ = (read_idx_ + 1U) % DIAG_LOG_CAPACITY;
    count_--;
    return true;
}

uint32_t Diag_Log::pending() const {
    return count_;
}
