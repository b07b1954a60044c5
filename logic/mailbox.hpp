/*
 * Mailbox - single-slot overwrite handoff between tasks (or ISR -> task)
 * Newest value wins; storage is exactly one T regardless of producer rate
 */

#ifndef MAILBOX_HPP
#define MAILBOX_HPP

#include "logic/critical_section.hpp"
#include <cstdint>

template <typename T>
class Mailbox {
public:
    static constexpr uint32_t CAPACITY = 1;

    /*
     * Store value, replacing any unread one.
     * Returns true if an unread value was overwritten (coalesced).
     */
    bool post(const T &value) {
        Critical_Section cs;
        bool overwrote = full_;
        slot_ = value;
        full_ = true;
        if (overwrote && overwritten_ < UINT32_MAX) {
            overwritten_++;
        }
        return overwrote;
    }

    /* Move the unread value out. Returns false if the slot is empty. */
    bool take(T *out) {
        Critical_Section cs;
        if (!full_) {
            return false;
        }
        *out = slot_;
        full_ = false;
        return true;
    }

    void clear() {
        Critical_Section cs;
        full_ = false;
    }

    bool full() const { return full_; }
    uint32_t overwritten() const { return overwritten_; }

private:
    T slot_ = {};
    volatile bool full_ = false;
    uint32_t overwritten_ = 0;
};

#endif // MAILBOX_HPP
