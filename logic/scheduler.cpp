/*
 * Cooperative Scheduler Implementation
 */

#include "logic/scheduler.hpp"
#include "logic/critical_section.hpp"

bool Scheduler::add_task(TaskId id, const char *name, Task &task,
                         uint32_t period_us, uint64_t now_us) {
    uint8_t idx = static_cast<uint8_t>(id);
    if (idx >= TASK_COUNT || slots_[idx].task != nullptr) {
        return false;
    }

    TaskSlot &slot = slots_[idx];
    slot.name = name;
    slot.task = &task;
    slot.period_us = period_us;
    slot.next_deadline_us = (period_us > 0U) ? now_us + period_us : UINT64_MAX;
    slot.stats = {};
    return true;
}

void Scheduler::signal(TaskId id, uint32_t signals) {
    uint8_t idx = static_cast<uint8_t>(id);
    if (idx >= TASK_COUNT) {
        return;
    }
    Critical_Section cs;
    slots_[idx].pending = slots_[idx].pending | signals;
}

uint32_t Scheduler::take_pending(TaskSlot &slot) {
    Critical_Section cs;
    uint32_t signals = slot.pending;
    slot.pending = 0;
    return signals;
}

void Scheduler::promote_timer(TaskSlot &slot, uint64_t now_us) {
    if (slot.period_us == 0U || now_us < slot.next_deadline_us) {
        return;
    }

    /* Advance by whole periods so cadence does not drift with dispatch jitter */
    slot.next_deadline_us += slot.period_us;

    if (now_us >= slot.next_deadline_us) {
        /* One or more whole periods missed - count them and resync */
        uint64_t behind = now_us - slot.next_deadline_us;
        uint64_t missed = behind / slot.period_us + 1U;
        uint64_t total = static_cast<uint64_t>(slot.stats.overruns) + missed;
        slot.stats.overruns = (total > UINT32_MAX) ? UINT32_MAX : static_cast<uint32_t>(total);
        slot.next_deadline_us += missed * slot.period_us;
    }

    Critical_Section cs;
    slot.pending = slot.pending | SIGNAL_TIMER;
}

uint32_t Scheduler::run_once(uint64_t now_us) {
    for (TaskSlot &slot : slots_) {
        if (slot.task != nullptr) {
            promote_timer(slot, now_us);
        }
    }

    uint32_t ran = 0;
    for (TaskSlot &slot : slots_) {
        if (slot.task == nullptr) {
            continue;
        }
        uint32_t signals = take_pending(slot);
        if (signals == 0U) {
            continue;
        }

        uint64_t start = clock_();
        slot.task->run(signals, now_us);
        uint64_t elapsed = clock_() - start;

        uint32_t elapsed_us = (elapsed > UINT32_MAX) ? UINT32_MAX : static_cast<uint32_t>(elapsed);
        slot.stats.last_run_us = elapsed_us;
        if (elapsed_us > slot.stats.max_run_us) {
            slot.stats.max_run_us = elapsed_us;
        }
        if (slot.stats.runs < UINT32_MAX) {
            slot.stats.runs++;
        }
        ran++;
    }
    return ran;
}

bool Scheduler::has_pending() const {
    for (const TaskSlot &slot : slots_) {
        if (slot.task != nullptr && slot.pending != 0U) {
            return true;
        }
    }
    return false;
}

uint64_t Scheduler::next_deadline_us() const {
    uint64_t earliest = UINT64_MAX;
    for (const TaskSlot &slot : slots_) {
        if (slot.task != nullptr && slot.period_us > 0U && slot.next_deadline_us < earliest) {
            earliest = slot.next_deadline_us;
        }
    }
    return earliest;
}

TaskStats Scheduler::stats(TaskId id) const {
    uint8_t idx = static_cast<uint8_t>(id);
    if (idx >= TASK_COUNT) {
        return {};
    }
    return slots_[idx].stats;
}

const char *Scheduler::name(TaskId id) const {
    uint8_t idx = static_cast<uint8_t>(id);
    if (idx >= TASK_COUNT || slots_[idx].name == nullptr) {
        return "?";
    }
    return slots_[idx].name;
}
