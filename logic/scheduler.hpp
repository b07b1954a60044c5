/*
 * Cooperative Scheduler - fixed task table, single core, no preemption
 * Interrupt handlers wake tasks via signal(); tasks run to their next await point
 */

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <cstdint>

/* Fixed task set, in dispatch priority order (lowest index runs first). */
enum class TaskId : uint8_t {
    Connection = 0,
    Sampler,
    Fusion,
    Notifier,
    Battery,
    Count
};

static constexpr uint8_t TASK_COUNT = static_cast<uint8_t>(TaskId::Count);

/* Wake reasons - bitfield delivered to Task::run() */
static constexpr uint32_t SIGNAL_TIMER        = 1U << 0U;  /* Periodic deadline reached */
static constexpr uint32_t SIGNAL_LINK_EVENT   = 1U << 1U;  /* Link adapter queued an event */
static constexpr uint32_t SIGNAL_RAW_SAMPLE   = 1U << 2U;  /* Raw mailbox posted */
static constexpr uint32_t SIGNAL_FUSED_SAMPLE = 1U << 3U;  /* Fused mailbox posted */

class Task {
public:
    virtual ~Task() = default;
    virtual void run(uint32_t signals, uint64_t now_us) = 0;
};

struct TaskStats {
    uint32_t runs = 0;
    uint32_t overruns = 0;      /* Periodic deadlines missed entirely */
    uint32_t max_run_us = 0;
    uint32_t last_run_us = 0;
};

class Scheduler {
public:
    using Clock = uint64_t (*)();

    explicit Scheduler(Clock clock) : clock_(clock) {}

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /*
     * Bind a task to its slot. period_us = 0 for purely event-driven tasks.
     * First timer signal fires one period after now_us. Signals raised
     * before binding stay latched and are delivered on the first pass.
     * Returns false if the slot is already bound.
     */
    bool add_task(TaskId id, const char *name, Task &task,
                  uint32_t period_us, uint64_t now_us);

    /* Wake a task. Safe from interrupt context. */
    void signal(TaskId id, uint32_t signals);

    /*
     * One dispatch pass: promote expired timers, then run every task with
     * pending signals in priority order. Returns the number of tasks run.
     */
    uint32_t run_once(uint64_t now_us);

    /* True if any bound task has undelivered signals. */
    bool has_pending() const;

    /* Earliest periodic deadline, UINT64_MAX if none. */
    uint64_t next_deadline_us() const;

    TaskStats stats(TaskId id) const;
    const char *name(TaskId id) const;

private:
    struct TaskSlot {
        const char *name = nullptr;
        Task *task = nullptr;
        uint32_t period_us = 0;
        uint64_t next_deadline_us = 0;
        volatile uint32_t pending = 0;
        TaskStats stats;
    };

    uint32_t take_pending(TaskSlot &slot);
    void promote_timer(TaskSlot &slot, uint64_t now_us);

    Clock clock_;
    TaskSlot slots_[TASK_COUNT];
};

#endif // SCHEDULER_HPP
