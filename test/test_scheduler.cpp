/*
 * Unit tests for the cooperative scheduler
 * Task binding, signal delivery, priority order, periodic timers, overruns
 */

#include <gtest/gtest.h>
#include <vector>
#include "logic/scheduler.hpp"
#include "test/platform_stubs.hpp"

static uint64_t g_fake_now_us = 0;

static uint64_t fake_clock() {
    return g_fake_now_us;
}

/* Records every run() call; optionally advances the fake clock to simulate work */
class Recording_Task : public Task {
public:
    Recording_Task(std::vector<int> &order, int id, uint64_t cost_us = 0)
        : order_(order), id_(id), cost_us_(cost_us) {}

    void run(uint32_t signals, uint64_t now_us) override {
        order_.push_back(id_);
        last_signals = signals;
        last_now_us = now_us;
        runs++;
        g_fake_now_us += cost_us_;
    }

    uint32_t last_signals = 0;
    uint64_t last_now_us = 0;
    uint32_t runs = 0;

private:
    std::vector<int> &order_;
    int id_;
    uint64_t cost_us_;
};

// ============================================================================
// Test Suite: Scheduler_Binding
// ============================================================================

TEST(Scheduler_Binding, SlotCanOnlyBeBoundOnce) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Recording_Task b(order, 1);
    Scheduler sched(fake_clock);

    EXPECT_TRUE(sched.add_task(TaskId::Sampler, "sampler", a, 10000, 0));
    EXPECT_FALSE(sched.add_task(TaskId::Sampler, "other", b, 10000, 0));
    EXPECT_STREQ(sched.name(TaskId::Sampler), "sampler");
}

TEST(Scheduler_Binding, UnboundSlotHasPlaceholderName) {
    Scheduler sched(fake_clock);
    EXPECT_STREQ(sched.name(TaskId::Battery), "?");
}

TEST(Scheduler_Binding, OutOfRangeIdRejected) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);

    EXPECT_FALSE(sched.add_task(TaskId::Count, "bad", a, 0, 0));
}

TEST(Scheduler_Binding, NoDeadlineWithoutPeriodicTasks) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Fusion, "fusion", a, 0, 0);

    EXPECT_EQ(sched.next_deadline_us(), UINT64_MAX);
}

// ============================================================================
// Test Suite: Scheduler_Signals
// ============================================================================

TEST(Scheduler_Signals, IdleTaskDoesNotRun) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Fusion, "fusion", a, 0, 0);

    EXPECT_EQ(sched.run_once(1000), 0U);
    EXPECT_EQ(a.runs, 0U);
    EXPECT_FALSE(sched.has_pending());
}

TEST(Scheduler_Signals, SignalsAccumulateUntilRun) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Connection, "conn", a, 0, 0);

    sched.signal(TaskId::Connection, SIGNAL_LINK_EVENT);
    sched.signal(TaskId::Connection, SIGNAL_LINK_EVENT);
    sched.signal(TaskId::Connection, SIGNAL_TIMER);
    EXPECT_TRUE(sched.has_pending());

    EXPECT_EQ(sched.run_once(0), 1U);
    EXPECT_EQ(a.runs, 1U);
    EXPECT_EQ(a.last_signals, SIGNAL_LINK_EVENT | SIGNAL_TIMER);
    EXPECT_FALSE(sched.has_pending());
}

TEST(Scheduler_Signals, SignalToUnboundSlotIsIgnored) {
    Scheduler sched(fake_clock);
    sched.signal(TaskId::Notifier, SIGNAL_FUSED_SAMPLE);
    EXPECT_FALSE(sched.has_pending());
    EXPECT_EQ(sched.run_once(0), 0U);
}

TEST(Scheduler_Signals, SignalBeforeBindDeliveredOnFirstPass) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);

    /* Link event raised by the radio before the Connection task exists */
    sched.signal(TaskId::Connection, SIGNAL_LINK_EVENT);
    ASSERT_TRUE(sched.add_task(TaskId::Connection, "conn", a, 100000, 0));

    EXPECT_TRUE(sched.has_pending());
    EXPECT_EQ(sched.run_once(0), 1U);
    EXPECT_EQ(a.last_signals, SIGNAL_LINK_EVENT);
}

TEST(Scheduler_Signals, SignalTakesCriticalSection) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Fusion, "fusion", a, 0, 0);

    stub_reset_critical_sections();
    sched.signal(TaskId::Fusion, SIGNAL_RAW_SAMPLE);
    EXPECT_GE(stub_critical_sections_entered(), 1U);
    EXPECT_EQ(stub_critical_section_depth(), 0);
}

TEST(Scheduler_Signals, RunsInPriorityOrder) {
    std::vector<int> order;
    Recording_Task conn(order, 0);
    Recording_Task sampler(order, 1);
    Recording_Task fusion(order, 2);
    Recording_Task notifier(order, 3);
    Scheduler sched(fake_clock);

    /* Bind out of order: dispatch follows TaskId, not insertion */
    sched.add_task(TaskId::Notifier, "notifier", notifier, 0, 0);
    sched.add_task(TaskId::Fusion, "fusion", fusion, 0, 0);
    sched.add_task(TaskId::Sampler, "sampler", sampler, 0, 0);
    sched.add_task(TaskId::Connection, "conn", conn, 0, 0);

    sched.signal(TaskId::Notifier, SIGNAL_FUSED_SAMPLE);
    sched.signal(TaskId::Sampler, SIGNAL_TIMER);
    sched.signal(TaskId::Connection, SIGNAL_LINK_EVENT);
    sched.signal(TaskId::Fusion, SIGNAL_RAW_SAMPLE);

    EXPECT_EQ(sched.run_once(0), 4U);
    std::vector<int> expected = {0, 1, 2, 3};
    EXPECT_EQ(order, expected);
}

/* A task that signals a later task gets it run in the same pass */
class Chaining_Task : public Task {
public:
    Chaining_Task(Scheduler &sched, TaskId next, uint32_t signal)
        : sched_(sched), next_(next), signal_(signal) {}

    void run(uint32_t, uint64_t) override {
        sched_.signal(next_, signal_);
    }

private:
    Scheduler &sched_;
    TaskId next_;
    uint32_t signal_;
};

TEST(Scheduler_Signals, DownstreamTaskRunsInSamePass) {
    std::vector<int> order;
    Scheduler sched(fake_clock);
    Chaining_Task sampler(sched, TaskId::Fusion, SIGNAL_RAW_SAMPLE);
    Recording_Task fusion(order, 2);
    sched.add_task(TaskId::Sampler, "sampler", sampler, 0, 0);
    sched.add_task(TaskId::Fusion, "fusion", fusion, 0, 0);

    sched.signal(TaskId::Sampler, SIGNAL_TIMER);
    EXPECT_EQ(sched.run_once(0), 2U);
    EXPECT_EQ(fusion.last_signals, SIGNAL_RAW_SAMPLE);
}

// ============================================================================
// Test Suite: Scheduler_Timers
// ============================================================================

TEST(Scheduler_Timers, FirstTimerOnePeriodAfterBind) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Sampler, "sampler", a, 10000, 5000);

    EXPECT_EQ(sched.next_deadline_us(), 15000U);
    EXPECT_EQ(sched.run_once(14999), 0U);
    EXPECT_EQ(sched.run_once(15000), 1U);
    EXPECT_EQ(a.last_signals, SIGNAL_TIMER);
    EXPECT_EQ(a.last_now_us, 15000U);
    EXPECT_EQ(sched.next_deadline_us(), 25000U);
}

TEST(Scheduler_Timers, CadenceDoesNotDriftWithJitter) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Sampler, "sampler", a, 10000, 0);

    /* Dispatched 3ms late: next deadline still on the 10ms grid */
    sched.run_once(13000);
    EXPECT_EQ(sched.next_deadline_us(), 20000U);
    EXPECT_EQ(sched.stats(TaskId::Sampler).overruns, 0U);
}

TEST(Scheduler_Timers, MissedPeriodsCountedAsOverruns) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Sampler, "sampler", a, 10000, 0);

    /* Deadlines at 10, 20, 30, 40ms: only one run, three missed */
    EXPECT_EQ(sched.run_once(45000), 1U);
    EXPECT_EQ(a.runs, 1U);
    EXPECT_EQ(sched.stats(TaskId::Sampler).overruns, 3U);
    EXPECT_EQ(sched.next_deadline_us(), 50000U);
}

TEST(Scheduler_Timers, EarliestDeadlineAcrossTasks) {
    std::vector<int> order;
    Recording_Task a(order, 0);
    Recording_Task b(order, 1);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Battery, "battery", a, 1000000, 0);
    sched.add_task(TaskId::Sampler, "sampler", b, 10000, 0);

    EXPECT_EQ(sched.next_deadline_us(), 10000U);
}

// ============================================================================
// Test Suite: Scheduler_Stats
// ============================================================================

TEST(Scheduler_Stats, RunTimeMeasuredWithClock) {
    std::vector<int> order;
    Recording_Task slow(order, 0, 750);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Fusion, "fusion", slow, 0, 0);

    g_fake_now_us = 0;
    sched.signal(TaskId::Fusion, SIGNAL_RAW_SAMPLE);
    sched.run_once(0);

    TaskStats stats = sched.stats(TaskId::Fusion);
    EXPECT_EQ(stats.runs, 1U);
    EXPECT_EQ(stats.last_run_us, 750U);
    EXPECT_EQ(stats.max_run_us, 750U);
}

TEST(Scheduler_Stats, MaxRunTimeIsKept) {
    std::vector<int> order;
    Recording_Task slow(order, 0, 900);
    Scheduler sched(fake_clock);
    sched.add_task(TaskId::Fusion, "fusion", slow, 0, 0);

    g_fake_now_us = 0;
    sched.signal(TaskId::Fusion, SIGNAL_RAW_SAMPLE);
    sched.run_once(0);

    Recording_Task fast(order, 1, 100);
    Scheduler sched2(fake_clock);
    sched2.add_task(TaskId::Fusion, "fusion", fast, 0, 0);
    sched2.signal(TaskId::Fusion, SIGNAL_RAW_SAMPLE);
    sched2.run_once(0);

    EXPECT_EQ(sched.stats(TaskId::Fusion).max_run_us, 900U);
    EXPECT_EQ(sched2.stats(TaskId::Fusion).max_run_us, 100U);
}
