/*
 * Unit tests for the single-slot overwrite mailbox
 */

#include <gtest/gtest.h>
#include "logic/mailbox.hpp"
#include "types.h"
#include "test/platform_stubs.hpp"

// ============================================================================
// Test Suite: Mailbox_Handoff
// ============================================================================

TEST(Mailbox_Handoff, EmptyTakeFails) {
    Mailbox<int> box;
    int v = 42;
    EXPECT_FALSE(box.take(&v));
    EXPECT_EQ(v, 42);
    EXPECT_FALSE(box.full());
}

TEST(Mailbox_Handoff, PostThenTake) {
    Mailbox<int> box;
    EXPECT_FALSE(box.post(7));
    EXPECT_TRUE(box.full());

    int v = 0;
    EXPECT_TRUE(box.take(&v));
    EXPECT_EQ(v, 7);
    EXPECT_FALSE(box.full());
    EXPECT_FALSE(box.take(&v));
}

TEST(Mailbox_Handoff, NewestValueWins) {
    Mailbox<int> box;
    box.post(1);
    EXPECT_TRUE(box.post(2));
    EXPECT_TRUE(box.post(3));

    int v = 0;
    EXPECT_TRUE(box.take(&v));
    EXPECT_EQ(v, 3);
    EXPECT_EQ(box.overwritten(), 2U);
}

TEST(Mailbox_Handoff, ClearDiscardsUnread) {
    Mailbox<int> box;
    box.post(5);
    box.clear();

    int v = 0;
    EXPECT_FALSE(box.take(&v));
    EXPECT_EQ(box.overwritten(), 0U);
}

TEST(Mailbox_Handoff, CarriesWholeSample) {
    Mailbox<OrientationSample> box;
    OrientationSample s;
    s.sequence = 99;
    s.timestamp_us = 123456;
    s.q = {0.5f, 0.5f, 0.5f, 0.5f};
    s.flags = ORIENT_FLAG_VALID | ORIENT_FLAG_HELD;
    box.post(s);

    OrientationSample out;
    ASSERT_TRUE(box.take(&out));
    EXPECT_EQ(out.sequence, 99U);
    EXPECT_EQ(out.timestamp_us, 123456U);
    EXPECT_FLOAT_EQ(out.q.z, 0.5f);
    EXPECT_EQ(out.flags, ORIENT_FLAG_VALID | ORIENT_FLAG_HELD);
}

TEST(Mailbox_Handoff, AccessIsGuarded) {
    Mailbox<int> box;
    stub_reset_critical_sections();

    box.post(1);
    int v = 0;
    box.take(&v);

    EXPECT_EQ(stub_critical_sections_entered(), 2U);
    EXPECT_EQ(stub_critical_section_depth(), 0);
}
