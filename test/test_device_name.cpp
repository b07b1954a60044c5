/*
 * Unit tests for GAP device name truncation (UTF-8 safe)
 */

#include <gtest/gtest.h>
#include <cstring>
#include "logic/device_name.hpp"
#include "config.h"

// ============================================================================
// Test Suite: DeviceName_Truncate
// ============================================================================

TEST(DeviceName_Truncate, ShortNameUnchanged) {
    EXPECT_EQ(utf8_truncated_length("Lookpoint", 19), 9U);
}

TEST(DeviceName_Truncate, AsciiCutAtLimit) {
    EXPECT_EQ(utf8_truncated_length("ABCDEFGHIJKLMNOPQRSTUVWXYZ", 19), 19U);
}

TEST(DeviceName_Truncate, ExactFit) {
    EXPECT_EQ(utf8_truncated_length("ABCDEFGHIJKLMNOPQRS", 19), 19U);
}

TEST(DeviceName_Truncate, DoesNotSplitTwoByteCodePoint) {
    /* 18 ASCII + U+00E9 (2 bytes) = 20 bytes; cut would land mid code point */
    const char *name = "ABCDEFGHIJKLMNOPQR\xC3\xA9";
    EXPECT_EQ(utf8_truncated_length(name, 19), 18U);
}

TEST(DeviceName_Truncate, DoesNotSplitFourByteCodePoint) {
    /* 17 ASCII + U+1F3AF (4 bytes) = 21 bytes */
    const char *name = "ABCDEFGHIJKLMNOPQ\xF0\x9F\x8E\xAF";
    EXPECT_EQ(utf8_truncated_length(name, 19), 17U);
    EXPECT_EQ(utf8_truncated_length(name, 21), 21U);
}

TEST(DeviceName_Truncate, MultiByteNameFitsWhole) {
    /* U+00C5 U+00C4 U+00D6 = 6 bytes */
    EXPECT_EQ(utf8_truncated_length("\xC3\x85\xC3\x84\xC3\x96", 6), 6U);
    EXPECT_EQ(utf8_truncated_length("\xC3\x85\xC3\x84\xC3\x96", 5), 4U);
}

// ============================================================================
// Test Suite: DeviceName_Fit
// ============================================================================

TEST(DeviceName_Fit, DefaultNameFits) {
    char out[DEVICE_NAME_MAX_LEN + 1];
    EXPECT_FALSE(device_name_fit(DEVICE_NAME, DEVICE_NAME_MAX_LEN, out, sizeof(out)));
    EXPECT_STREQ(out, DEVICE_NAME);
}

TEST(DeviceName_Fit, LongNameTruncatedAndTerminated) {
    char out[DEVICE_NAME_MAX_LEN + 1];
    memset(out, 'x', sizeof(out));

    EXPECT_TRUE(device_name_fit("Lookpoint Tracker Pro Max", DEVICE_NAME_MAX_LEN, out, sizeof(out)));
    EXPECT_EQ(strlen(out), DEVICE_NAME_MAX_LEN);
    EXPECT_STREQ(out, "Lookpoint Tracker P");
}

TEST(DeviceName_Fit, SmallBufferBoundsLength) {
    char out[5];
    EXPECT_TRUE(device_name_fit("Lookpoint", DEVICE_NAME_MAX_LEN, out, sizeof(out)));
    EXPECT_STREQ(out, "Look");
}

TEST(DeviceName_Fit, EmptyName) {
    char out[4] = {'a', 'b', 'c', 'd'};
    EXPECT_FALSE(device_name_fit("", DEVICE_NAME_MAX_LEN, out, sizeof(out)));
    EXPECT_STREQ(out, "");
}
