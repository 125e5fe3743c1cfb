#include "present/focus_hold.hpp"

#include <gtest/gtest.h>

using namespace screen_mirror;

TEST(FocusHold, TakesOnceAndRestoresPreviousOwner) {
    FocusHold hold;
    EXPECT_TRUE(hold.take(0x400001, 0x200005));
    EXPECT_TRUE(hold.is_held());

    // Repeated enter events while held keep the first owner
    EXPECT_FALSE(hold.take(0x400001, 0x400001));

    uint32_t restore = 1234;
    ASSERT_TRUE(hold.release(restore));
    EXPECT_EQ(restore, 0x200005u);
    EXPECT_FALSE(hold.is_held());
}

TEST(FocusHold, ReleaseWithoutTakeDoesNothing) {
    FocusHold hold;
    uint32_t restore = 77;
    EXPECT_FALSE(hold.release(restore));
    EXPECT_EQ(restore, 77u);
}

TEST(FocusHold, SecondReleaseIsNoOp) {
    FocusHold hold;
    ASSERT_TRUE(hold.take(0x400001, 0x200005));
    uint32_t restore = 0;
    ASSERT_TRUE(hold.release(restore));

    // Leave followed by close
    restore = 99;
    EXPECT_FALSE(hold.release(restore));
    EXPECT_EQ(restore, 99u);
}

TEST(FocusHold, OwnWindowIsNotRestored) {
    FocusHold hold;
    ASSERT_TRUE(hold.take(0x400001, 0x400001));
    uint32_t restore = 5;
    ASSERT_TRUE(hold.release(restore));
    EXPECT_EQ(restore, 0u);
}

TEST(FocusHold, CanBeTakenAgainAfterRelease) {
    FocusHold hold;
    uint32_t restore = 0;
    ASSERT_TRUE(hold.take(0x400001, 0x200005));
    ASSERT_TRUE(hold.release(restore));

    ASSERT_TRUE(hold.take(0x400001, 0x300009));
    ASSERT_TRUE(hold.release(restore));
    EXPECT_EQ(restore, 0x300009u);
}
