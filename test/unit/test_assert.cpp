// Assertions are compiled in here whatever the build configuration.
#ifndef DENDRA_HAVE_ASSERTIONS
#define DENDRA_HAVE_ASSERTIONS
#endif

#include <gtest/gtest.h>

#include <dendra/assert.hpp>

TEST(assert, passes) {
    int n = 0;
    dendra_assert(++n==1);
    EXPECT_EQ(1, n);
}

TEST(assert, aborts_on_failure) {
    EXPECT_DEATH(dendra_assert(false), "assertion 'false' failed");
}
