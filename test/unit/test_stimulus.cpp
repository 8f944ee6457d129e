// Included first: the header compiles on its own.
#include <dendra/stimulus.hpp>

#include <gtest/gtest.h>

#include "common.hpp"

using namespace dendra;

TEST(stimulus, trivial) {
    i_clamp none;
    EXPECT_EQ(0., none.current(0.));
    EXPECT_EQ(0., none.current(100.));

    i_clamp constant(0.3);
    EXPECT_EQ(0., constant.current(-1.));
    EXPECT_EQ(0.3, constant.current(0.));
    EXPECT_EQ(0.3, constant.current(1e6));
}

TEST(stimulus, box) {
    auto stim = i_clamp::box(1., 2., 0.5);

    EXPECT_EQ(0.,  stim.current(0.));
    EXPECT_EQ(0.,  stim.current(0.999));
    EXPECT_EQ(0.5, stim.current(1.));
    EXPECT_EQ(0.5, stim.current(2.));
    EXPECT_EQ(0.5, stim.current(2.999));

    // Switched off at onset+duration.
    EXPECT_EQ(0.,  stim.current(3.));
    EXPECT_EQ(0.,  stim.current(10.));
}

TEST(stimulus, envelope) {
    i_clamp ramp({{1., 0.}, {3., 1.}, {4., -1.}});

    EXPECT_EQ(0., ramp.current(0.5));
    EXPECT_EQ(0., ramp.current(1.));
    EXPECT_DOUBLE_EQ(0.25, ramp.current(1.5));
    EXPECT_DOUBLE_EQ(1., ramp.current(3.));
    EXPECT_DOUBLE_EQ(0., ramp.current(3.5));

    // Holds the last amplitude.
    EXPECT_EQ(-1., ramp.current(4.));
    EXPECT_EQ(-1., ramp.current(40.));
}
