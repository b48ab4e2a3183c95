#include <gtest/gtest.h>
#include "canslim_bt/indicators/rolling_window.hpp"

using namespace canslim_bt;

class RollingWindowTest : public ::testing::Test {};

TEST_F(RollingWindowTest, SumUsesPartialWindowsThenSlides) {
    RollingSum sum(3);
    EXPECT_DOUBLE_EQ(sum.push(1.0), 1.0);
    EXPECT_DOUBLE_EQ(sum.push(2.0), 3.0);
    EXPECT_DOUBLE_EQ(sum.push(3.0), 6.0);
    EXPECT_DOUBLE_EQ(sum.push(4.0), 9.0);
    EXPECT_EQ(sum.count(), 3u);

    sum.reset();
    EXPECT_EQ(sum.count(), 0u);
    EXPECT_DOUBLE_EQ(sum.push(5.0), 5.0);
}

TEST_F(RollingWindowTest, MeanOfAvailableValues) {
    RollingMean mean(4);
    EXPECT_DOUBLE_EQ(mean.mean(), 0.0);
    EXPECT_DOUBLE_EQ(mean.push(10.0), 10.0);
    EXPECT_DOUBLE_EQ(mean.push(20.0), 15.0);
    mean.push(30.0);
    mean.push(40.0);
    EXPECT_DOUBLE_EQ(mean.push(50.0), 35.0);
}

TEST_F(RollingWindowTest, MaxDropsExpiredValues) {
    RollingMax max(3);
    EXPECT_DOUBLE_EQ(max.push(5.0), 5.0);
    EXPECT_DOUBLE_EQ(max.push(3.0), 5.0);
    EXPECT_DOUBLE_EQ(max.push(4.0), 5.0);
    // 5.0 leaves the window
    EXPECT_DOUBLE_EQ(max.push(1.0), 4.0);
    EXPECT_DOUBLE_EQ(max.push(2.0), 4.0);
    EXPECT_DOUBLE_EQ(max.push(0.5), 2.0);
    EXPECT_DOUBLE_EQ(max.push(7.0), 7.0);
}

TEST_F(RollingWindowTest, ZeroWindowActsAsOne) {
    RollingMax max(0);
    max.push(9.0);
    EXPECT_DOUBLE_EQ(max.push(1.0), 1.0);

    RollingSum sum(0);
    sum.push(9.0);
    EXPECT_DOUBLE_EQ(sum.push(1.0), 1.0);
}
