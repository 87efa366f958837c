#include <gtest/gtest.h>

#include "rate_controller.hpp"
#include "test_helpers.hpp"

using namespace prefixcrawl;
using test_utils::CapturedLog;

TEST(RateControllerTest, InitialDelayIsClamped) {
    CapturedLog cl;
    RateController low(0.1, 0.8, 3.0, cl.log);
    RateController high(9.0, 0.8, 3.0, cl.log);

    EXPECT_DOUBLE_EQ(low.delay(), 0.8);
    EXPECT_DOUBLE_EQ(high.delay(), 3.0);
}

TEST(RateControllerTest, FailureGrowsDelayUpToMax) {
    CapturedLog cl;
    RateController rc(1.0, 0.8, 3.0, cl.log);

    rc.report_failure();
    EXPECT_DOUBLE_EQ(rc.delay(), 1.5);
    rc.report_failure();
    EXPECT_DOUBLE_EQ(rc.delay(), 2.25);
    rc.report_failure();
    EXPECT_DOUBLE_EQ(rc.delay(), 3.0);

    auto s = rc.snapshot();
    EXPECT_EQ(s.total_failure, 3u);
    EXPECT_EQ(s.rolling_failure, 3u);
    EXPECT_EQ(s.rolling_success, 0u);
}

TEST(RateControllerTest, ZeroDelayStillBacksOff) {
    CapturedLog cl;
    RateController rc(0.0, 0.0, 3.0, cl.log);

    rc.report_failure();
    EXPECT_DOUBLE_EQ(rc.delay(), RateController::kGrowFloor * RateController::kGrowFactor);
    rc.report_failure();
    EXPECT_GT(rc.delay(), RateController::kGrowFloor * RateController::kGrowFactor);

    RateController pinned(0.0, 0.0, 0.0, cl.log);
    pinned.report_failure();
    EXPECT_DOUBLE_EQ(pinned.delay(), 0.0);
}

TEST(RateControllerTest, DecaysOnlyAfterEnoughSuccesses) {
    CapturedLog cl;
    RateController rc(2.0, 0.8, 3.0, cl.log);

    for (int i = 0; i < 30; i++) rc.report_success();
    EXPECT_DOUBLE_EQ(rc.delay(), 2.0);

    rc.report_success();
    EXPECT_DOUBLE_EQ(rc.delay(), 2.0 * RateController::kDecayFactor);

    auto s = rc.snapshot();
    EXPECT_EQ(s.rolling_success, RateController::kRetainedSuccesses);
    EXPECT_EQ(s.rolling_failure, RateController::kRetainedFailures);
    EXPECT_EQ(s.total_success, 31u);
}

TEST(RateControllerTest, DelayNeverDropsBelowMin) {
    CapturedLog cl;
    RateController rc(0.81, 0.8, 3.0, cl.log);

    for (int i = 0; i < 500; i++) rc.report_success();
    EXPECT_DOUBLE_EQ(rc.delay(), 0.8);
}

TEST(RateControllerTest, FailureResetsRollingSuccess) {
    CapturedLog cl;
    RateController rc(1.0, 0.8, 3.0, cl.log);

    for (int i = 0; i < 20; i++) rc.report_success();
    rc.report_failure();
    for (int i = 0; i < 30; i++) rc.report_success();

    // 30 rolling successes is not above the sample threshold.
    EXPECT_DOUBLE_EQ(rc.delay(), 1.5);
}

TEST(RateControllerTest, DeepPrefixesWaitLess) {
    CapturedLog cl;
    RateController rc(2.0, 0.8, 3.0, cl.log);

    EXPECT_DOUBLE_EQ(rc.delay_for(3), 2.0);
    EXPECT_DOUBLE_EQ(rc.delay_for(4), 1.6);

    RateController floor(0.9, 0.8, 3.0, cl.log);
    EXPECT_DOUBLE_EQ(floor.delay_for(6), 0.8);
}

TEST(RateControllerTest, LogsDelayChanges) {
    CapturedLog cl(Log::Level::Info);
    RateController rc(1.0, 0.8, 3.0, cl.log);

    rc.report_failure();
    EXPECT_NE(cl.text().find("Increased delay to 1.50s"), std::string::npos);
}
