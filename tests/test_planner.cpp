#include "planner.h"

#include <gtest/gtest.h>

#include <cmath>

TEST(Sip, KnownFutureValue) {
    EXPECT_NEAR(sipFutureValue(1000, 12, 1), 12809.33, 0.005);
    EXPECT_EQ(sipPeriods(1), 12);
    EXPECT_EQ(sipPeriods(2.55), 30);
    EXPECT_NEAR(sipMonthlyRate(12), 0.01, 1e-15);
}

TEST(Sip, ZeroRateIsLinear) {
    EXPECT_DOUBLE_EQ(sipFutureValue(500, 0, 2), 500.0 * 24);
    EXPECT_DOUBLE_EQ(sipRequiredMonthly(12000, 0, 1), 1000.0);
}

TEST(Sip, RequiredMonthlyInvertsFutureValue) {
    for (double rate : {0.0, 6.5, 12.0, 18.0}) {
        for (double years : {1.0, 5.0, 10.25}) {
            double goal = 1000000.0;
            double p = sipRequiredMonthly(goal, rate, years);
            EXPECT_NEAR(sipFutureValue(p, rate, years), goal, 1e-6 * goal) << rate << " " << years;
        }
    }
}

TEST(Sip, BuildsPlanWithOptionalGoal) {
    SipPlan plan;
    ASSERT_TRUE(tryBuildSipPlan("1000", "12", "1", "", plan));
    EXPECT_EQ(plan.periods, 12);
    EXPECT_FALSE(plan.hasGoal);
    EXPECT_NEAR(plan.futureValue, 12809.33, 0.005);

    ASSERT_TRUE(tryBuildSipPlan(" 2000 ", "10", "10", "500000", plan));
    EXPECT_TRUE(plan.hasGoal);
    EXPECT_EQ(plan.periods, 120);
    EXPECT_NEAR(sipFutureValue(plan.requiredMonthly, 10, 10), 500000.0, 1e-3);

    // negative rates are allowed
    EXPECT_TRUE(tryBuildSipPlan("100", "-2", "1", "", plan));
}

TEST(Sip, RejectsInvalidInput) {
    SipPlan plan;
    plan.monthly = 42;
    EXPECT_FALSE(tryBuildSipPlan("-1", "12", "10", "", plan));
    EXPECT_FALSE(tryBuildSipPlan("100", "12", "0", "", plan));
    EXPECT_FALSE(tryBuildSipPlan("100", "12", "-3", "", plan));
    EXPECT_FALSE(tryBuildSipPlan("abc", "12", "10", "", plan));
    EXPECT_FALSE(tryBuildSipPlan("100", "twelve", "10", "", plan));
    EXPECT_FALSE(tryBuildSipPlan("100", "12", "10", "lots", plan));
    EXPECT_DOUBLE_EQ(plan.monthly, 42.0);
}

TEST(Sip, UnderOneMonthPlansZeroPeriods) {
    SipPlan plan;
    ASSERT_TRUE(tryBuildSipPlan("100", "12", "0.05", "", plan));
    EXPECT_EQ(plan.periods, 0);
    EXPECT_DOUBLE_EQ(plan.futureValue, 0.0);

    ASSERT_TRUE(tryBuildSipPlan("100", "0", "0.05", "5000", plan));
    EXPECT_DOUBLE_EQ(plan.futureValue, 0.0);
    EXPECT_FALSE(plan.hasGoal);
    EXPECT_DOUBLE_EQ(plan.requiredMonthly, 0.0);
}

TEST(Sip, ZeroContributionStaysZeroWhenGrowthOverflows) {
    SipPlan plan;
    ASSERT_TRUE(tryBuildSipPlan("0", "100", "1000", "", plan));
    EXPECT_DOUBLE_EQ(plan.futureValue, 0.0);
    EXPECT_DOUBLE_EQ(sipFutureValue(0, 100, 1000), 0.0);

    ASSERT_TRUE(tryBuildSipPlan("100", "100", "1000", "", plan));
    EXPECT_TRUE(std::isinf(plan.futureValue));
}
