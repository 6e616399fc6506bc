/**
 * RetryPolicyTest.cpp
 */

#include "core/transfer/RetryPolicy.hpp"

#include <gtest/gtest.h>

using fetchkit::core::transfer::RetryPolicy;
using namespace std::chrono_literals;

TEST(RetryPolicyTest, DefaultsToThreeRetriesWithFixedDelay) {
    RetryPolicy policy;

    EXPECT_EQ(policy.settings().maxRetries, 3);
    EXPECT_EQ(policy.delayFor(1), 2000ms);
    EXPECT_EQ(policy.delayFor(2), 2000ms);
    EXPECT_EQ(policy.delayFor(5), 2000ms);
}

TEST(RetryPolicyTest, BudgetIsExhaustedAtMaxRetries) {
    EXPECT_TRUE(RetryPolicy::hasBudget(0, 2));
    EXPECT_TRUE(RetryPolicy::hasBudget(1, 2));
    EXPECT_FALSE(RetryPolicy::hasBudget(2, 2));
    EXPECT_FALSE(RetryPolicy::hasBudget(0, 0));
}

TEST(RetryPolicyTest, AutomaticRetryCanBeDisabled) {
    RetryPolicy::Settings settings;
    settings.automatic = false;
    RetryPolicy policy(settings);

    EXPECT_FALSE(policy.shouldRetryAutomatically(0, 3));
    EXPECT_TRUE(RetryPolicy::hasBudget(0, 3));
}

TEST(RetryPolicyTest, BackoffIsCappedAtMaxDelay) {
    RetryPolicy::Settings settings;
    settings.delay = 100ms;
    settings.backoffMultiplier = 2.0;
    settings.maxDelay = 350ms;
    RetryPolicy policy(settings);

    EXPECT_EQ(policy.delayFor(1), 100ms);
    EXPECT_EQ(policy.delayFor(2), 200ms);
    EXPECT_EQ(policy.delayFor(3), 350ms);
    EXPECT_EQ(policy.delayFor(10), 350ms);
}

TEST(RetryPolicyTest, InvalidSettingsAreClamped) {
    RetryPolicy::Settings settings;
    settings.maxRetries = -4;
    settings.delay = -5ms;
    settings.backoffMultiplier = 0.5;
    RetryPolicy policy(settings);

    EXPECT_EQ(policy.settings().maxRetries, 0);
    EXPECT_EQ(policy.settings().delay, 0ms);
    EXPECT_DOUBLE_EQ(policy.settings().backoffMultiplier, 1.0);
}
