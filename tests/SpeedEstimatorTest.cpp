/**
 * SpeedEstimatorTest.cpp
 */

#include "core/transfer/SpeedEstimator.hpp"

#include <gtest/gtest.h>

#include <cmath>

using fetchkit::core::transfer::SpeedEstimator;
using namespace std::chrono_literals;

namespace {

SpeedEstimator::Clock::time_point at(std::chrono::milliseconds offset) {
    static const auto origin = SpeedEstimator::Clock::now();
    return origin + offset;
}

} // namespace

TEST(SpeedEstimatorTest, NoSpeedWithFewerThanTwoSamples) {
    SpeedEstimator estimator;
    EXPECT_FALSE(estimator.speed().has_value());

    estimator.sample(at(100ms), 1000, 0.1);
    EXPECT_EQ(estimator.sampleCount(), 1u);
    EXPECT_FALSE(estimator.speed().has_value());
    EXPECT_FALSE(estimator.eta(10000, 1000).has_value());
}

TEST(SpeedEstimatorTest, SpeedIsMeanOfRates) {
    SpeedEstimator estimator;
    estimator.sample(at(100ms), 1000, 0.1);  // 10000 B/s
    estimator.sample(at(200ms), 3000, 0.1);  // 30000 B/s

    auto speed = estimator.speed();
    ASSERT_TRUE(speed.has_value());
    EXPECT_DOUBLE_EQ(*speed, 20000.0);
    EXPECT_TRUE(std::isfinite(*speed));
}

TEST(SpeedEstimatorTest, ZeroDurationSamplesAreSkipped) {
    SpeedEstimator estimator;
    estimator.sample(at(100ms), 1000, 0.0);
    estimator.sample(at(100ms), 1000, -1.0);
    EXPECT_EQ(estimator.sampleCount(), 0u);
}

TEST(SpeedEstimatorTest, OldSamplesAreEvicted) {
    SpeedEstimator estimator(1000ms);
    estimator.sample(at(0ms), 100, 0.1);
    estimator.sample(at(500ms), 200, 0.1);
    EXPECT_EQ(estimator.sampleCount(), 2u);

    // Cutoff is 1500ms - 1000ms = 500ms; both earlier samples fall out
    estimator.sample(at(1500ms), 500, 0.1);
    EXPECT_EQ(estimator.sampleCount(), 1u);
    EXPECT_FALSE(estimator.speed().has_value());

    estimator.sample(at(1600ms), 700, 0.1);
    ASSERT_TRUE(estimator.speed().has_value());
    EXPECT_DOUBLE_EQ(*estimator.speed(), 6000.0);
}

TEST(SpeedEstimatorTest, EtaUsesRemainingBytes) {
    SpeedEstimator estimator;
    estimator.sample(at(100ms), 100, 0.1);
    estimator.sample(at(200ms), 100, 0.1);

    auto eta = estimator.eta(5000, 3000);
    ASSERT_TRUE(eta.has_value());
    EXPECT_DOUBLE_EQ(*eta, 2.0);

    EXPECT_FALSE(estimator.eta(0, 3000).has_value());
    EXPECT_DOUBLE_EQ(estimator.eta(5000, 5000).value_or(-1.0), 0.0);
}

TEST(SpeedEstimatorTest, EtaEmptyWhenStalled) {
    SpeedEstimator estimator;
    estimator.sample(at(100ms), 0, 0.1);
    estimator.sample(at(200ms), 0, 0.1);

    EXPECT_DOUBLE_EQ(estimator.speed().value_or(-1.0), 0.0);
    EXPECT_FALSE(estimator.eta(5000, 1000).has_value());
}

TEST(SpeedEstimatorTest, ResetClearsSamples) {
    SpeedEstimator estimator;
    estimator.sample(at(100ms), 100, 0.1);
    estimator.sample(at(200ms), 100, 0.1);
    estimator.reset();

    EXPECT_EQ(estimator.sampleCount(), 0u);
    EXPECT_FALSE(estimator.speed().has_value());
}
