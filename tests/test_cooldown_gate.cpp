/**
 * @file test_cooldown_gate.cpp
 * @brief Unit tests for CooldownGate
 */

#include <gtest/gtest.h>
#include <fingerlaunch/gesture/CooldownGate.hpp>
#include <fingerlaunch/core/exception.h>

#include <limits>

using namespace fingerlaunch;
using namespace fingerlaunch::gesture;

namespace {

/// Timestamp s seconds after the clock epoch
Timestamp at(double s) {
    return Timestamp(std::chrono::round<Clock::duration>(Seconds(s)));
}

} // namespace

TEST(CooldownGateTest, AllowsBeforeFirstTrigger) {
    CooldownGate gate(3.0);
    EXPECT_TRUE(gate.allow(at(0.0)));
    EXPECT_TRUE(gate.allow(at(1000.0)));
    EXPECT_FALSE(gate.lastTriggerTime().has_value());
    EXPECT_DOUBLE_EQ(gate.remainingSeconds(at(0.0)), 0.0);
}

/**
 * After record(t0): false for t < t0 + cooldown, true for t >= t0 + cooldown
 */
TEST(CooldownGateTest, Monotonicity) {
    CooldownGate gate(2.0);
    const double t0 = 10.0;
    gate.record(at(t0));

    for (double dt = 0.0; dt < 2.0; dt += 0.25) {
        EXPECT_FALSE(gate.allow(at(t0 + dt))) << "dt=" << dt;
    }
    EXPECT_FALSE(gate.allow(at(t0 + 1.999)));
    EXPECT_TRUE(gate.allow(at(t0 + 2.0)));
    EXPECT_TRUE(gate.allow(at(t0 + 2.001)));
    EXPECT_TRUE(gate.allow(at(t0 + 60.0)));
}

TEST(CooldownGateTest, RecordMovesWindow) {
    CooldownGate gate(1.0);
    gate.record(at(0.0));
    EXPECT_TRUE(gate.allow(at(1.0)));

    gate.record(at(1.0));
    EXPECT_FALSE(gate.allow(at(1.5)));
    EXPECT_TRUE(gate.allow(at(2.0)));
    ASSERT_TRUE(gate.lastTriggerTime().has_value());
    EXPECT_EQ(*gate.lastTriggerTime(), at(1.0));
}

/**
 * allow() never changes state
 */
TEST(CooldownGateTest, AllowIsPure) {
    CooldownGate gate(2.0);
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(gate.allow(at(0.1 * i)));
    }
    EXPECT_FALSE(gate.lastTriggerTime().has_value());
}

TEST(CooldownGateTest, RemainingSeconds) {
    CooldownGate gate(3.0);
    gate.record(at(5.0));
    EXPECT_NEAR(gate.remainingSeconds(at(5.0)), 3.0, 1e-9);
    EXPECT_NEAR(gate.remainingSeconds(at(6.5)), 1.5, 1e-9);
    EXPECT_DOUBLE_EQ(gate.remainingSeconds(at(8.0)), 0.0);
    EXPECT_DOUBLE_EQ(gate.remainingSeconds(at(20.0)), 0.0);
}

TEST(CooldownGateTest, ZeroCooldownAlwaysAllows) {
    CooldownGate gate(0.0);
    gate.record(at(1.0));
    EXPECT_TRUE(gate.allow(at(1.0)));
}

TEST(CooldownGateTest, ResetForgetsTrigger) {
    CooldownGate gate(3.0);
    gate.record(at(1.0));
    gate.reset();
    EXPECT_TRUE(gate.allow(at(1.0)));
}

TEST(CooldownGateTest, RejectsInvalidCooldown) {
    EXPECT_THROW(CooldownGate(-0.5), core::Exception);
    EXPECT_THROW(CooldownGate(std::numeric_limits<double>::quiet_NaN()), core::Exception);
    EXPECT_THROW(CooldownGate(std::numeric_limits<double>::infinity()), core::Exception);
    EXPECT_NO_THROW(CooldownGate(0.0));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
