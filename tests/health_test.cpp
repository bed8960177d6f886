// divewatch-Prod headers
#include "core/HealthMonitor.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <chrono>
#include <vector>

namespace divewatch::test {

  using divewatch::core::HealthConfig;
  using divewatch::core::HealthMonitor;
  using divewatch::core::SafeModeReason;
  using namespace std::chrono_literals;

  class HealthMonitorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      monitor.registerEscalation([this](SafeModeReason r) { raised.push_back(r); });
    }

    HealthMonitor monitor;
    std::vector<SafeModeReason> raised;
  };

  TEST_F(HealthMonitorTest, threeFailuresEscalateOnce) {
    monitor.recordCycle(false, 10ms);
    monitor.recordCycle(false, 10ms);
    EXPECT_TRUE(raised.empty());
    monitor.recordCycle(false, 10ms);
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0], SafeModeReason::SchedulingFailures);

    monitor.recordCycle(false, 10ms); // already escalated
    EXPECT_EQ(raised.size(), 1u);
    EXPECT_EQ(monitor.failureCount(), 4);
  }

  TEST_F(HealthMonitorTest, successfulFastCycleRearmsEscalation) {
    for (int i = 0; i < 3; ++i)
      monitor.recordCycle(false, 10ms);
    monitor.recordCycle(true, 10ms);
    EXPECT_EQ(monitor.failureCount(), 0);

    for (int i = 0; i < 3; ++i)
      monitor.recordCycle(false, 10ms);
    ASSERT_EQ(raised.size(), 2u);
    EXPECT_EQ(raised[1], SafeModeReason::SchedulingFailures);
  }

  TEST_F(HealthMonitorTest, interleavedSuccessPreventsEscalation) {
    for (int i = 0; i < 10; ++i) {
      monitor.recordCycle(false, 10ms);
      monitor.recordCycle(false, 10ms);
      monitor.recordCycle(true, 10ms);
    }
    EXPECT_TRUE(raised.empty());
  }

  TEST_F(HealthMonitorTest, slowCyclesEscalateIndependently) {
    monitor.recordCycle(true, 2001ms);
    monitor.recordCycle(true, 2500ms);
    monitor.recordCycle(true, 3000ms);
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0], SafeModeReason::SlowCycles);
    EXPECT_EQ(monitor.failureCount(), 0);
  }

  TEST_F(HealthMonitorTest, exactlyTwoSecondsIsNotSlow) {
    for (int i = 0; i < 5; ++i)
      monitor.recordCycle(true, 2000ms);
    EXPECT_EQ(monitor.slowCount(), 0);
    EXPECT_TRUE(raised.empty());
  }

  TEST_F(HealthMonitorTest, slowSuccessDoesNotClearFailures) {
    monitor.recordCycle(false, 10ms);
    monitor.recordCycle(false, 10ms);
    monitor.recordCycle(true, 5000ms);
    EXPECT_EQ(monitor.failureCount(), 2);
    monitor.recordCycle(false, 10ms);
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0], SafeModeReason::SchedulingFailures);
  }

  TEST_F(HealthMonitorTest, failingSlowCycleCanRaiseBothReasons) {
    for (int i = 0; i < 3; ++i)
      monitor.recordCycle(false, 4s);
    EXPECT_EQ(raised, (std::vector<SafeModeReason>{ SafeModeReason::SchedulingFailures,
                                                     SafeModeReason::SlowCycles }));
  }

  TEST_F(HealthMonitorTest, resetClearsAndRearms) {
    for (int i = 0; i < 3; ++i)
      monitor.recordCycle(false, 10ms);
    monitor.reset();
    EXPECT_EQ(monitor.failureCount(), 0);
    for (int i = 0; i < 3; ++i)
      monitor.recordCycle(false, 10ms);
    EXPECT_EQ(raised.size(), 2u);
  }

  TEST(HealthMonitorConfig, customThreshold) {
    HealthConfig cfg;
    cfg.failureThreshold = 1;
    HealthMonitor monitor(cfg);
    int raised = 0;
    monitor.registerEscalation([&](SafeModeReason) { ++raised; });
    monitor.recordCycle(false, 1ms);
    EXPECT_EQ(raised, 1);
  }

  TEST(HealthMonitorConfig, reasonTags) {
    EXPECT_STREQ(core::toString(SafeModeReason::SchedulingFailures), "scheduling_failures");
    EXPECT_STREQ(core::toString(SafeModeReason::SlowCycles), "slow_cycles");
  }

} // namespace divewatch::test
