#pragma once
/** @file  HealthMonitor.hpp
 *  @brief Scheduling-cycle health tracking & safe-mode escalation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

#include "core/MonitorConfig.hpp"

namespace divewatch::core {

  enum class SafeModeReason : std::uint8_t { SchedulingFailures, SlowCycles };

  /// Wire tag consumed by the application ("scheduling_failures" | "slow_cycles").
  const char* toString(SafeModeReason reason);

  /**
 * @class HealthMonitor
 * @brief RegionScheduler reports every cycle; we escalate once per threshold crossing.
 *
 * * Two independent counters: consecutive failures and consecutive slow cycles.
 * * A cycle that is both successful and fast resets (and re-arms) both.
 * * Above threshold the counters keep accumulating silently.
 */
  class HealthMonitor {
  public:
    using Escalation = std::function<void(SafeModeReason)>;

    explicit HealthMonitor(HealthConfig cfg = {});
    virtual ~HealthMonitor() = default;

    /// Register a lambda that requests safe mode from the wider application.
    void registerEscalation(Escalation cb);

    /// Called by RegionScheduler once per completed cycle.
    virtual void recordCycle(bool success, std::chrono::milliseconds duration);

    int failureCount() const;
    int slowCount() const;

    /// Clear counters and re-arm both escalations.
    void reset();

  private:
    HealthConfig cfg_;
    Escalation escalation_{};
    int failures_{ 0 };
    int slow_{ 0 };
    bool failureEscalated_{ false };
    bool slowEscalated_{ false };
    mutable std::mutex mtx_;
  };

} // namespace divewatch::core
