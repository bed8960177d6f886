/* @file HealthMonitor.cpp
 * @brief consecutive failure / slow-cycle counters with one-shot escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>
#include <vector>

// divewatch headers
#include "core/HealthMonitor.hpp"

namespace divewatch::core {

  const char* toString(SafeModeReason reason) {
    switch (reason) {
    case SafeModeReason::SchedulingFailures:
      return "scheduling_failures";
    case SafeModeReason::SlowCycles:
      return "slow_cycles";
    default:
      return "unknown";
    }
  }

  HealthMonitor::HealthMonitor(HealthConfig cfg) : cfg_(cfg) {}

  void HealthMonitor::registerEscalation(Escalation cb) {
    std::lock_guard<std::mutex> lock(mtx_);
    escalation_ = std::move(cb);
  }

  void HealthMonitor::recordCycle(bool success, std::chrono::milliseconds duration) {
    const bool slow = duration > cfg_.slowCycle;
    std::vector<SafeModeReason> fire;
    Escalation cb;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (success && !slow) {
        failures_ = 0;
        slow_ = 0;
        failureEscalated_ = false;
        slowEscalated_ = false;
        return;
      }

      if (!success) {
        ++failures_;
        if (failures_ >= cfg_.failureThreshold && !failureEscalated_) {
          failureEscalated_ = true;
          fire.push_back(SafeModeReason::SchedulingFailures);
        }
      }
      if (slow) {
        ++slow_;
        if (slow_ >= cfg_.slowThreshold && !slowEscalated_) {
          slowEscalated_ = true;
          fire.push_back(SafeModeReason::SlowCycles);
        }
      }
      cb = escalation_;
    }

    // callback runs outside the lock so it may query counters
    if (cb) {
      for (auto reason : fire)
        cb(reason);
    }
  }

  int HealthMonitor::failureCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return failures_;
  }

  int HealthMonitor::slowCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return slow_;
  }

  void HealthMonitor::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    failures_ = 0;
    slow_ = 0;
    failureEscalated_ = false;
    slowEscalated_ = false;
  }

} // namespace divewatch::core
