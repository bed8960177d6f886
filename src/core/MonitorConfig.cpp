/* @file MonitorConfig.cpp
 * @brief JSON schema mapping + range validation for MonitorConfig
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// divewatch headers
#include "core/MonitorConfig.hpp"

using namespace divewatch::core;
using divewatch::model::PerformancePolicy;

namespace {

  std::chrono::seconds secondsOr(const nlohmann::json& obj, const char* key, std::chrono::seconds fallback) {
    return std::chrono::seconds{ obj.value(key, static_cast<long long>(fallback.count())) };
  }

  const nlohmann::json& section(const nlohmann::json& root, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = root.find(key);
    if (it == root.end())
      return empty;
    if (!it->is_object())
      throw std::invalid_argument(std::string("[MonitorConfig] section '") + key + "' must be an object");
    return *it;
  }

  void require(bool ok, const char* what) {
    if (!ok)
      throw std::invalid_argument(std::string("[MonitorConfig] ") + what);
  }

} // namespace

std::chrono::seconds SchedulerConfig::refreshIntervalFor(PerformancePolicy policy) const {
  switch (policy) {
  case PerformancePolicy::BoatMode:
    return boatModeRefresh;
  case PerformancePolicy::ThermalThrottled:
    return thermalRefresh;
  case PerformancePolicy::Critical:
    return criticalRefresh;
  case PerformancePolicy::Standard:
  default:
    return standardRefresh;
  }
}

MonitorConfig divewatch::core::parseMonitorConfig(const nlohmann::json& j) {
  if (!j.is_object())
    throw std::invalid_argument("[MonitorConfig] root must be an object");

  MonitorConfig cfg;
  try {
    const auto& s = section(j, "scheduler");
    cfg.scheduler.maxMonitoredRegions =
        s.value("max_monitored_regions", cfg.scheduler.maxMonitoredRegions);
    cfg.scheduler.admissionRadiusKm = s.value("admission_radius_km", cfg.scheduler.admissionRadiusKm);
    cfg.scheduler.evictionRadiusKm = s.value("eviction_radius_km", cfg.scheduler.evictionRadiusKm);
    cfg.scheduler.regionRadiusM = s.value("region_radius_m", cfg.scheduler.regionRadiusM);
    cfg.scheduler.regionPrefix = s.value("region_prefix", cfg.scheduler.regionPrefix);
    cfg.scheduler.standardRefresh = secondsOr(s, "refresh_standard_s", cfg.scheduler.standardRefresh);
    cfg.scheduler.boatModeRefresh = secondsOr(s, "refresh_boat_mode_s", cfg.scheduler.boatModeRefresh);
    cfg.scheduler.thermalRefresh = secondsOr(s, "refresh_thermal_s", cfg.scheduler.thermalRefresh);
    cfg.scheduler.criticalRefresh = secondsOr(s, "refresh_critical_s", cfg.scheduler.criticalRefresh);

    const auto& h = section(j, "health");
    cfg.health.failureThreshold = h.value("failure_threshold", cfg.health.failureThreshold);
    cfg.health.slowThreshold = h.value("slow_threshold", cfg.health.slowThreshold);
    cfg.health.slowCycle = std::chrono::milliseconds{ h.value(
        "slow_cycle_ms", static_cast<long long>(cfg.health.slowCycle.count())) };

    const auto& p = section(j, "proximity");
    cfg.proximity.completionDwell = secondsOr(p, "completion_dwell_s", cfg.proximity.completionDwell);
    cfg.proximity.reminderDelay = secondsOr(p, "reminder_delay_s", cfg.proximity.reminderDelay);

    const auto& l = section(j, "location");
    cfg.location.standardDistanceFilterM =
        l.value("standard_distance_filter_m", cfg.location.standardDistanceFilterM);
    cfg.location.reducedDistanceFilterFloorM =
        l.value("reduced_distance_filter_floor_m", cfg.location.reducedDistanceFilterFloorM);
    cfg.location.boatModeDistanceFilterM =
        l.value("boat_mode_distance_filter_m", cfg.location.boatModeDistanceFilterM);
    cfg.location.thermalDistanceFilterM =
        l.value("thermal_distance_filter_m", cfg.location.thermalDistanceFilterM);
    cfg.location.criticalDistanceFilterM =
        l.value("critical_distance_filter_m", cfg.location.criticalDistanceFilterM);

    cfg.stateFile = j.value("state_file", cfg.stateFile);
    cfg.logFile = j.value("log_file", cfg.logFile);
  } catch (const nlohmann::json::type_error& e) {
    throw std::invalid_argument(std::string("[MonitorConfig] wrong value type: ") + e.what());
  }

  validate(cfg);
  return cfg;
}

void divewatch::core::validate(const MonitorConfig& cfg) {
  const auto& s = cfg.scheduler;
  require(s.maxMonitoredRegions >= 1 && s.maxMonitoredRegions <= model::kMaxMonitoredRegions,
          "max_monitored_regions must be within 1..20 (platform ceiling)");
  require(s.admissionRadiusKm > 0.0, "admission_radius_km must be positive");
  require(s.evictionRadiusKm >= s.admissionRadiusKm,
          "eviction_radius_km must not be smaller than admission_radius_km");
  require(s.regionRadiusM > 0.0, "region_radius_m must be positive");
  require(!s.regionPrefix.empty(), "region_prefix must not be empty");
  require(s.standardRefresh.count() >= 0 && s.boatModeRefresh.count() >= 0 &&
              s.thermalRefresh.count() >= 0 && s.criticalRefresh.count() >= 0,
          "refresh intervals must not be negative");

  require(cfg.health.failureThreshold >= 1, "failure_threshold must be >= 1");
  require(cfg.health.slowThreshold >= 1, "slow_threshold must be >= 1");
  require(cfg.health.slowCycle.count() > 0, "slow_cycle_ms must be positive");

  require(cfg.proximity.completionDwell.count() > 0, "completion_dwell_s must be positive");
  require(cfg.proximity.reminderDelay.count() >= 0, "reminder_delay_s must not be negative");

  require(cfg.location.standardDistanceFilterM >= 0.0 && cfg.location.reducedDistanceFilterFloorM >= 0.0,
          "distance filters must not be negative");
}
