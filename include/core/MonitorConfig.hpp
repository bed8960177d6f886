#pragma once
/** @file  MonitorConfig.hpp
 *  @brief Every tunable of the geofence pipeline, with production defaults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "model/PerformancePolicy.hpp"
#include "model/Region.hpp"

namespace divewatch {
  namespace core {

    struct SchedulerConfig {
      std::size_t maxMonitoredRegions{ model::kMaxMonitoredRegions };
      double admissionRadiusKm{ 50.0 };
      double evictionRadiusKm{ 100.0 }; ///< hysteresis band: evict only past this
      double regionRadiusM{ model::kRegionRadiusM };
      std::string regionPrefix{ "dive_site_" };
      std::chrono::seconds standardRefresh{ 60 };
      std::chrono::seconds boatModeRefresh{ 120 };
      std::chrono::seconds thermalRefresh{ 180 };
      std::chrono::seconds criticalRefresh{ 300 };

      std::chrono::seconds refreshIntervalFor(model::PerformancePolicy policy) const;
    };

    struct HealthConfig {
      int failureThreshold{ 3 };
      int slowThreshold{ 3 };
      std::chrono::milliseconds slowCycle{ 2000 };
    };

    struct ProximityConfig {
      std::chrono::seconds completionDwell{ 30 * 60 };
      std::chrono::seconds reminderDelay{ 15 * 60 };
    };

    struct LocationConfig {
      double standardDistanceFilterM{ 50.0 };
      double reducedDistanceFilterFloorM{ 500.0 };
      double boatModeDistanceFilterM{ 500.0 };
      double thermalDistanceFilterM{ 750.0 };
      double criticalDistanceFilterM{ 1000.0 };
    };

    /**
 * @struct MonitorConfig
 * @brief Aggregate configuration; default-constructed values are the shipping ones.
 */
    struct MonitorConfig {
      SchedulerConfig scheduler{};
      HealthConfig health{};
      ProximityConfig proximity{};
      LocationConfig location{};
      std::string stateFile{};  ///< empty = in-memory persistence only
      std::string logFile{};    ///< empty = stderr echo only
    };

    /// Build a MonitorConfig from JSON, filling gaps with defaults.
    /// Throws `std::invalid_argument` on out-of-range values.
    MonitorConfig parseMonitorConfig(const nlohmann::json& j);

    /// Validation shared by parseMonitorConfig and programmatic construction.
    void validate(const MonitorConfig& cfg);

  } // namespace core
} // namespace divewatch
