#pragma once
/** @file  PerformancePolicy.hpp
 *  @brief Device power/thermal policy and the signals it is derived from.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

namespace divewatch {
  namespace model {

    enum class PerformancePolicy : std::uint8_t { Standard, BoatMode, ThermalThrottled, Critical };

    enum class ThermalState : std::uint8_t { Nominal, Fair, Serious, Critical };

    /// Raw inputs the application observes from the OS and user settings.
    struct PowerSignals {
      ThermalState thermal{ ThermalState::Nominal };
      bool boatModeEnabled{ false };
      bool lowPowerModeEnabled{ false };
    };

    /// Thermal pressure wins over user toggles; boat mode and low-power share a tier.
    inline PerformancePolicy resolvePolicy(const PowerSignals& s) {
      switch (s.thermal) {
      case ThermalState::Critical:
        return PerformancePolicy::Critical;
      case ThermalState::Serious:
        return PerformancePolicy::ThermalThrottled;
      case ThermalState::Nominal:
      case ThermalState::Fair:
      default:
        return (s.boatModeEnabled || s.lowPowerModeEnabled) ? PerformancePolicy::BoatMode
                                                            : PerformancePolicy::Standard;
      }
    }

    inline const char* toString(PerformancePolicy p) {
      switch (p) {
      case PerformancePolicy::Standard:
        return "standard";
      case PerformancePolicy::BoatMode:
        return "boatMode";
      case PerformancePolicy::ThermalThrottled:
        return "thermalThrottled";
      case PerformancePolicy::Critical:
        return "critical";
      default:
        return "unknown";
      }
    }

  } // namespace model
} // namespace divewatch
