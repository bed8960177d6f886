#pragma once
/** @file  Region.hpp
 *  @brief Monitored geofence regions and the site events they produce.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "model/Position.hpp"

#include <cstddef>
#include <string>

namespace divewatch {
  namespace model {

    /// Hard ceiling imposed by the platform region-monitoring facility.
    inline constexpr std::size_t kMaxMonitoredRegions = 20;

    /// Every region we install is a 500 m circle.
    inline constexpr double kRegionRadiusM = 500.0;

    /**
 * @struct MonitoredRegion
 * @brief Circular OS-level trigger installed for one admitted site.
 *
 *  * `identifier` is `prefix + siteId` so callbacks can be mapped back.
 */
    struct MonitoredRegion {
      std::string identifier;
      std::string siteId;
      Coordinate center{};
      double radiusM{ kRegionRadiusM };
      bool notifyOnEntry{ true };
      bool notifyOnExit{ true };
    };

    enum class SiteTransition { Enter, Exit };

    /// Semantic event produced once a region callback has been resolved to a site.
    struct SiteEvent {
      std::string siteId;
      SiteTransition transition{ SiteTransition::Enter };
    };

    inline const char* toString(SiteTransition t) {
      switch (t) {
      case SiteTransition::Enter:
        return "enter";
      case SiteTransition::Exit:
        return "exit";
      default:
        return "unknown";
      }
    }

  } // namespace model
} // namespace divewatch
