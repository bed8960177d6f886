#pragma once
/** @file  RegionMonitor.hpp
 *  @brief Adapter interface over the platform region-monitoring facility.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "model/Region.hpp"

namespace divewatch {
  namespace io {

    /// Thrown by install() when the platform rejects a region.
    class RegionMonitorError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class RegionMonitor
 * @brief Shared platform resource; RegionScheduler is its only writer.
 *
 *  * The namespace of region identifiers may be shared with other features,
 *    so callbacks can carry identifiers we never installed.
 *  * Handlers may fire on any platform thread.
 */
    class RegionMonitor {
    public:
      struct Handlers {
        std::function<void(const std::string& regionId)> onEnter{};
        std::function<void(const std::string& regionId)> onExit{};
        /// Initial inside/outside determination after installation.
        std::function<void(const std::string& regionId, bool inside)> onStateDetermined{};
        std::function<void(const std::optional<std::string>& regionId, const std::string& error)>
            onMonitoringFailed{};
      };

      virtual ~RegionMonitor() = default;

      /// Start monitoring \p region. Throws `RegionMonitorError` on rejection.
      virtual void install(const model::MonitoredRegion& region) = 0;

      /// Stop monitoring \p regionId. Unknown identifiers are ignored.
      virtual void remove(const std::string& regionId) = 0;

      void setHandlers(Handlers h) { handlers_ = std::move(h); }

    protected:
      Handlers handlers_{};
    };

  } // namespace io
} // namespace divewatch
