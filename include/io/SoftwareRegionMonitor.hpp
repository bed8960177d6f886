#pragma once
/** @file  SoftwareRegionMonitor.hpp
 *  @brief RegionMonitor that evaluates circular geofences itself (host builds).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "io/RegionMonitor.hpp"
#include "model/Position.hpp"

namespace divewatch {
  namespace io {

    /**
 * @class SoftwareRegionMonitor
 * @brief Enforces the platform ceiling and raises enter/exit on crossings.
 *
 *  * `install()` beyond capacity throws RegionMonitorError, as the OS would reject it.
 *  * A region installed while the last fix is inside it reports
 *    `onStateDetermined(id, true)`.
 *  * Thread-safe; handlers run outside the internal lock.
 */
    class SoftwareRegionMonitor : public RegionMonitor {
    public:
      explicit SoftwareRegionMonitor(std::size_t capacity = model::kMaxMonitoredRegions);

      void install(const model::MonitoredRegion& region) override;
      void remove(const std::string& regionId) override;

      /// Feed a fix; fires onEnter/onExit for every boundary crossed.
      void updatePosition(const model::Position& position);

      /// Simulate the OS dropping a region (e.g. location services turned off).
      void failRegion(const std::string& regionId, const std::string& error);

      std::vector<std::string> regionIds() const;
      std::size_t count() const;

    private:
      struct Entry {
        model::MonitoredRegion region;
        bool inside{ false };
      };

      std::size_t capacity_;
      std::vector<Entry> entries_;
      std::optional<model::Position> last_{};
      mutable std::mutex mtx_;
    };

  } // namespace io
} // namespace divewatch
