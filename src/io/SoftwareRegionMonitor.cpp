/* @file SoftwareRegionMonitor.cpp
 * @brief haversine-based geofence evaluation with a hard region ceiling
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <string>
#include <utility>

// divewatch headers
#include "io/SoftwareRegionMonitor.hpp"
#include "location/GeoMath.hpp"

using namespace divewatch::io;

SoftwareRegionMonitor::SoftwareRegionMonitor(std::size_t capacity) : capacity_(capacity) {}

void SoftwareRegionMonitor::install(const model::MonitoredRegion& region) {
  bool inside = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.region.identifier == region.identifier; });
    if (it == entries_.end() && entries_.size() >= capacity_)
      throw RegionMonitorError("region limit of " + std::to_string(capacity_) + " reached");

    if (last_)
      inside = location::distanceMeters(last_->coordinate, region.center) <= region.radiusM;

    if (it != entries_.end())
      *it = Entry{ region, inside };
    else
      entries_.push_back(Entry{ region, inside });
  }

  if (inside && handlers_.onStateDetermined)
    handlers_.onStateDetermined(region.identifier, true);
}

void SoftwareRegionMonitor::remove(const std::string& regionId) {
  std::lock_guard<std::mutex> lock(mtx_);
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&](const Entry& e) { return e.region.identifier == regionId; }),
                 entries_.end());
}

void SoftwareRegionMonitor::updatePosition(const model::Position& position) {
  std::vector<std::pair<std::string, bool>> crossings; // id, entered
  {
    std::lock_guard<std::mutex> lock(mtx_);
    last_ = position;
    for (auto& e : entries_) {
      const bool inside =
          location::distanceMeters(position.coordinate, e.region.center) <= e.region.radiusM;
      if (inside == e.inside)
        continue;
      e.inside = inside;
      if ((inside && e.region.notifyOnEntry) || (!inside && e.region.notifyOnExit))
        crossings.emplace_back(e.region.identifier, inside);
    }
  }

  // exits first so a hop between overlapping circles reads exit-then-enter
  std::stable_partition(crossings.begin(), crossings.end(),
                        [](const auto& c) { return !c.second; });
  for (const auto& [id, entered] : crossings) {
    if (entered && handlers_.onEnter)
      handlers_.onEnter(id);
    else if (!entered && handlers_.onExit)
      handlers_.onExit(id);
  }
}

void SoftwareRegionMonitor::failRegion(const std::string& regionId, const std::string& error) {
  remove(regionId);
  if (handlers_.onMonitoringFailed)
    handlers_.onMonitoringFailed(regionId, error);
}

std::vector<std::string> SoftwareRegionMonitor::regionIds() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& e : entries_)
    ids.push_back(e.region.identifier);
  return ids;
}

std::size_t SoftwareRegionMonitor::count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return entries_.size();
}
