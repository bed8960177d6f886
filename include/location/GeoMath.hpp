#pragma once
/** @file  GeoMath.hpp
 *  @brief Great-circle helpers shared by the scheduler and host adapters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "model/Position.hpp"

namespace divewatch {
  namespace location {

    inline constexpr double kEarthRadiusM = 6371000.0;

    /// Haversine distance in metres.
    double distanceMeters(const model::Coordinate& a, const model::Coordinate& b);

    inline double distanceKm(const model::Coordinate& a, const model::Coordinate& b) {
      return distanceMeters(a, b) / 1000.0;
    }

    /// Point reached travelling \p meters from \p from on initial bearing \p bearingDeg.
    model::Coordinate destination(const model::Coordinate& from, double bearingDeg, double meters);

  } // namespace location
} // namespace divewatch
