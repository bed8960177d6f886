/* @file GeoMath.cpp
 * @brief haversine distance and forward geodesic on a spherical earth
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cmath>

#include "location/GeoMath.hpp"

namespace divewatch::location {

  namespace {
    constexpr double kPi = 3.14159265358979323846;
    double toRadians(double deg) { return deg * kPi / 180.0; }
    double toDegrees(double rad) { return rad * 180.0 / kPi; }
  } // namespace

  double distanceMeters(const model::Coordinate& a, const model::Coordinate& b) {
    const double lat1 = toRadians(a.latitude);
    const double lat2 = toRadians(b.latitude);
    const double dLat = lat2 - lat1;
    const double dLon = toRadians(b.longitude - a.longitude);

    const double h = std::sin(dLat / 2) * std::sin(dLat / 2) +
                     std::cos(lat1) * std::cos(lat2) * std::sin(dLon / 2) * std::sin(dLon / 2);
    return 2.0 * kEarthRadiusM * std::asin(std::min(1.0, std::sqrt(h)));
  }

  model::Coordinate destination(const model::Coordinate& from, double bearingDeg, double meters) {
    const double delta = meters / kEarthRadiusM;
    const double theta = toRadians(bearingDeg);
    const double lat1 = toRadians(from.latitude);
    const double lon1 = toRadians(from.longitude);

    const double lat2 = std::asin(std::sin(lat1) * std::cos(delta) +
                                  std::cos(lat1) * std::sin(delta) * std::cos(theta));
    const double lon2 = lon1 + std::atan2(std::sin(theta) * std::sin(delta) * std::cos(lat1),
                                          std::cos(delta) - std::sin(lat1) * std::sin(lat2));

    double lonDeg = std::fmod(toDegrees(lon2) + 540.0, 360.0) - 180.0;
    return model::Coordinate{ toDegrees(lat2), lonDeg };
  }

} // namespace divewatch::location
