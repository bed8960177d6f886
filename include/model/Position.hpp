#pragma once
/** @file  Position.hpp
 *  @brief Coordinates, device fixes and candidate dive sites.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>

namespace divewatch {
  namespace model {

    using TimePoint = std::chrono::system_clock::time_point;

    /// WGS-84 coordinate in decimal degrees.
    struct Coordinate {
      double latitude{ 0.0 };
      double longitude{ 0.0 };
    };

    /**
 * @struct Position
 * @brief One fix reported by the location service.
 *
 *  * Immutable once produced; every new reading supersedes the previous one.
 */
    struct Position {
      Coordinate coordinate{};
      double accuracyM{ 0.0 }; ///< horizontal accuracy, metres
      TimePoint timestamp{};
    };

    /// Point of interest supplied by the site catalog. Read-only to the scheduler.
    struct CandidateSite {
      std::string id;
      Coordinate coordinate{};
    };

  } // namespace model
} // namespace divewatch
