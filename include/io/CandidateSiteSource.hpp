#pragma once
/** @file  CandidateSiteSource.hpp
 *  @brief Query contract for nearby dive sites (backed by the site database).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "model/Position.hpp"

namespace divewatch {
  namespace io {

    struct SiteQueryResult {
      std::vector<model::CandidateSite> sites; ///< ascending by distance
      std::optional<std::string> error{};      ///< set when the query failed

      bool ok() const { return !error.has_value(); }
    };

    /**
 * @class CandidateSiteSource
 * @brief Asynchronous "sites near here" query.
 *
 *  * Results are sorted ascending by distance from \p at; ties by site id.
 *  * `done` may be called inline or later from any thread, exactly once.
 */
    class CandidateSiteSource {
    public:
      using Completion = std::function<void(SiteQueryResult)>;

      virtual ~CandidateSiteSource() = default;

      virtual void nearby(const model::Position& at, double radiusKm, std::size_t limit,
                          Completion done) = 0;
    };

  } // namespace io
} // namespace divewatch
