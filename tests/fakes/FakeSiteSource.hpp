#pragma once
/** @file  FakeSiteSource.hpp
 *  @brief CandidateSiteSource with controllable latency and failures.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "io/CandidateSiteSource.hpp"
#include "location/GeoMath.hpp"

namespace divewatch {
  namespace test {

    /**
 * @class FakeSiteSource
 * @brief Answers from `sites`; with `deferred` set, completions wait for release().
 *
 *  The answer is computed when the query is made, so a released result reflects
 *  the catalog as it was at query time.
 */
    class FakeSiteSource : public divewatch::io::CandidateSiteSource {
    public:
      std::vector<model::CandidateSite> sites;
      bool deferred = false;
      std::optional<std::string> failWith;
      int queries = 0;

      void nearby(const model::Position& at, double radiusKm, std::size_t limit,
                  Completion done) override {
        ++queries;
        io::SiteQueryResult result;
        if (failWith) {
          result.error = *failWith;
        } else {
          std::vector<std::pair<double, model::CandidateSite>> hits;
          for (const auto& s : sites) {
            const double km = location::distanceKm(at.coordinate, s.coordinate);
            if (km <= radiusKm)
              hits.emplace_back(km, s);
          }
          std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
            return a.first != b.first ? a.first < b.first : a.second.id < b.second.id;
          });
          for (std::size_t i = 0; i < hits.size() && i < limit; ++i)
            result.sites.push_back(hits[i].second);
        }

        if (deferred)
          held_.emplace_back(std::move(done), std::move(result));
        else
          done(std::move(result));
      }

      void removeSite(const std::string& id) {
        sites.erase(std::remove_if(sites.begin(), sites.end(),
                                   [&](const model::CandidateSite& s) { return s.id == id; }),
                    sites.end());
      }

      std::size_t held() const { return held_.size(); }

      /// Completes every held query, oldest first.
      void releaseAll() {
        auto batch = std::move(held_);
        held_.clear();
        for (auto& [done, result] : batch)
          done(std::move(result));
      }

    private:
      std::vector<std::pair<Completion, io::SiteQueryResult>> held_;
    };

  } // namespace test
} // namespace divewatch
