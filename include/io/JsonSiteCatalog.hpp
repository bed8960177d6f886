#pragma once
/** @file  JsonSiteCatalog.hpp
 *  @brief CandidateSiteSource over an in-memory list loaded from JSON.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "io/CandidateSiteSource.hpp"

namespace divewatch {
  namespace io {

    /**
 * @class JsonSiteCatalog
 * @brief Linear-scan nearest-site query; completes inline.
 *
 *  Accepts either `[{"id","lat","lon"}, ...]` or `{"sites": [...]}`.
 *  Ties in distance are broken by site id so results are deterministic.
 */
    class JsonSiteCatalog : public CandidateSiteSource {
    public:
      JsonSiteCatalog() = default;
      explicit JsonSiteCatalog(std::vector<model::CandidateSite> sites);

      /// Throws `std::invalid_argument` on malformed entries.
      static std::vector<model::CandidateSite> parse(const nlohmann::json& j);

      void nearby(const model::Position& at, double radiusKm, std::size_t limit,
                  Completion done) override;

      void add(model::CandidateSite site);
      bool remove(const std::string& siteId);
      std::size_t size() const;

    private:
      std::vector<model::CandidateSite> sites_;
      mutable std::mutex mtx_;
    };

  } // namespace io
} // namespace divewatch
