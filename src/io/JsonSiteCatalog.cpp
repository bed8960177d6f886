/* @file JsonSiteCatalog.cpp
 * @brief site list parsing and distance-ordered nearby query
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// divewatch headers
#include "io/JsonSiteCatalog.hpp"
#include "location/GeoMath.hpp"

using namespace divewatch::io;
using divewatch::model::CandidateSite;

JsonSiteCatalog::JsonSiteCatalog(std::vector<CandidateSite> sites) : sites_(std::move(sites)) {}

std::vector<CandidateSite> JsonSiteCatalog::parse(const nlohmann::json& j) {
  const nlohmann::json& list = j.is_object() && j.contains("sites") ? j.at("sites") : j;
  if (!list.is_array())
    throw std::invalid_argument("[JsonSiteCatalog] expected an array of sites");

  std::vector<CandidateSite> out;
  out.reserve(list.size());
  for (const auto& entry : list) {
    if (!entry.is_object() || !entry.contains("id") || !entry.contains("lat") || !entry.contains("lon"))
      throw std::invalid_argument("[JsonSiteCatalog] site needs id, lat and lon: " + entry.dump());

    CandidateSite site;
    const auto& id = entry.at("id");
    site.id = id.is_string() ? id.get<std::string>() : id.dump(); // numeric ids allowed
    site.coordinate.latitude = entry.at("lat").get<double>();
    site.coordinate.longitude = entry.at("lon").get<double>();
    if (site.coordinate.latitude < -90.0 || site.coordinate.latitude > 90.0 ||
        site.coordinate.longitude < -180.0 || site.coordinate.longitude > 180.0)
      throw std::invalid_argument("[JsonSiteCatalog] coordinate out of range for site " + site.id);
    out.push_back(std::move(site));
  }
  return out;
}

void JsonSiteCatalog::nearby(const model::Position& at, double radiusKm, std::size_t limit,
                             Completion done) {
  struct Hit {
    double km;
    const CandidateSite* site;
  };

  SiteQueryResult result;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<Hit> hits;
    for (const auto& s : sites_) {
      const double km = location::distanceKm(at.coordinate, s.coordinate);
      if (km <= radiusKm)
        hits.push_back(Hit{ km, &s });
    }
    std::sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
      if (a.km != b.km)
        return a.km < b.km;
      return a.site->id < b.site->id;
    });
    if (hits.size() > limit)
      hits.resize(limit);

    result.sites.reserve(hits.size());
    for (const auto& h : hits)
      result.sites.push_back(*h.site);
  }
  done(std::move(result));
}

void JsonSiteCatalog::add(CandidateSite site) {
  std::lock_guard<std::mutex> lock(mtx_);
  sites_.push_back(std::move(site));
}

bool JsonSiteCatalog::remove(const std::string& siteId) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto before = sites_.size();
  sites_.erase(std::remove_if(sites_.begin(), sites_.end(),
                              [&](const CandidateSite& s) { return s.id == siteId; }),
               sites_.end());
  return sites_.size() != before;
}

std::size_t JsonSiteCatalog::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return sites_.size();
}
