/* @file RegionScheduler.cpp
 * @brief geofence admission/eviction cycles against the platform region monitor
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

// divewatch headers
#include "core/Executor.hpp"
#include "core/HealthMonitor.hpp"
#include "core/Logger.hpp"
#include "io/RegionMonitor.hpp"
#include "location/GeoMath.hpp"
#include "location/RegionScheduler.hpp"

using namespace divewatch::location;
using divewatch::core::LogLevel;
using divewatch::model::CandidateSite;
using divewatch::model::MonitoredRegion;
using divewatch::model::SiteTransition;

namespace {
  constexpr const char* kTag = "RegionScheduler";
}

RegionScheduler::RegionScheduler(std::shared_ptr<io::RegionMonitor> monitor,
                                 std::shared_ptr<io::CandidateSiteSource> sites,
                                 std::shared_ptr<core::HealthMonitor> health,
                                 std::shared_ptr<core::SerialExecutor> executor,
                                 std::shared_ptr<const core::Clock> clock, core::SchedulerConfig cfg,
                                 std::shared_ptr<core::Logger> logger)
    : monitor_(std::move(monitor)), sites_(std::move(sites)), health_(std::move(health)),
      executor_(std::move(executor)), clock_(std::move(clock)), cfg_(std::move(cfg)),
      logger_(std::move(logger)) {
  if (!monitor_ || !sites_ || !health_ || !executor_ || !clock_ || !logger_)
    throw std::invalid_argument("[RegionScheduler] null dependency");
  if (cfg_.maxMonitoredRegions == 0 || cfg_.maxMonitoredRegions > model::kMaxMonitoredRegions)
    throw std::invalid_argument("[RegionScheduler] capacity must be within 1..20");

  live_.reserve(cfg_.maxMonitoredRegions);

  // Platform threads -> executor. Nothing here touches scheduler state directly.
  io::RegionMonitor::Handlers h;
  h.onEnter = [this](const std::string& id) { post([this, id] { handleRegionEnter(id); }); };
  h.onExit = [this](const std::string& id) { post([this, id] { handleRegionExit(id); }); };
  h.onStateDetermined = [this](const std::string& id, bool inside) {
    post([this, id, inside] { handleRegionState(id, inside); });
  };
  h.onMonitoringFailed = [this](const std::optional<std::string>& id, const std::string& err) {
    post([this, id, err] { handleMonitoringFailed(id, err); });
  };
  monitor_->setHandlers(std::move(h));
}

RegionScheduler::~RegionScheduler() { detach(); }

void RegionScheduler::detach() {
  guard_.close(); // returns once no scheduler task is running
  monitor_->setHandlers({});
}

// -------------------------------------------------------------------
// lifecycle
// -------------------------------------------------------------------
void RegionScheduler::start() {
  if (running_)
    return;
  running_ = true;
  lastCycleStart_.reset();
  logger_->log(LogLevel::Info, kTag, "monitoring started");

  if (latest_)
    beginCycle();
}

void RegionScheduler::stop() {
  if (!running_)
    return;
  running_ = false;
  ++generation_; // in-flight query results and trailing deadlines are now stale
  inFlight_ = false;
  pending_ = false;
  platformFailure_ = false;
  trailingPending_ = false;
  trailingArmed_ = false;

  while (!live_.empty())
    evict(live_.size() - 1);

  logger_->log(LogLevel::Info, kTag, "monitoring stopped, all regions removed");
}

void RegionScheduler::onPosition(const model::Position& position) {
  latest_ = position;
  if (!running_)
    return;

  if (inFlight_) {
    pending_ = true; // collapses any number of updates into one follow-up
    return;
  }
  const core::SteadyPoint now = clock_->monotonic();
  if (throttled(now)) {
    trailingPending_ = true;
    armTrailingCycle(now);
    return;
  }

  beginCycle();
}

bool RegionScheduler::throttled(core::SteadyPoint now) const {
  if (!lastCycleStart_)
    return false;
  return now - *lastCycleStart_ < cfg_.refreshIntervalFor(policy_);
}

void RegionScheduler::armTrailingCycle(core::SteadyPoint now) {
  if (trailingArmed_)
    return;
  trailingArmed_ = true;

  const auto windowEnd = *lastCycleStart_ + cfg_.refreshIntervalFor(policy_);
  const auto delay = std::max(std::chrono::milliseconds{ 0 },
                              std::chrono::ceil<std::chrono::milliseconds>(windowEnd - now));
  const std::uint64_t gen = generation_;
  executor_->postAfter(delay, guard_.wrap([this, gen] { onTrailingDeadline(gen); }));
}

void RegionScheduler::onTrailingDeadline(std::uint64_t generation) {
  if (generation != generation_)
    return; // armed before a stop()
  trailingArmed_ = false;
  if (!running_ || !trailingPending_)
    return; // a later cycle already used the latest fix

  if (inFlight_) {
    pending_ = true;
    return;
  }
  const core::SteadyPoint now = clock_->monotonic();
  if (throttled(now)) {
    armTrailingCycle(now); // policy changed to a longer interval meanwhile
    return;
  }
  logger_->log(LogLevel::Debug, kTag, "refresh window closed, cycling on the held position");
  beginCycle();
}

// -------------------------------------------------------------------
// cycle
// -------------------------------------------------------------------
void RegionScheduler::beginCycle() {
  inFlight_ = true;
  pending_ = false;
  trailingPending_ = false;
  cycleStart_ = clock_->monotonic();
  lastCycleStart_ = cycleStart_;

  const std::uint64_t gen = generation_;

  // `done` may run on any thread, possibly after this object is gone, so it
  // never touches `this`; the guarded task picks the result up from the slot.
  auto slot = std::make_shared<io::SiteQueryResult>();
  auto apply = guard_.wrap([this, gen, slot] { completeCycle(gen, std::move(*slot)); });
  auto done = [executor = executor_, slot, apply = std::move(apply)](io::SiteQueryResult result) {
    *slot = std::move(result);
    executor->post(apply);
  };

  try {
    sites_->nearby(*latest_, cfg_.admissionRadiusKm, cfg_.maxMonitoredRegions, std::move(done));
  } catch (const std::exception& e) {
    io::SiteQueryResult failed;
    failed.error = e.what();
    post([this, gen, failed = std::move(failed)]() mutable { completeCycle(gen, std::move(failed)); });
  }
}

void RegionScheduler::completeCycle(std::uint64_t generation, io::SiteQueryResult result) {
  if (generation != generation_ || !running_) {
    logger_->log(LogLevel::Debug, kTag, "discarding stale candidate query result");
    return;
  }

  CycleStats stats;
  stats.success = result.ok() && !platformFailure_;
  platformFailure_ = false;

  if (result.ok()) {
    applyDiff(result.sites, stats);
    if (stats.failedInstalls > 0)
      stats.success = false;
  } else {
    logger_->log(LogLevel::Warn, kTag, "candidate query failed: " + *result.error);
  }

  const auto elapsed = clock_->monotonic() - cycleStart_;
  stats.duration = std::max(std::chrono::milliseconds{ 0 },
                            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed));

  inFlight_ = false;
  ++cycles_;
  lastCycle_ = stats;

  logger_->log(stats.success ? LogLevel::Info : LogLevel::Warn, kTag,
               std::string(stats.success ? "cycle ok" : "cycle failed") + ": " +
                   std::to_string(live_.size()) + " monitored (+" + std::to_string(stats.admitted) +
                   "/-" + std::to_string(stats.evicted) + ") in " +
                   std::to_string(stats.duration.count()) + " ms");

  health_->recordCycle(stats.success, stats.duration);

  if (pending_ && running_ && !inFlight_)
    beginCycle();
}

void RegionScheduler::applyDiff(const std::vector<CandidateSite>& candidates, CycleStats& stats) {
  const model::Coordinate here = latest_->coordinate;

  // Target set, re-validated against the latest position (it may have moved
  // while the query was out).
  struct Scored {
    double km;
    const CandidateSite* site;
  };
  std::vector<Scored> target;
  target.reserve(candidates.size());
  for (const auto& c : candidates) {
    const double km = distanceKm(here, c.coordinate);
    if (km <= cfg_.admissionRadiusKm)
      target.push_back(Scored{ km, &c });
  }
  std::stable_sort(target.begin(), target.end(), [](const Scored& a, const Scored& b) {
    if (a.km != b.km)
      return a.km < b.km;
    return a.site->id < b.site->id;
  });
  if (target.size() > cfg_.maxMonitoredRegions)
    target.resize(cfg_.maxMonitoredRegions);

  std::unordered_set<std::string> targetIds;
  for (const auto& t : target)
    targetIds.insert(t.site->id);

  // Evict: outside the target AND past the hysteresis radius.
  for (std::size_t i = live_.size(); i-- > 0;) {
    const auto& region = live_[i];
    if (targetIds.count(region.siteId) > 0)
      continue;
    if (distanceKm(here, region.center) > cfg_.evictionRadiusKm) {
      evict(i);
      ++stats.evicted;
    }
  }

  // Admit nearest first while there is room.
  for (const auto& t : target) {
    const CandidateSite& site = *t.site;
    const bool monitored = std::any_of(live_.begin(), live_.end(),
                                       [&](const MonitoredRegion& r) { return r.siteId == site.id; });
    if (monitored)
      continue;

    if (live_.size() >= cfg_.maxMonitoredRegions) {
      logger_->log(LogLevel::Debug, kTag, "capacity reached, deferring remaining admissions");
      break;
    }

    MonitoredRegion region;
    region.identifier = regionIdFor(site.id);
    region.siteId = site.id;
    region.center = site.coordinate;
    region.radiusM = cfg_.regionRadiusM;

    try {
      monitor_->install(region);
      live_.push_back(std::move(region));
      ++stats.admitted;
    } catch (const std::exception& e) {
      ++stats.failedInstalls;
      logger_->log(LogLevel::Warn, kTag, "install " + region.identifier + " rejected: " + e.what());
    }
  }
}

void RegionScheduler::evict(std::size_t index) {
  const MonitoredRegion region = live_[index];
  live_.erase(live_.begin() + static_cast<std::ptrdiff_t>(index));
  try {
    monitor_->remove(region.identifier);
  } catch (const std::exception& e) {
    logger_->log(LogLevel::Warn, kTag, "remove " + region.identifier + " failed: " + e.what());
  }
}

// -------------------------------------------------------------------
// platform callbacks
// -------------------------------------------------------------------
std::optional<std::string> RegionScheduler::siteIdFor(const std::string& regionId) const {
  if (!regionId.starts_with(cfg_.regionPrefix) || regionId.size() == cfg_.regionPrefix.size())
    return std::nullopt;
  return regionId.substr(cfg_.regionPrefix.size());
}

void RegionScheduler::handleRegionEnter(const std::string& regionId) {
  forward(regionId, SiteTransition::Enter);
}

void RegionScheduler::handleRegionExit(const std::string& regionId) {
  forward(regionId, SiteTransition::Exit);
}

void RegionScheduler::handleRegionState(const std::string& regionId, bool inside) {
  // Installed while already inside the circle: no crossing will ever fire.
  if (inside)
    forward(regionId, SiteTransition::Enter);
}

void RegionScheduler::handleMonitoringFailed(const std::optional<std::string>& regionId,
                                             const std::string& error) {
  logger_->log(LogLevel::Warn, kTag,
               "monitoring failed for " + regionId.value_or("<unknown region>") + ": " + error);
  if (!running_)
    return;

  platformFailure_ = true;
  if (!regionId)
    return;
  auto it = std::find_if(live_.begin(), live_.end(),
                         [&](const MonitoredRegion& r) { return r.identifier == *regionId; });
  if (it != live_.end())
    live_.erase(it); // the platform already dropped it
}

void RegionScheduler::forward(const std::string& regionId, SiteTransition transition) {
  if (!running_)
    return;
  auto siteId = siteIdFor(regionId);
  if (!siteId)
    return; // another feature's region

  logger_->log(LogLevel::Debug, kTag, std::string(model::toString(transition)) + " " + *siteId);
  if (sink_)
    sink_(model::SiteEvent{ *siteId, transition });
}

std::vector<std::string> RegionScheduler::monitoredSiteIds() const {
  std::vector<std::string> ids;
  ids.reserve(live_.size());
  for (const auto& r : live_)
    ids.push_back(r.siteId);
  return ids;
}

void RegionScheduler::post(std::function<void()> task) { executor_->post(guard_.wrap(std::move(task))); }
