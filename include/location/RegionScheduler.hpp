#pragma once
/** @file  RegionScheduler.hpp
 *  @brief Admission/eviction core that keeps the platform's geofences pointed at
 *         the nearest dive sites.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// divewatch headers
#include "core/Clock.hpp"
#include "core/Executor.hpp"
#include "core/MonitorConfig.hpp"
#include "io/CandidateSiteSource.hpp"
#include "model/PerformancePolicy.hpp"
#include "model/Position.hpp"
#include "model/Region.hpp"

namespace divewatch {
  namespace core {
    class HealthMonitor;
    class Logger;
  } // namespace core
  namespace io {
    class RegionMonitor;
  } // namespace io

  namespace location {

    /**
 * @class RegionScheduler
 * @brief Sole owner of the live MonitoredRegion set.
 *
 *  One cycle per refresh interval (60 s at standard policy):
 *   1. query sites within the admission radius (50 km), nearest first;
 *   2. target = first `maxMonitoredRegions` of them, re-checked against the
 *      latest position;
 *   3. evict regions outside the target AND beyond the eviction radius (100 km);
 *      admit target sites while below capacity;
 *   4. report success + duration to HealthMonitor.
 *
 *  * Never more than `maxMonitoredRegions` live regions; capacity is checked
 *    right before every install.
 *  * At most one cycle in flight; positions arriving meanwhile collapse into a
 *    single follow-up cycle.
 *  * A position that lands inside the refresh window is not lost: one trailing
 *    cycle is armed for the moment the window closes.
 *  * `stop()` bumps the generation so late query results are discarded.
 *  * Public methods must be called on the serialized executor; platform
 *    callbacks are re-posted onto it.
 */
    class RegionScheduler {
    public:
      using SiteEventSink = std::function<void(const model::SiteEvent&)>;

      struct CycleStats {
        bool success{ false };
        std::chrono::milliseconds duration{ 0 };
        std::size_t admitted{ 0 };
        std::size_t evicted{ 0 };
        std::size_t failedInstalls{ 0 };
      };

      RegionScheduler(std::shared_ptr<io::RegionMonitor> monitor,
                      std::shared_ptr<io::CandidateSiteSource> sites,
                      std::shared_ptr<core::HealthMonitor> health,
                      std::shared_ptr<core::SerialExecutor> executor,
                      std::shared_ptr<const core::Clock> clock, core::SchedulerConfig cfg,
                      std::shared_ptr<core::Logger> logger);
      ~RegionScheduler(); ///< detach()

      /// Stops platform callbacks and query completions from reaching this object.
      /// Blocks while one of its tasks is running on the executor thread.
      void detach();

      //---public API------------------------------------------------------
      void start(); ///< idempotent; runs a cycle at once if a position is known
      void stop();  ///< idempotent; removes every installed region synchronously

      void onPosition(const model::Position& position);
      void setPolicy(model::PerformancePolicy policy) { policy_ = policy; }
      void setSiteEventSink(SiteEventSink sink) { sink_ = std::move(sink); }

      //---platform ingress (already on the executor)----------------------
      void handleRegionEnter(const std::string& regionId);
      void handleRegionExit(const std::string& regionId);
      void handleRegionState(const std::string& regionId, bool inside);
      void handleMonitoringFailed(const std::optional<std::string>& regionId, const std::string& error);

      //---region id scheme------------------------------------------------
      std::string regionIdFor(const std::string& siteId) const { return cfg_.regionPrefix + siteId; }
      std::optional<std::string> siteIdFor(const std::string& regionId) const;

      //---observers-------------------------------------------------------
      bool isRunning() const { return running_; }
      bool cycleInFlight() const { return inFlight_; }
      bool recomputePending() const { return pending_; }
      bool trailingCycleArmed() const { return trailingArmed_; }
      std::size_t monitoredCount() const { return live_.size(); }
      std::vector<std::string> monitoredSiteIds() const; ///< admission order
      const std::vector<model::MonitoredRegion>& monitoredRegions() const { return live_; }
      std::uint64_t cyclesCompleted() const { return cycles_; }
      const std::optional<CycleStats>& lastCycle() const { return lastCycle_; }

      RegionScheduler(const RegionScheduler&) = delete;
      RegionScheduler& operator=(const RegionScheduler&) = delete;

    private:
      bool throttled(core::SteadyPoint now) const;
      void armTrailingCycle(core::SteadyPoint now);
      void onTrailingDeadline(std::uint64_t generation);
      void beginCycle();
      void completeCycle(std::uint64_t generation, io::SiteQueryResult result);
      void applyDiff(const std::vector<model::CandidateSite>& candidates, CycleStats& stats);
      void evict(std::size_t index);
      void forward(const std::string& regionId, model::SiteTransition transition);
      void post(std::function<void()> task);

      std::shared_ptr<io::RegionMonitor> monitor_;
      std::shared_ptr<io::CandidateSiteSource> sites_;
      std::shared_ptr<core::HealthMonitor> health_;
      std::shared_ptr<core::SerialExecutor> executor_;
      std::shared_ptr<const core::Clock> clock_;
      core::SchedulerConfig cfg_;
      std::shared_ptr<core::Logger> logger_;

      SiteEventSink sink_{};
      std::vector<model::MonitoredRegion> live_; ///< <= cfg_.maxMonitoredRegions
      std::optional<model::Position> latest_{};
      model::PerformancePolicy policy_{ model::PerformancePolicy::Standard };

      bool running_{ false };
      bool inFlight_{ false };
      bool pending_{ false };        ///< one-slot coalesced recompute
      bool platformFailure_{ false }; ///< async monitoring failure since last cycle
      bool trailingPending_{ false }; ///< a throttled position has not been cycled yet
      bool trailingArmed_{ false };
      std::uint64_t generation_{ 0 };
      std::uint64_t cycles_{ 0 };
      core::SteadyPoint cycleStart_{};
      std::optional<core::SteadyPoint> lastCycleStart_{};
      std::optional<CycleStats> lastCycle_{};

      core::TaskGuard guard_; ///< every task this object posts runs through it
    };

  } // namespace location
} // namespace divewatch
