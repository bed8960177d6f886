#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for divewatch::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "core/Executor.hpp"
#include "core/HealthMonitor.hpp"
#include "core/MonitorConfig.hpp"
#include "location/ProximityStateMachine.hpp"
#include "model/PerformancePolicy.hpp"

namespace divewatch {
  namespace io {
    class CandidateSiteSource;
    class LocationService;
    class NotificationDispatcher;
    class RegionMonitor;
  } // namespace io
  namespace location {
    class PermissionPhaseController;
    class PositionProvider;
    class RegionScheduler;
  } // namespace location

  namespace core {

    class Clock;
    class Logger;
    class PersistentStore;

    /**
 * @class SystemCoordinator
 * @brief Builds and wires the geofence pipeline; the application's only entry point.
 *
 *  * Every public call (and every platform callback) is posted onto the
 *    serialized executor; nothing else touches component state.
 *  * Register listeners before `launch()`.
 *  * Safe mode is advisory: we report it, the application decides what it means.
 *  * Destruction waits for a task already running on the executor thread and
 *    drops the rest; do not destroy it from inside one of its own callbacks.
 */
    class SystemCoordinator {

    public:
      enum class State : std::uint8_t { Boot, Idle, Monitoring, SafeMode };

      struct Dependencies {
        std::shared_ptr<SerialExecutor> executor;
        std::shared_ptr<const Clock> clock;
        std::shared_ptr<Logger> logger;
        std::shared_ptr<PersistentStore> store;
        std::shared_ptr<io::LocationService> location;
        std::shared_ptr<io::RegionMonitor> regions;
        std::shared_ptr<io::CandidateSiteSource> sites;
        std::shared_ptr<io::NotificationDispatcher> notifier;
      };

      using SafeModeListener = std::function<void(SafeModeReason)>;
      using ProximityListener = std::function<void(const location::ProximityEvent&)>;

      SystemCoordinator(Dependencies deps, MonitorConfig cfg);
      ~SystemCoordinator(); ///< detaches from the platform and fences the executor

      // ---- Public API ----
      void initialize();             ///< build subsystems, register notification categories
      void launch();                 ///< app start: resume monitoring only if already granted
      void handleEnableLocation();   ///< user tapped "Enable location"
      void handleSkipLocation();     ///< user tapped "Not now"
      void setPerformancePolicy(model::PerformancePolicy policy);
      void appDidEnterBackground();
      void appWillEnterForeground();
      void acknowledgeSafeMode(); ///< application handled the degradation; re-arm
      void shutdown();            ///< stop monitoring, remove every region

      void onSafeMode(SafeModeListener cb) { safeModeListeners_.push_back(std::move(cb)); }
      void onProximity(ProximityListener cb) { proximityListeners_.push_back(std::move(cb)); }

      State state() const { return state_.load(); }

      // ---- component access (executor thread / tests only) ----
      location::PermissionPhaseController& permission() { return *permission_; }
      location::PositionProvider& positions() { return *positions_; }
      location::RegionScheduler& scheduler() { return *scheduler_; }
      location::ProximityStateMachine& proximity() { return *proximity_; }
      HealthMonitor& health() { return *health_; }

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      void post(std::function<void()> task);
      void startMonitoring();
      void stopMonitoring();
      void handleProximity(const location::ProximityEvent& ev);
      void handleSafeMode(SafeModeReason reason);
      void transitionTo(State next);

      Dependencies deps_;
      MonitorConfig cfg_;

      std::shared_ptr<HealthMonitor> health_;
      std::shared_ptr<location::PermissionPhaseController> permission_;
      std::shared_ptr<location::PositionProvider> positions_;
      std::shared_ptr<location::RegionScheduler> scheduler_;
      std::shared_ptr<location::ProximityStateMachine> proximity_;

      std::vector<SafeModeListener> safeModeListeners_;
      std::vector<ProximityListener> proximityListeners_;
      std::atomic<State> state_{ State::Boot };
      TaskGuard guard_;
    };

  } // namespace core
} // namespace divewatch
