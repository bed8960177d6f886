/* @file SystemCoordinator.cpp
 * @brief subsystem construction, callback funnelling and the top-level state machine
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

// divewatch headers
#include "core/Clock.hpp"
#include "core/Executor.hpp"
#include "core/Logger.hpp"
#include "core/PersistentStore.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/CandidateSiteSource.hpp"
#include "io/LocationService.hpp"
#include "io/NotificationDispatcher.hpp"
#include "io/RegionMonitor.hpp"
#include "location/PermissionPhaseController.hpp"
#include "location/PositionProvider.hpp"
#include "location/RegionScheduler.hpp"

using namespace divewatch::core;
using divewatch::location::ProximityEvent;
using divewatch::location::ProximityEventKind;

namespace {

  constexpr const char* kTag = "SystemCoordinator";

  const char* toString(SystemCoordinator::State s) {
    switch (s) {
    case SystemCoordinator::State::Boot:
      return "boot";
    case SystemCoordinator::State::Idle:
      return "idle";
    case SystemCoordinator::State::Monitoring:
      return "monitoring";
    case SystemCoordinator::State::SafeMode:
      return "safe_mode";
    default:
      return "unknown";
    }
  }

} // namespace

SystemCoordinator::SystemCoordinator(Dependencies deps, MonitorConfig cfg)
    : deps_(std::move(deps)), cfg_(std::move(cfg)) {
  if (!deps_.executor || !deps_.clock || !deps_.logger || !deps_.store || !deps_.location ||
      !deps_.regions || !deps_.sites || !deps_.notifier)
    throw std::invalid_argument("[SystemCoordinator] missing dependency");
  validate(cfg_);
}

SystemCoordinator::~SystemCoordinator() {
  // the platform may outlive us; its callbacks must not reach freed components
  deps_.location->setHandlers({});
  guard_.close();
  if (scheduler_)
    scheduler_->detach();
}

void SystemCoordinator::initialize() {
  if (state_ != State::Boot)
    return;

  health_ = std::make_shared<HealthMonitor>(cfg_.health);
  permission_ = std::make_shared<location::PermissionPhaseController>(deps_.location, deps_.store,
                                                                      deps_.logger);
  positions_ = std::make_shared<location::PositionProvider>(deps_.location, permission_,
                                                            cfg_.location, deps_.logger);
  scheduler_ = std::make_shared<location::RegionScheduler>(deps_.regions, deps_.sites, health_,
                                                           deps_.executor, deps_.clock,
                                                           cfg_.scheduler, deps_.logger);
  proximity_ = std::make_shared<location::ProximityStateMachine>(deps_.clock, cfg_.proximity,
                                                                 deps_.logger);

  // --- platform location callbacks -> executor ---
  io::LocationService::Handlers lh;
  lh.onLocation = [this](const model::Position& p) { post([this, p] { positions_->handleLocation(p); }); };
  lh.onError = [this](const io::LocationFailure& f) { post([this, f] { positions_->handleFailure(f); }); };
  lh.onAuthorizationChanged = [this](model::AuthorizationStatus s) {
    post([this, s] { permission_->onSystemAuthorizationChanged(s); });
  };
  deps_.location->setHandlers(std::move(lh));

  // --- pipeline ---
  permission_->setStartHandler([this] { startMonitoring(); });
  permission_->setStopHandler([this] { stopMonitoring(); });
  positions_->onPositionUpdate([this](const model::Position& p) { scheduler_->onPosition(p); });
  scheduler_->setSiteEventSink([this](const model::SiteEvent& ev) { proximity_->handle(ev); });
  proximity_->setListener([this](const ProximityEvent& ev) { handleProximity(ev); });
  proximity_->setExitListener([this](const std::string& siteId, std::chrono::seconds dwell) {
    if (dwell < cfg_.proximity.completionDwell)
      deps_.notifier->cancel(siteId); // brief visit, the reminder is moot
  });
  health_->registerEscalation([this](SafeModeReason r) { handleSafeMode(r); });

  const io::NotificationAction logDive{ "LOG_DIVE", "Log Dive", true };
  const io::NotificationAction dismiss{ "DISMISS", "Not Now", false };
  deps_.notifier->registerCategories({ io::NotificationCategory{ io::kReminderCategory, { logDive, dismiss } },
                                       io::NotificationCategory{ io::kPromptCategory, { logDive, dismiss } } });

  transitionTo(State::Idle);
  deps_.logger->log(LogLevel::Info, kTag,
                    std::string("initialized, permission phase ") +
                        model::toString(permission_->currentPhase()));
}

void SystemCoordinator::launch() {
  post([this] { permission_->requestStart(false); });
}

void SystemCoordinator::handleEnableLocation() {
  post([this] { permission_->requestStart(true); });
}

void SystemCoordinator::handleSkipLocation() {
  post([this] { permission_->userSkipped(); });
}

void SystemCoordinator::setPerformancePolicy(model::PerformancePolicy policy) {
  post([this, policy] {
    positions_->applyPolicy(policy);
    scheduler_->setPolicy(policy);
  });
}

void SystemCoordinator::appDidEnterBackground() {
  post([this] { positions_->appDidEnterBackground(); });
}

void SystemCoordinator::appWillEnterForeground() {
  post([this] { positions_->appWillEnterForeground(); });
}

void SystemCoordinator::acknowledgeSafeMode() {
  post([this] {
    if (state_ != State::SafeMode)
      return;
    health_->reset();
    transitionTo(scheduler_->isRunning() ? State::Monitoring : State::Idle);
  });
}

void SystemCoordinator::shutdown() {
  post([this] { stopMonitoring(); });
}

// -------------------------------------------------------------------
// executor-side handlers
// -------------------------------------------------------------------
void SystemCoordinator::startMonitoring() {
  if (!positions_->start())
    return;
  if (auto p = positions_->currentPosition())
    scheduler_->onPosition(*p); // not running yet: only primes the latest fix
  scheduler_->start();
  if (state_ != State::SafeMode)
    transitionTo(State::Monitoring);
}

void SystemCoordinator::stopMonitoring() {
  scheduler_->stop();
  positions_->stop();
  if (state_ != State::SafeMode && state_ != State::Boot)
    transitionTo(State::Idle);
}

void SystemCoordinator::handleProximity(const ProximityEvent& ev) {
  switch (ev.kind) {
  case ProximityEventKind::Arrived:
    deps_.notifier->scheduleDelayed(ev.siteId, cfg_.proximity.reminderDelay);
    break;
  case ProximityEventKind::DiveCompleted:
    deps_.notifier->scheduleImmediate(ev.siteId);
    break;
  }
  for (const auto& cb : proximityListeners_)
    cb(ev);
}

void SystemCoordinator::handleSafeMode(SafeModeReason reason) {
  deps_.logger->log(LogLevel::Error, kTag, std::string("requesting safe mode: ") + toString(reason));
  transitionTo(State::SafeMode);
  for (const auto& cb : safeModeListeners_)
    cb(reason);
}

void SystemCoordinator::transitionTo(State next) {
  const State prev = state_.exchange(next);
  if (prev != next)
    deps_.logger->log(LogLevel::Debug, kTag,
                      std::string("state ") + ::toString(prev) + " -> " + ::toString(next));
}

void SystemCoordinator::post(std::function<void()> task) { deps_.executor->post(guard_.wrap(std::move(task))); }
