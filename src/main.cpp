/* @file main.cpp
 * @brief divewatch_replay: drives the geofence pipeline from a recorded track
 *
 * usage: divewatch_replay <config.json> <sites.json> <track.json>
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// divewatch headers
#include "core/Clock.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Executor.hpp"
#include "core/Logger.hpp"
#include "core/MonitorConfig.hpp"
#include "core/PersistentStore.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/ConsoleNotificationDispatcher.hpp"
#include "io/JsonSiteCatalog.hpp"
#include "io/SimulatedLocationService.hpp"
#include "io/SoftwareRegionMonitor.hpp"
#include "location/RegionScheduler.hpp"

using namespace divewatch;
using nlohmann::json;

namespace {

  model::AuthorizationStatus authorizationFromString(const std::string& name) {
    if (name == "notDetermined")
      return model::AuthorizationStatus::NotDetermined;
    if (name == "restricted")
      return model::AuthorizationStatus::Restricted;
    if (name == "denied")
      return model::AuthorizationStatus::Denied;
    if (name == "authorizedWhenInUse")
      return model::AuthorizationStatus::AuthorizedWhenInUse;
    if (name == "authorizedAlways")
      return model::AuthorizationStatus::AuthorizedAlways;
    throw std::invalid_argument("[replay] unknown authorization status '" + name + "'");
  }

  model::ThermalState thermalFromString(const std::string& name) {
    if (name == "nominal")
      return model::ThermalState::Nominal;
    if (name == "fair")
      return model::ThermalState::Fair;
    if (name == "serious")
      return model::ThermalState::Serious;
    if (name == "critical")
      return model::ThermalState::Critical;
    throw std::invalid_argument("[replay] unknown thermal state '" + name + "'");
  }

  core::TimePoint at(double seconds) {
    return core::TimePoint{} + std::chrono::duration_cast<core::TimePoint::duration>(
                                   std::chrono::duration<double>(seconds));
  }

} // namespace

int main(int argc, char* argv[]) {
  if (argc != 4) {
    std::cerr << "usage: " << argv[0] << " <config.json> <sites.json> <track.json>\n";
    return 2;
  }

  using Shape = core::ConfigLoader::Shape;
  try {
    const core::MonitorConfig cfg = core::parseMonitorConfig(core::ConfigLoader(argv[1], Shape::Object).load());
    auto sites = std::make_shared<io::JsonSiteCatalog>(
        io::JsonSiteCatalog::parse(core::ConfigLoader(argv[2], Shape::ObjectOrArray).load()));
    const json track = core::ConfigLoader(argv[3], Shape::ObjectOrArray).load();
    const json& events = track.is_object() ? track.at("events") : track;
    if (!events.is_array())
      throw std::invalid_argument("[replay] track must be an array of events");

    auto logger = std::make_shared<core::Logger>();
    if (!cfg.logFile.empty() && !logger->startNewRun(cfg.logFile))
      throw std::runtime_error("[replay] cannot open log file " + cfg.logFile);

    auto store = cfg.stateFile.empty() ? std::make_shared<core::PersistentStore>()
                                       : std::make_shared<core::PersistentStore>(cfg.stateFile);
    store->load();

    const auto initialAuth = authorizationFromString(
        track.is_object() ? track.value("initial_authorization", "notDetermined") : "notDetermined");
    const auto answer = authorizationFromString(
        track.is_object() ? track.value("answer_on_prompt", "authorizedWhenInUse") : "authorizedWhenInUse");

    auto clock = std::make_shared<core::ManualClock>();
    auto executor = std::make_shared<core::ManualExecutor>(clock);
    auto location = std::make_shared<io::SimulatedLocationService>(initialAuth, answer);
    auto regions = std::make_shared<io::SoftwareRegionMonitor>(cfg.scheduler.maxMonitoredRegions);
    auto notifier = std::make_shared<io::ConsoleNotificationDispatcher>(std::cout);

    core::SystemCoordinator::Dependencies deps;
    deps.executor = executor;
    deps.clock = clock;
    deps.logger = logger;
    deps.store = store;
    deps.location = location;
    deps.regions = regions;
    deps.sites = sites;
    deps.notifier = notifier;

    core::SystemCoordinator coordinator(deps, cfg);
    coordinator.initialize();

    double now = 0.0;
    coordinator.onProximity([&now](const location::ProximityEvent& ev) {
      std::cout << "t=" << now << "  " << location::toString(ev.kind) << " site=" << ev.siteId;
      if (ev.kind == location::ProximityEventKind::DiveCompleted)
        std::cout << " dwell=" << ev.dwell.count() << "s";
      std::cout << '\n';
    });
    coordinator.onSafeMode([&now](core::SafeModeReason r) {
      std::cout << "t=" << now << "  safe_mode reason=" << core::toString(r) << '\n';
    });

    coordinator.launch();
    executor->runPending();

    for (const auto& ev : events) {
      now = ev.value("t", now);
      clock->set(at(now));
      const std::string type = ev.at("type").get<std::string>();

      if (type == "position") {
        model::Position p;
        p.coordinate.latitude = ev.at("lat").get<double>();
        p.coordinate.longitude = ev.at("lon").get<double>();
        p.accuracyM = ev.value("acc", 10.0);
        p.timestamp = clock->now();
        location->deliver(p);
        executor->runPending();
        regions->updatePosition(p);
      } else if (type == "background") {
        coordinator.appDidEnterBackground();
      } else if (type == "foreground") {
        coordinator.appWillEnterForeground();
      } else if (type == "policy") {
        model::PowerSignals signals;
        signals.thermal = thermalFromString(ev.value("thermal", "nominal"));
        signals.boatModeEnabled = ev.value("boat_mode", false);
        signals.lowPowerModeEnabled = ev.value("low_power", false);
        coordinator.setPerformancePolicy(model::resolvePolicy(signals));
      } else if (type == "authorization") {
        location->setAuthorization(authorizationFromString(ev.at("status").get<std::string>()));
      } else if (type == "enable_location") {
        coordinator.handleEnableLocation();
      } else if (type == "skip_location") {
        coordinator.handleSkipLocation();
      } else if (type == "catalog_remove") {
        sites->remove(ev.at("id").get<std::string>());
      } else if (type == "fail_region") {
        regions->failRegion(ev.at("id").get<std::string>(), ev.value("error", "simulated"));
      } else {
        throw std::invalid_argument("[replay] unknown event type '" + type + "'");
      }
      executor->runPending();
    }

    const auto monitored = coordinator.scheduler().monitoredSiteIds();
    std::cout << "done: " << coordinator.scheduler().cyclesCompleted() << " cycles, "
              << monitored.size() << " regions monitored, permission "
              << model::toString(location->authorizationStatus()) << '\n';

    coordinator.shutdown();
    executor->runPending();
    logger->finishRun();
  } catch (const std::exception& e) {
    std::cerr << "[replay] " << e.what() << '\n';
    return 1;
  }
  return 0;
}
