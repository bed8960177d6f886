/* @file PositionProvider.cpp
 * @brief sampling-mode switching and subscriber fan-out
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

// divewatch headers
#include "core/Logger.hpp"
#include "location/PermissionPhaseController.hpp"
#include "location/PositionProvider.hpp"

using namespace divewatch::location;
using divewatch::core::LogLevel;
using divewatch::model::PerformancePolicy;

namespace {
  constexpr const char* kTag = "PositionProvider";
}

PositionProvider::PositionProvider(std::shared_ptr<io::LocationService> location,
                                   std::shared_ptr<const PermissionPhaseController> permission,
                                   core::LocationConfig cfg, std::shared_ptr<core::Logger> logger)
    : location_(std::move(location)), permission_(std::move(permission)), cfg_(cfg),
      logger_(std::move(logger)) {
  if (!location_ || !permission_ || !logger_)
    throw std::invalid_argument("[PositionProvider] null dependency");
  settings_ = settingsFor(policy_);
}

bool PositionProvider::start() {
  if (!permission_->isGranted()) {
    logger_->log(LogLevel::Info, kTag, "not started: location permission not granted");
    return false;
  }
  if (running_)
    return true;

  running_ = true;
  location_->configure(settings_);

  if (inBackground_ && policy_ != PerformancePolicy::Standard) {
    location_->startSignificantChangeUpdates();
    mode_ = SamplingMode::SignificantChange;
    resumeStandardOnForeground_ = true;
  } else {
    location_->startStandardUpdates();
    mode_ = SamplingMode::Standard;
  }
  logger_->log(LogLevel::Info, kTag,
               std::string("updates started, policy ") + model::toString(policy_));
  return true;
}

void PositionProvider::stop() {
  if (!running_)
    return;
  running_ = false;
  location_->stopStandardUpdates();
  location_->stopSignificantChangeUpdates();
  mode_ = SamplingMode::Off;
  resumeStandardOnForeground_ = false;
  logger_->log(LogLevel::Info, kTag, "updates stopped");
}

void PositionProvider::onPositionUpdate(PositionCallback onPosition, FailureCallback onFailure) {
  subscribers_.push_back(Subscriber{ std::move(onPosition), std::move(onFailure) });
}

void PositionProvider::applyPolicy(PerformancePolicy policy) {
  policy_ = policy;
  settings_ = settingsFor(policy);
  location_->configure(settings_);
  logger_->log(LogLevel::Debug, kTag,
               std::string("policy ") + model::toString(policy) + ", distance filter " +
                   std::to_string(static_cast<int>(settings_.distanceFilterM)) + " m");
}

void PositionProvider::appDidEnterBackground() {
  inBackground_ = true;
  if (!running_)
    return;
  if (policy_ != PerformancePolicy::Standard) {
    switchToSignificantChange();
    resumeStandardOnForeground_ = true;
  }
}

void PositionProvider::appWillEnterForeground() {
  inBackground_ = false;
  if (!running_)
    return;
  if (resumeStandardOnForeground_ || mode_ == SamplingMode::SignificantChange) {
    switchToStandard();
    resumeStandardOnForeground_ = false;
  }
}

void PositionProvider::handleLocation(const model::Position& position) {
  if (!running_)
    return; // late delivery after stop()

  consecutiveFailures_ = 0;
  last_ = position;
  for (const auto& sub : subscribers_) {
    if (sub.onPosition)
      sub.onPosition(position);
  }
}

void PositionProvider::handleFailure(const io::LocationFailure& failure) {
  ++consecutiveFailures_;
  logger_->log(LogLevel::Warn, kTag,
               std::string("location failure ") + io::toString(failure.code) +
                   (failure.detail.empty() ? "" : ": " + failure.detail));
  for (const auto& sub : subscribers_) {
    if (sub.onFailure)
      sub.onFailure(failure);
  }
}

divewatch::io::SamplingSettings PositionProvider::settingsFor(PerformancePolicy policy) const {
  switch (policy) {
  case PerformancePolicy::BoatMode:
    return { io::Accuracy::HundredMeters,
             std::max(cfg_.reducedDistanceFilterFloorM, cfg_.boatModeDistanceFilterM) };
  case PerformancePolicy::ThermalThrottled:
    return { io::Accuracy::HundredMeters,
             std::max(cfg_.reducedDistanceFilterFloorM, cfg_.thermalDistanceFilterM) };
  case PerformancePolicy::Critical:
    return { io::Accuracy::HundredMeters,
             std::max(cfg_.reducedDistanceFilterFloorM, cfg_.criticalDistanceFilterM) };
  case PerformancePolicy::Standard:
  default:
    return { io::Accuracy::Best, cfg_.standardDistanceFilterM };
  }
}

void PositionProvider::switchToSignificantChange() {
  if (mode_ == SamplingMode::SignificantChange)
    return;
  location_->stopStandardUpdates();
  location_->startSignificantChangeUpdates();
  mode_ = SamplingMode::SignificantChange;
  logger_->log(LogLevel::Info, kTag, "switched to significant-change sampling");
}

void PositionProvider::switchToStandard() {
  if (mode_ == SamplingMode::SignificantChange)
    location_->stopSignificantChangeUpdates();
  if (mode_ != SamplingMode::Standard) {
    location_->startStandardUpdates();
    mode_ = SamplingMode::Standard;
    logger_->log(LogLevel::Info, kTag, "switched to standard sampling");
  }
}
