/* @file PermissionPhaseController.cpp
 * @brief consent flow transitions, persistence and platform status mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// divewatch headers
#include "core/Logger.hpp"
#include "core/PersistentStore.hpp"
#include "io/LocationService.hpp"
#include "location/PermissionPhaseController.hpp"

using namespace divewatch::location;
using divewatch::core::LogLevel;
using divewatch::model::AuthorizationStatus;
using divewatch::model::PermissionPhase;

namespace {
  constexpr const char* kTag = "PermissionPhaseController";
}

PermissionPhaseController::PermissionPhaseController(std::shared_ptr<io::LocationService> location,
                                                     std::shared_ptr<core::PersistentStore> store,
                                                     std::shared_ptr<core::Logger> logger)
    : location_(std::move(location)), store_(std::move(store)), logger_(std::move(logger)) {
  if (!location_ || !store_ || !logger_)
    throw std::invalid_argument("[PermissionPhaseController] null dependency");

  if (auto saved = store_->get(kPhaseKey)) {
    if (auto parsed = model::permissionPhaseFromString(*saved)) {
      phase_ = *parsed;
    } else {
      logger_->log(LogLevel::Warn, kTag, "ignoring unknown persisted phase '" + *saved + "'");
    }
  }

  // Status read only; a determined status may skip the explainer entirely.
  applyStatus(location_->authorizationStatus(), false);
}

PermissionPhaseController::StartOutcome PermissionPhaseController::requestStart(bool userInitiated) {
  switch (phase_) {
  case PermissionPhase::Denied:
    logger_->log(LogLevel::Info, kTag, "start refused: permission denied");
    return StartOutcome::NotStarted;

  case PermissionPhase::Granted:
    if (onStart_)
      onStart_();
    return StartOutcome::Started;

  case PermissionPhase::Initial:
  case PermissionPhase::ExplainerShown:
  default:
    if (!userInitiated)
      return StartOutcome::NotStarted;
    transitionTo(PermissionPhase::ExplainerShown);
    logger_->log(LogLevel::Info, kTag, "requesting system location authorization");
    location_->requestAuthorization();
    return StartOutcome::PromptShown;
  }
}

void PermissionPhaseController::onSystemAuthorizationChanged(AuthorizationStatus status) {
  applyStatus(status, true);
}

void PermissionPhaseController::userSkipped() {
  if (phase_ == PermissionPhase::Initial || phase_ == PermissionPhase::ExplainerShown)
    transitionTo(PermissionPhase::Denied);
}

void PermissionPhaseController::reset() {
  const bool wasGranted = phase_ == PermissionPhase::Granted;
  phase_ = PermissionPhase::Initial;
  store_->erase(kPhaseKey);
  logger_->log(LogLevel::Info, kTag, "phase reset to initial");
  if (wasGranted && onStop_)
    onStop_();
}

void PermissionPhaseController::applyStatus(AuthorizationStatus status, bool notify) {
  const PermissionPhase before = phase_;

  switch (status) {
  case AuthorizationStatus::AuthorizedWhenInUse:
  case AuthorizationStatus::AuthorizedAlways:
    transitionTo(PermissionPhase::Granted);
    break;
  case AuthorizationStatus::Denied:
  case AuthorizationStatus::Restricted:
    transitionTo(PermissionPhase::Denied);
    break;
  case AuthorizationStatus::NotDetermined:
  default:
    return; // keep initial / explainerShown as is
  }

  if (!notify || before == phase_)
    return;
  if (phase_ == PermissionPhase::Granted && onStart_)
    onStart_();
  else if (before == PermissionPhase::Granted && onStop_)
    onStop_();
}

void PermissionPhaseController::transitionTo(PermissionPhase next) {
  if (phase_ == next)
    return;
  logger_->log(LogLevel::Info, kTag,
               std::string("phase ") + model::toString(phase_) + " -> " + model::toString(next));
  phase_ = next;
  store_->set(kPhaseKey, model::toString(phase_));
}
