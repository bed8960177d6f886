/* @file SimulatedLocationService.cpp
 * @brief track-driven location source with device-like filtering
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/SimulatedLocationService.hpp"
#include "location/GeoMath.hpp"

using namespace divewatch::io;
using divewatch::model::AuthorizationStatus;

SimulatedLocationService::SimulatedLocationService(AuthorizationStatus initial,
                                                   AuthorizationStatus answerOnPrompt)
    : status_(initial), answerOnPrompt_(answerOnPrompt) {}

void SimulatedLocationService::requestAuthorization() {
  ++prompts_;
  if (status_ == AuthorizationStatus::NotDetermined)
    setAuthorization(answerOnPrompt_);
}

void SimulatedLocationService::setAuthorization(AuthorizationStatus status) {
  if (status == status_)
    return;
  status_ = status;
  if (handlers_.onAuthorizationChanged)
    handlers_.onAuthorizationChanged(status_);
}

bool SimulatedLocationService::deliver(const model::Position& position) {
  if (!standard_ && !significant_)
    return false;

  const double filterM = significant_ && !standard_ ? kSignificantChangeM : settings_.distanceFilterM;
  if (lastReported_ &&
      location::distanceMeters(lastReported_->coordinate, position.coordinate) < filterM)
    return false;

  lastReported_ = position;
  if (handlers_.onLocation)
    handlers_.onLocation(position);
  return true;
}

void SimulatedLocationService::fail(const LocationFailure& failure) {
  if (handlers_.onError)
    handlers_.onError(failure);
}
