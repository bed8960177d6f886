/* @file ProximityStateMachine.cpp
 * @brief proximity session transitions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// divewatch headers
#include "core/Logger.hpp"
#include "location/ProximityStateMachine.hpp"

using namespace divewatch::location;
using divewatch::core::LogLevel;

namespace {
  constexpr const char* kTag = "ProximityStateMachine";
}

const char* divewatch::location::toString(ProximityEventKind kind) {
  switch (kind) {
  case ProximityEventKind::Arrived:
    return "arrived";
  case ProximityEventKind::DiveCompleted:
    return "dive_completed";
  default:
    return "unknown";
  }
}

ProximityStateMachine::ProximityStateMachine(std::shared_ptr<const core::Clock> clock,
                                             core::ProximityConfig cfg,
                                             std::shared_ptr<core::Logger> logger)
    : clock_(std::move(clock)), cfg_(cfg), logger_(std::move(logger)) {
  if (!clock_ || !logger_)
    throw std::invalid_argument("[ProximityStateMachine] null dependency");
}

void ProximityStateMachine::handle(const model::SiteEvent& event) {
  switch (event.transition) {
  case model::SiteTransition::Enter:
    enter(event.siteId);
    break;
  case model::SiteTransition::Exit:
    exit(event.siteId);
    break;
  }
}

void ProximityStateMachine::enter(const std::string& siteId) {
  if (currentSite_) {
    if (*currentSite_ == siteId)
      return; // duplicate (e.g. state determination after a crossing)
    exit(*currentSite_);
  }

  const auto now = clock_->now();
  currentSite_ = siteId;
  enteredAt_ = now;
  enteredMonotonic_ = clock_->monotonic();
  logger_->log(LogLevel::Info, kTag, "arrived at " + siteId);
  emit(ProximityEvent{ ProximityEventKind::Arrived, siteId, now, std::chrono::seconds{ 0 } });
}

void ProximityStateMachine::exit(const std::string& siteId) {
  if (!currentSite_ || *currentSite_ != siteId)
    return;

  const auto now = clock_->now();
  const auto dwell =
      std::chrono::duration_cast<std::chrono::seconds>(clock_->monotonic() - enteredMonotonic_);
  currentSite_.reset();
  enteredAt_.reset();

  logger_->log(LogLevel::Info, kTag,
               "left " + siteId + " after " + std::to_string(dwell.count()) + " s");
  if (exitListener_)
    exitListener_(siteId, dwell);

  if (dwell >= cfg_.completionDwell)
    emit(ProximityEvent{ ProximityEventKind::DiveCompleted, siteId, now, dwell });
}

void ProximityStateMachine::emit(ProximityEvent ev) {
  if (listener_)
    listener_(ev);
}
