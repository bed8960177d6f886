#pragma once
/** @file  ProximityStateMachine.hpp
 *  @brief away / atSite tracking and dive-completion inference.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "core/Clock.hpp"
#include "core/MonitorConfig.hpp"
#include "model/Region.hpp"

namespace divewatch {
  namespace core {
    class Logger;
  } // namespace core

  namespace location {

    enum class ProximityEventKind : std::uint8_t { Arrived, DiveCompleted };

    const char* toString(ProximityEventKind kind);

    struct ProximityEvent {
      ProximityEventKind kind{ ProximityEventKind::Arrived };
      std::string siteId;
      core::TimePoint at{};
      std::chrono::seconds dwell{ 0 }; ///< zero for arrivals
    };

    /**
 * @class ProximityStateMachine
 * @brief Turns resolved enter/exit signals into arrival and dive-completed events.
 *
 *  * away --enter(s)--> atSite(s, now)            emits Arrived
 *  * atSite(s, t) --exit(s)--> away               emits DiveCompleted iff now - t >= dwell threshold
 *  * atSite(a, t) --enter(b)--> exit(a), enter(b) in that order
 *  * Purely event driven; no timers.
 *  * Dwell is measured on the monotonic clock; `enteredAt()` stays wall time.
 */
    class ProximityStateMachine {
    public:
      using Listener = std::function<void(const ProximityEvent&)>;
      /// Fired on every exit with its dwell, whether or not it counted as a dive.
      using ExitListener = std::function<void(const std::string& siteId, std::chrono::seconds dwell)>;

      ProximityStateMachine(std::shared_ptr<const core::Clock> clock, core::ProximityConfig cfg,
                            std::shared_ptr<core::Logger> logger);

      void handle(const model::SiteEvent& event);
      void enter(const std::string& siteId);
      void exit(const std::string& siteId);

      void setListener(Listener l) { listener_ = std::move(l); }
      void setExitListener(ExitListener l) { exitListener_ = std::move(l); }

      bool isAtSite() const { return currentSite_.has_value(); }
      const std::optional<std::string>& currentSiteId() const { return currentSite_; }
      const std::optional<core::TimePoint>& enteredAt() const { return enteredAt_; }

    private:
      void emit(ProximityEvent ev);

      std::shared_ptr<const core::Clock> clock_;
      core::ProximityConfig cfg_;
      std::shared_ptr<core::Logger> logger_;
      Listener listener_{};
      ExitListener exitListener_{};

      std::optional<std::string> currentSite_{};
      std::optional<core::TimePoint> enteredAt_{};
      core::SteadyPoint enteredMonotonic_{};
    };

  } // namespace location
} // namespace divewatch
