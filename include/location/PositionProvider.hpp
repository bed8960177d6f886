#pragma once
/** @file  PositionProvider.hpp
 *  @brief Location stream with power- and lifecycle-aware sampling.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "core/MonitorConfig.hpp"
#include "io/LocationService.hpp"
#include "model/PerformancePolicy.hpp"
#include "model/Position.hpp"

namespace divewatch {
  namespace core {
    class Logger;
  } // namespace core

  namespace location {

    class PermissionPhaseController;

    /**
 * @class PositionProvider
 * @brief Wraps io::LocationService; fans fixes out to subscribers.
 *
 *  * Standard mode: continuous updates with the policy's accuracy/distance filter.
 *  * Significant-change mode: coarse low-power updates while backgrounded
 *    under a non-standard policy.
 *  * Platform errors reach subscribers as LocationFailure; the stream keeps running.
 *  * All methods run on the serialized executor.
 */
    class PositionProvider {
    public:
      enum class SamplingMode : std::uint8_t { Off, Standard, SignificantChange };

      using PositionCallback = std::function<void(const model::Position&)>;
      using FailureCallback = std::function<void(const io::LocationFailure&)>;

      PositionProvider(std::shared_ptr<io::LocationService> location,
                       std::shared_ptr<const PermissionPhaseController> permission,
                       core::LocationConfig cfg, std::shared_ptr<core::Logger> logger);

      //---public API------------------------------------------------------
      /// @returns true if updates are running afterwards.
      bool start();
      void stop();

      std::optional<model::Position> currentPosition() const { return last_; }

      void onPositionUpdate(PositionCallback onPosition, FailureCallback onFailure = {});

      void applyPolicy(model::PerformancePolicy policy);
      void appDidEnterBackground();
      void appWillEnterForeground();

      //---platform ingress (already on the executor)----------------------
      void handleLocation(const model::Position& position);
      void handleFailure(const io::LocationFailure& failure);

      //---observers-------------------------------------------------------
      bool isRunning() const { return running_; }
      SamplingMode mode() const { return mode_; }
      const io::SamplingSettings& settings() const { return settings_; }
      model::PerformancePolicy policy() const { return policy_; }
      int consecutiveFailures() const { return consecutiveFailures_; }

    private:
      struct Subscriber {
        PositionCallback onPosition;
        FailureCallback onFailure;
      };

      io::SamplingSettings settingsFor(model::PerformancePolicy policy) const;
      void switchToSignificantChange();
      void switchToStandard();

      std::shared_ptr<io::LocationService> location_;
      std::shared_ptr<const PermissionPhaseController> permission_;
      core::LocationConfig cfg_;
      std::shared_ptr<core::Logger> logger_;

      std::vector<Subscriber> subscribers_;
      std::optional<model::Position> last_{};
      model::PerformancePolicy policy_{ model::PerformancePolicy::Standard };
      io::SamplingSettings settings_{};
      SamplingMode mode_{ SamplingMode::Off };
      bool running_{ false };
      bool inBackground_{ false };
      bool resumeStandardOnForeground_{ false };
      int consecutiveFailures_{ 0 };
    };

  } // namespace location
} // namespace divewatch
