#pragma once
/** @file  SimulatedLocationService.hpp
 *  @brief Host-side LocationService fed from recorded tracks.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>

#include "io/LocationService.hpp"

namespace divewatch {
  namespace io {

    /**
 * @class SimulatedLocationService
 * @brief Replays fixes through the same distance-filter/mode rules a device applies.
 *
 *  * Standard mode honours `SamplingSettings::distanceFilterM`.
 *  * Significant-change mode only reports moves of at least 500 m.
 *  * The consent "dialog" resolves immediately to the configured answer.
 *  * Single-threaded: drive it from one loop.
 */
    class SimulatedLocationService : public LocationService {
    public:
      static constexpr double kSignificantChangeM = 500.0;

      explicit SimulatedLocationService(
          model::AuthorizationStatus initial = model::AuthorizationStatus::NotDetermined,
          model::AuthorizationStatus answerOnPrompt = model::AuthorizationStatus::AuthorizedWhenInUse);

      //---LocationService---------------------------------------------------
      model::AuthorizationStatus authorizationStatus() const override { return status_; }
      void requestAuthorization() override;
      void startStandardUpdates() override { standard_ = true; }
      void stopStandardUpdates() override { standard_ = false; }
      void startSignificantChangeUpdates() override { significant_ = true; }
      void stopSignificantChangeUpdates() override { significant_ = false; }
      void configure(const SamplingSettings& settings) override { settings_ = settings; }

      //---driver side-------------------------------------------------------
      /// @returns true if the fix passed the active filter and was reported.
      bool deliver(const model::Position& position);
      void fail(const LocationFailure& failure);
      void setAuthorization(model::AuthorizationStatus status);

      int promptCount() const { return prompts_; }
      bool standardActive() const { return standard_; }
      bool significantActive() const { return significant_; }
      const SamplingSettings& settings() const { return settings_; }

    private:
      model::AuthorizationStatus status_;
      model::AuthorizationStatus answerOnPrompt_;
      SamplingSettings settings_{};
      bool standard_{ false };
      bool significant_{ false };
      int prompts_{ 0 };
      std::optional<model::Position> lastReported_{};
    };

  } // namespace io
} // namespace divewatch
