#pragma once
/** @file  LocationService.hpp
 *  @brief Adapter interface over the platform location + authorization service.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "model/PermissionPhase.hpp"
#include "model/Position.hpp"

namespace divewatch {
  namespace io {

    /// Coarseness requested from the positioning hardware.
    enum class Accuracy : std::uint8_t { Best, TenMeters, HundredMeters, Kilometer };

    struct SamplingSettings {
      Accuracy accuracy{ Accuracy::Best };
      double distanceFilterM{ 50.0 }; ///< minimum movement between reported fixes
    };

    enum class LocationError : std::uint8_t { PermissionDenied, LocationUnavailable, SystemError };

    const char* toString(LocationError e);

    struct LocationFailure {
      LocationError code{ LocationError::SystemError };
      std::string detail;
    };

    /**
 * @class LocationService
 * @brief Thin seam between the platform and PositionProvider/PermissionPhaseController.
 *
 *  * Handlers may be invoked on any platform thread; consumers re-post them.
 *  * `authorizationStatus()` is a pure read. Only `requestAuthorization()`
 *    may put a consent dialog on screen.
 */
    class LocationService {
    public:
      struct Handlers {
        std::function<void(const model::Position&)> onLocation{};
        std::function<void(const LocationFailure&)> onError{};
        std::function<void(model::AuthorizationStatus)> onAuthorizationChanged{};
      };

      virtual ~LocationService() = default;

      virtual model::AuthorizationStatus authorizationStatus() const = 0;
      virtual void requestAuthorization() = 0;

      virtual void startStandardUpdates() = 0;
      virtual void stopStandardUpdates() = 0;
      virtual void startSignificantChangeUpdates() = 0;
      virtual void stopSignificantChangeUpdates() = 0;

      virtual void configure(const SamplingSettings& settings) = 0;

      void setHandlers(Handlers h) { handlers_ = std::move(h); }

    protected:
      Handlers handlers_{};
    };

  } // namespace io
} // namespace divewatch
