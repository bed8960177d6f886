#pragma once
/** @file  PermissionPhaseController.hpp
 *  @brief Location consent flow; the single gate in front of monitoring.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "model/PermissionPhase.hpp"

namespace divewatch {
  namespace core {
    class Logger;
    class PersistentStore;
  } // namespace core
  namespace io {
    class LocationService;
  } // namespace io

  namespace location {

    /**
 * @class PermissionPhaseController
 * @brief Owns the persisted PermissionPhase and its transition table.
 *
 *  | phase           | requestStart(false) | requestStart(true)          |
 *  |-----------------|---------------------|-----------------------------|
 *  | initial         | no-op               | -> explainerShown + prompt  |
 *  | explainerShown  | no-op               | prompt again                |
 *  | granted         | start monitoring    | start monitoring            |
 *  | denied          | no-op               | no-op (system settings only)|
 *
 *  * Never calls `requestAuthorization()` unless the user asked for it.
 *  * All methods run on the serialized executor.
 */
    class PermissionPhaseController {
    public:
      enum class StartOutcome : std::uint8_t { Started, PromptShown, NotStarted };

      using Hook = std::function<void()>;

      static constexpr const char* kPhaseKey = "divewatch.location.permissionPhase";

      PermissionPhaseController(std::shared_ptr<io::LocationService> location,
                                std::shared_ptr<core::PersistentStore> store,
                                std::shared_ptr<core::Logger> logger);
      ~PermissionPhaseController() = default;

      //---public API------------------------------------------------------
      model::PermissionPhase currentPhase() const { return phase_; }
      bool isGranted() const { return phase_ == model::PermissionPhase::Granted; }

      StartOutcome requestStart(bool userInitiated);
      void onSystemAuthorizationChanged(model::AuthorizationStatus status);

      /// User dismissed our explainer with "Not now".
      void userSkipped();

      /// Back to `initial`; forgets the persisted phase.
      void reset();

      void setStartHandler(Hook h) { onStart_ = std::move(h); }
      void setStopHandler(Hook h) { onStop_ = std::move(h); }

      PermissionPhaseController(const PermissionPhaseController&) = delete;
      PermissionPhaseController& operator=(const PermissionPhaseController&) = delete;

    private:
      void transitionTo(model::PermissionPhase next);
      void applyStatus(model::AuthorizationStatus status, bool notify);

      std::shared_ptr<io::LocationService> location_;
      std::shared_ptr<core::PersistentStore> store_;
      std::shared_ptr<core::Logger> logger_;
      model::PermissionPhase phase_{ model::PermissionPhase::Initial };
      Hook onStart_{};
      Hook onStop_{};
    };

  } // namespace location
} // namespace divewatch
