#pragma once
/** @file  PermissionPhase.hpp
 *  @brief Location consent flow phases and platform authorization states.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace divewatch {
  namespace model {

    /**
 * @enum PermissionPhase
 * @brief Where the user is in our consent flow.
 *
 *  initial -> explainerShown -> {granted | denied}. Only the platform
 *  authorization callback (or an explicit reset) moves backwards.
 */
    enum class PermissionPhase : std::uint8_t { Initial, ExplainerShown, Granted, Denied };

    /// Mirrors the platform's authorization enum.
    enum class AuthorizationStatus : std::uint8_t {
      NotDetermined,
      Restricted,
      Denied,
      AuthorizedWhenInUse,
      AuthorizedAlways
    };

    inline const char* toString(PermissionPhase p) {
      switch (p) {
      case PermissionPhase::Initial:
        return "initial";
      case PermissionPhase::ExplainerShown:
        return "explainerShown";
      case PermissionPhase::Granted:
        return "granted";
      case PermissionPhase::Denied:
        return "denied";
      default:
        return "unknown";
      }
    }

    /// Inverse of toString(); std::nullopt for unknown names.
    inline std::optional<PermissionPhase> permissionPhaseFromString(std::string_view name) {
      if (name == "initial")
        return PermissionPhase::Initial;
      if (name == "explainerShown")
        return PermissionPhase::ExplainerShown;
      if (name == "granted")
        return PermissionPhase::Granted;
      if (name == "denied")
        return PermissionPhase::Denied;
      return std::nullopt;
    }

    inline const char* toString(AuthorizationStatus s) {
      switch (s) {
      case AuthorizationStatus::NotDetermined:
        return "notDetermined";
      case AuthorizationStatus::Restricted:
        return "restricted";
      case AuthorizationStatus::Denied:
        return "denied";
      case AuthorizationStatus::AuthorizedWhenInUse:
        return "authorizedWhenInUse";
      case AuthorizationStatus::AuthorizedAlways:
        return "authorizedAlways";
      default:
        return "unknown";
      }
    }

  } // namespace model
} // namespace divewatch
