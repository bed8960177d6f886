/* @file LocationService.cpp
 * @brief string forms for location failures
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/LocationService.hpp"

const char* divewatch::io::toString(LocationError e) {
  switch (e) {
  case LocationError::PermissionDenied:
    return "permission_denied";
  case LocationError::LocationUnavailable:
    return "location_unavailable";
  case LocationError::SystemError:
    return "system_error";
  default:
    return "unknown";
  }
}
