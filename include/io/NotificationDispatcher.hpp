#pragma once
/** @file  NotificationDispatcher.hpp
 *  @brief Local reminder scheduling contract (delivery lives outside this core).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>
#include <vector>

namespace divewatch {
  namespace io {

    struct NotificationAction {
      std::string identifier; ///< e.g. "LOG_DIVE"
      std::string title;
      bool opensApp{ false };
    };

    struct NotificationCategory {
      std::string identifier; ///< e.g. "DIVE_LOG_REMINDER"
      std::vector<NotificationAction> actions;
    };

    inline constexpr const char* kReminderCategory = "DIVE_LOG_REMINDER";
    inline constexpr const char* kPromptCategory = "DIVE_LOG_PROMPT";

    /**
 * @class NotificationDispatcher
 * @brief Reminders keyed by site id; scheduling again for the same site replaces.
 */
    class NotificationDispatcher {
    public:
      virtual ~NotificationDispatcher() = default;

      virtual void registerCategories(const std::vector<NotificationCategory>& categories) = 0;
      virtual void scheduleDelayed(const std::string& siteId, std::chrono::seconds delay) = 0;
      virtual void scheduleImmediate(const std::string& siteId) = 0;
      virtual void cancel(const std::string& siteId) = 0;
    };

  } // namespace io
} // namespace divewatch
