#pragma once
/** @file  ConsoleNotificationDispatcher.hpp
 *  @brief NotificationDispatcher that prints reminders instead of delivering them.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <iosfwd>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "io/NotificationDispatcher.hpp"

namespace divewatch {
  namespace io {

    /**
 * @class ConsoleNotificationDispatcher
 * @brief One pending reminder per site; scheduling again replaces it.
 */
    class ConsoleNotificationDispatcher : public NotificationDispatcher {
    public:
      struct Pending {
        std::string category;
        std::chrono::seconds delay{ 0 };
      };

      explicit ConsoleNotificationDispatcher(std::ostream& out);

      void registerCategories(const std::vector<NotificationCategory>& categories) override;
      void scheduleDelayed(const std::string& siteId, std::chrono::seconds delay) override;
      void scheduleImmediate(const std::string& siteId) override;
      void cancel(const std::string& siteId) override;

      std::optional<Pending> pendingFor(const std::string& siteId) const;
      std::size_t categoryCount() const;

    private:
      std::ostream& out_;
      std::map<std::string, Pending> pending_;
      std::vector<NotificationCategory> categories_;
      mutable std::mutex mtx_;
    };

  } // namespace io
} // namespace divewatch
