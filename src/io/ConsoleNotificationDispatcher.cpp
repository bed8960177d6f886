/* @file ConsoleNotificationDispatcher.cpp
 * @brief stdout-backed reminder scheduling for the replay tool
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <ostream>

#include "io/ConsoleNotificationDispatcher.hpp"

using namespace divewatch::io;

ConsoleNotificationDispatcher::ConsoleNotificationDispatcher(std::ostream& out) : out_(out) {}

void ConsoleNotificationDispatcher::registerCategories(const std::vector<NotificationCategory>& categories) {
  std::lock_guard<std::mutex> lock(mtx_);
  categories_ = categories;
}

void ConsoleNotificationDispatcher::scheduleDelayed(const std::string& siteId, std::chrono::seconds delay) {
  std::lock_guard<std::mutex> lock(mtx_);
  pending_[siteId] = Pending{ kReminderCategory, delay };
  out_ << "notify  " << kReminderCategory << " site=" << siteId << " in " << delay.count() << "s\n";
}

void ConsoleNotificationDispatcher::scheduleImmediate(const std::string& siteId) {
  std::lock_guard<std::mutex> lock(mtx_);
  pending_[siteId] = Pending{ kPromptCategory, std::chrono::seconds{ 0 } };
  out_ << "notify  " << kPromptCategory << " site=" << siteId << " now\n";
}

void ConsoleNotificationDispatcher::cancel(const std::string& siteId) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (pending_.erase(siteId) > 0)
    out_ << "notify  cancel site=" << siteId << '\n';
}

std::optional<ConsoleNotificationDispatcher::Pending>
ConsoleNotificationDispatcher::pendingFor(const std::string& siteId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = pending_.find(siteId);
  if (it == pending_.end())
    return std::nullopt;
  return it->second;
}

std::size_t ConsoleNotificationDispatcher::categoryCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return categories_.size();
}
