#include "lendcore/events/event_log.hpp"

#include <exception>
#include <utility>

namespace lendcore {
namespace events {

void EventLog::append(Notification& notification) {
  notification.sequence = next_sequence_++;
  notifications_.push_back(notification);
}

void EventLog::deliver(std::size_t first) {
  for (std::size_t i = first; sink_ && i < notifications_.size(); ++i) {
    try {
      sink_(notifications_[i]);
    } catch (const std::exception& e) {
      sink_error_ = "sink failed at sequence " + std::to_string(notifications_[i].sequence) + ": " + e.what();
      sink_ = nullptr;
    }
  }
}

const Notification& EventLog::publish(Notification notification) {
  append(notification);
  deliver(notifications_.size() - 1);
  return notifications_.back();
}

void EventLog::publish_all(std::vector<Notification> notifications) {
  const std::size_t first = notifications_.size();
  for (auto& notification : notifications) {
    append(notification);
  }
  deliver(first);
}

void EventLog::set_sink(NotificationSink sink) {
  sink_ = std::move(sink);
  sink_error_.reset();
}

std::vector<Notification> EventLog::since(std::uint64_t sequence, std::size_t limit) const {
  std::vector<Notification> result;
  for (const auto& notification : notifications_) {
    if (notification.sequence >= sequence) {
      result.push_back(notification);
      if (result.size() >= limit) {
        break;
      }
    }
  }
  return result;
}

}  // namespace events
}  // namespace lendcore
