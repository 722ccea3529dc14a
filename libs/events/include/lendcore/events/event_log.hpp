#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "lendcore/events/notification.hpp"

namespace lendcore {
namespace events {

using NotificationSink = std::function<void(const Notification&)>;

// Append-only record of committed notifications. Sequence numbers start at 1.
//
// The sink mirrors the log (e.g. into an on-disk journal). It runs after the
// notifications are already in the log, so a failing sink cannot undo or
// reorder them; the first failure is kept in sink_error() and the sink is
// detached, leaving the mirror a strict prefix of the log.
class EventLog {
 public:
  const Notification& publish(Notification notification);
  void publish_all(std::vector<Notification> notifications);

  void set_sink(NotificationSink sink);
  [[nodiscard]] const std::optional<std::string>& sink_error() const noexcept { return sink_error_; }

  [[nodiscard]] std::vector<Notification> since(std::uint64_t sequence, std::size_t limit = SIZE_MAX) const;
  [[nodiscard]] const std::vector<Notification>& all() const noexcept { return notifications_; }
  [[nodiscard]] std::size_t size() const noexcept { return notifications_.size(); }
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }

 private:
  std::vector<Notification> notifications_{};
  NotificationSink sink_{};
  std::optional<std::string> sink_error_{};
  std::uint64_t next_sequence_{1};

  void append(Notification& notification);
  void deliver(std::size_t first);
};

}  // namespace events
}  // namespace lendcore
