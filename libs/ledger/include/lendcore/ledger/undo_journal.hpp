#pragma once

#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace lendcore {
namespace ledger {

// Records how to reverse each mutation made inside an atomic section.
// rollback() replays the entries newest-first; commit() forgets them.
class UndoJournal {
 public:
  void record(std::function<void()> undo) { entries_.push_back(std::move(undo)); }

  void commit() noexcept { entries_.clear(); }

  // Every entry is replayed even when an earlier one throws. Returns the
  // first failure, or null when the state was fully restored.
  [[nodiscard]] std::exception_ptr rollback() {
    std::exception_ptr first_failure;
    while (!entries_.empty()) {
      auto undo = std::move(entries_.back());
      entries_.pop_back();
      try {
        undo();
      } catch (const std::exception&) {
        if (!first_failure) {
          first_failure = std::current_exception();
        }
      }
    }
    return first_failure;
  }

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  std::vector<std::function<void()>> entries_{};
};

}  // namespace ledger
}  // namespace lendcore
