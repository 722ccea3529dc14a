#pragma once

#include "lendcore/common/errors.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/ledger/undo_journal.hpp"

namespace lendcore {
namespace pool {

// Single privileged identity for administrative operations.
class AccessPolicy {
 public:
  explicit AccessPolicy(common::AccountId owner) : owner_(owner) {}

  void require_owner(common::AccountId caller) const {
    if (caller == common::kNullAccount || caller != owner_) {
      throw common::LendingError(common::ErrorCode::kUnauthorized,
                                 "caller " + std::to_string(caller) + " is not the owner");
    }
  }

  [[nodiscard]] common::AccountId owner() const noexcept { return owner_; }

 private:
  common::AccountId owner_;
};

// Emergency stop checked by every user-facing state change.
class PausePolicy {
 public:
  explicit PausePolicy(bool paused = false) : paused_(paused) {}

  void require_unpaused() const {
    if (paused_) {
      throw common::LendingError(common::ErrorCode::kProtocolPaused);
    }
  }

  void set_paused(bool paused, ledger::UndoJournal& journal) {
    const bool previous = paused_;
    paused_ = paused;
    journal.record([this, previous] { paused_ = previous; });
  }

  [[nodiscard]] bool paused() const noexcept { return paused_; }

 private:
  bool paused_;
};

// Marks the pool busy for the lifetime of one entry point; a nested entry
// (e.g. from a vault callback) is rejected.
class ReentrancyGuard {
 public:
  explicit ReentrancyGuard(bool& entered) : entered_(entered) {
    if (entered_) {
      throw common::LendingError(common::ErrorCode::kReentrantCall);
    }
    entered_ = true;
  }
  ReentrancyGuard(const ReentrancyGuard&) = delete;
  ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;
  ~ReentrancyGuard() { entered_ = false; }

 private:
  bool& entered_;
};

}  // namespace pool
}  // namespace lendcore
