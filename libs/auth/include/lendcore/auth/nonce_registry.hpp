#pragma once

#include <unordered_map>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/undo_journal.hpp"

namespace lendcore {
namespace auth {

// Per-account replay counter for signed authorizations. Starts at 0 and only
// moves forward by one per fully successful signed operation.
class NonceRegistry {
 public:
  [[nodiscard]] common::Nonce current(common::AccountId account) const;
  void advance(common::AccountId account, ledger::UndoJournal& journal);

 private:
  std::unordered_map<common::AccountId, common::Nonce> nonces_{};
};

}  // namespace auth
}  // namespace lendcore
