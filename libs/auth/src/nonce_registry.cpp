#include "lendcore/auth/nonce_registry.hpp"

#include "lendcore/common/checked_math.hpp"

namespace lendcore {
namespace auth {

common::Nonce NonceRegistry::current(common::AccountId account) const {
  if (auto it = nonces_.find(account); it != nonces_.end()) {
    return it->second;
  }
  return 0;
}

void NonceRegistry::advance(common::AccountId account, ledger::UndoJournal& journal) {
  auto& nonce = nonces_[account];
  const common::Nonce previous = nonce;
  nonce = common::checked_add(previous, common::Nonce{1});
  journal.record([&nonce, previous] { nonce = previous; });
}

}  // namespace auth
}  // namespace lendcore
