#include "lendcore/custody/in_memory_vault.hpp"

#include <string>

#include "lendcore/common/checked_math.hpp"
#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace custody {

using common::ErrorCode;
using common::LendingError;

void InMemoryVault::pull(common::AssetId asset, common::AccountId from, common::Amount amount) {
  auto& balance = balances_[HolderKey{from, asset}];
  if (balance < amount) {
    throw LendingError(ErrorCode::kTransferFailed, "holder " + std::to_string(from) + " balance " +
                                                       std::to_string(balance) + " < " + std::to_string(amount));
  }
  auto& held = custody_[asset];
  const common::Amount next_held = common::checked_add(held, amount);
  balance -= amount;
  held = next_held;
}

void InMemoryVault::push(common::AssetId asset, common::AccountId to, common::Amount amount) {
  auto& held = custody_[asset];
  if (held < amount) {
    throw LendingError(ErrorCode::kTransferFailed, "custody of asset " + std::to_string(asset) + " is " +
                                                       std::to_string(held) + " < " + std::to_string(amount));
  }
  auto& balance = balances_[HolderKey{to, asset}];
  const common::Amount next_balance = common::checked_add(balance, amount);
  held -= amount;
  balance = next_balance;
}

void InMemoryVault::credit(common::AccountId holder, common::AssetId asset, common::Amount amount) {
  auto& balance = balances_[HolderKey{holder, asset}];
  balance = common::checked_add(balance, amount);
}

common::Amount InMemoryVault::balance_of(common::AccountId holder, common::AssetId asset) const {
  if (auto it = balances_.find(HolderKey{holder, asset}); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount InMemoryVault::custody_of(common::AssetId asset) const {
  if (auto it = custody_.find(asset); it != custody_.end()) {
    return it->second;
  }
  return 0;
}

}  // namespace custody
}  // namespace lendcore
