#include "lendcore/ledger/position_ledger.hpp"

#include "lendcore/common/checked_math.hpp"

namespace lendcore {
namespace ledger {

void PositionLedger::credit_deposit(common::AccountId account, common::AssetId asset, common::Amount amount,
                                    common::TimestampSec now, UndoJournal& journal) {
  apply(Leg::kDeposit, true, account, asset, amount, now, journal);
}

void PositionLedger::debit_deposit(common::AccountId account, common::AssetId asset, common::Amount amount,
                                   common::TimestampSec now, UndoJournal& journal) {
  apply(Leg::kDeposit, false, account, asset, amount, now, journal);
}

void PositionLedger::credit_borrow(common::AccountId account, common::AssetId asset, common::Amount amount,
                                   common::TimestampSec now, UndoJournal& journal) {
  apply(Leg::kBorrow, true, account, asset, amount, now, journal);
}

void PositionLedger::debit_borrow(common::AccountId account, common::AssetId asset, common::Amount amount,
                                  common::TimestampSec now, UndoJournal& journal) {
  apply(Leg::kBorrow, false, account, asset, amount, now, journal);
}

void PositionLedger::apply(Leg leg, bool credit, common::AccountId account, common::AssetId asset,
                           common::Amount amount, common::TimestampSec now, UndoJournal& journal) {
  auto& balances = (leg == Leg::kDeposit) ? deposits_ : borrows_;
  auto& balance = balances[BalanceKey{account, asset}];
  auto& user = users_[account];
  auto& total = (leg == Leg::kDeposit) ? user.total_deposited : user.total_borrowed;

  // Compute both sides before touching either so a failed check leaves no drift.
  const common::Amount next_balance = credit ? common::checked_add(balance, amount) : common::checked_sub(balance, amount);
  const common::Amount next_total = credit ? common::checked_add(total, amount) : common::checked_sub(total, amount);

  const common::Amount previous_balance = balance;
  const User previous_user = user;
  journal.record([&balance, &user, previous_balance, previous_user] {
    balance = previous_balance;
    user = previous_user;
  });

  balance = next_balance;
  total = next_total;
  user.last_update_time = now;
  refresh_active(user);
}

void PositionLedger::refresh_active(User& user) noexcept {
  user.is_active = user.total_deposited != 0 || user.total_borrowed != 0;
}

User PositionLedger::user(common::AccountId account) const {
  if (auto it = users_.find(account); it != users_.end()) {
    return it->second;
  }
  return {};
}

common::Amount PositionLedger::deposit_of(common::AccountId account, common::AssetId asset) const {
  if (auto it = deposits_.find(BalanceKey{account, asset}); it != deposits_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount PositionLedger::borrow_of(common::AccountId account, common::AssetId asset) const {
  if (auto it = borrows_.find(BalanceKey{account, asset}); it != borrows_.end()) {
    return it->second;
  }
  return 0;
}

void PositionLedger::for_each_deposit(const std::function<void(const BalanceKey&, common::Amount)>& visit) const {
  for (const auto& [key, amount] : deposits_) {
    visit(key, amount);
  }
}

void PositionLedger::for_each_borrow(const std::function<void(const BalanceKey&, common::Amount)>& visit) const {
  for (const auto& [key, amount] : borrows_) {
    visit(key, amount);
  }
}

void PositionLedger::for_each_user(const std::function<void(common::AccountId, const User&)>& visit) const {
  for (const auto& [account, user] : users_) {
    visit(account, user);
  }
}

}  // namespace ledger
}  // namespace lendcore
