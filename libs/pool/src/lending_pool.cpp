#include "lendcore/pool/lending_pool.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace pool {

using common::ErrorCode;
using common::LendingError;
using events::EventKind;
using events::Notification;

namespace {

std::string describe(const std::exception_ptr& failure) {
  try {
    std::rethrow_exception(failure);
  } catch (const std::exception& e) {
    return e.what();
  }
  return {};
}

}  // namespace

LendingPool::LendingPool(custody::TokenVault& vault, AccessPolicy access, common::Clock clock)
    : vault_(vault),
      access_(access),
      clock_(std::move(clock)),
      calculator_(registry_, ledger_),
      liquidation_(calculator_, registry_, ledger_) {}

template <typename Fn>
auto LendingPool::run_atomic(Fn&& fn) {
  ReentrancyGuard guard(entered_);
  Transaction tx;
  tx.now = clock_();
  if constexpr (std::is_void_v<std::invoke_result_t<Fn, Transaction&>>) {
    try {
      fn(tx);
    } catch (...) {
      rollback(tx);
      throw;
    }
    commit(tx);
  } else {
    std::invoke_result_t<Fn, Transaction&> result{};
    try {
      result = fn(tx);
    } catch (...) {
      rollback(tx);
      throw;
    }
    commit(tx);
    return result;
  }
}

void LendingPool::rollback(Transaction& tx) {
  if (const auto failure = tx.journal.rollback()) {
    // The operation's own error stays reachable through std::rethrow_if_nested.
    std::throw_with_nested(LendingError(ErrorCode::kRollbackIncomplete, describe(failure)));
  }
}

void LendingPool::commit(Transaction& tx) {
  tx.journal.commit();
  events_.publish_all(std::move(tx.pending));
  tx.pending.clear();
}

void LendingPool::require_positive(common::Amount amount) {
  if (amount == 0) {
    throw LendingError(ErrorCode::kInvalidAmount);
  }
}

void LendingPool::pull_with_refund(Transaction& tx, common::AssetId asset, common::AccountId from,
                                   common::Amount amount) {
  vault_.pull(asset, from, amount);
  tx.journal.record([this, asset, from, amount] { vault_.push(asset, from, amount); });
}

// Administration

void LendingPool::add_market(common::AccountId caller, common::AssetId asset, market::MarketParams params) {
  run_atomic([&](Transaction& tx) {
    access_.require_owner(caller);
    registry_.add_market(asset, params, tx.journal);
    tx.emit(Notification{.kind = EventKind::kMarketAdded,
                         .asset = asset,
                         .collateral_factor = params.collateral_factor,
                         .supply_rate = params.supply_rate,
                         .borrow_rate = params.borrow_rate});
  });
}

void LendingPool::update_market(common::AccountId caller, common::AssetId asset, market::MarketParams params) {
  run_atomic([&](Transaction& tx) {
    access_.require_owner(caller);
    registry_.update_market(asset, params, tx.journal);
    tx.emit(Notification{.kind = EventKind::kMarketUpdated,
                         .asset = asset,
                         .collateral_factor = params.collateral_factor,
                         .supply_rate = params.supply_rate,
                         .borrow_rate = params.borrow_rate});
    tx.emit(Notification{.kind = EventKind::kRatesUpdated,
                         .asset = asset,
                         .supply_rate = params.supply_rate,
                         .borrow_rate = params.borrow_rate});
  });
}

void LendingPool::pause(common::AccountId caller) {
  run_atomic([&](Transaction& tx) {
    access_.require_owner(caller);
    pause_.set_paused(true, tx.journal);
    tx.emit(Notification{.kind = EventKind::kPaused, .account = caller});
  });
}

void LendingPool::unpause(common::AccountId caller) {
  run_atomic([&](Transaction& tx) {
    access_.require_owner(caller);
    pause_.set_paused(false, tx.journal);
    tx.emit(Notification{.kind = EventKind::kUnpaused, .account = caller});
  });
}

void LendingPool::emergency_withdraw(common::AccountId caller, common::AssetId asset, common::AccountId to,
                                     common::Amount amount) {
  run_atomic([&](Transaction& tx) {
    access_.require_owner(caller);
    require_positive(amount);
    vault_.push(asset, to, amount);
    tx.emit(Notification{.kind = EventKind::kEmergencyWithdrawal,
                         .account = caller,
                         .counterparty = to,
                         .asset = asset,
                         .amount = amount});
  });
}

// Position operations

void LendingPool::deposit_body(Transaction& tx, common::AccountId caller, common::AssetId asset,
                               common::Amount amount) {
  registry_.require_active(asset);
  require_positive(amount);

  ledger_.credit_deposit(caller, asset, amount, tx.now, tx.journal);
  registry_.credit_supply(asset, amount, tx.journal);

  pull_with_refund(tx, asset, caller, amount);
  tx.emit(Notification{.kind = EventKind::kDeposit, .account = caller, .asset = asset, .amount = amount});
}

void LendingPool::deposit(common::AccountId caller, common::AssetId asset, common::Amount amount) {
  run_atomic([&](Transaction& tx) {
    pause_.require_unpaused();
    deposit_body(tx, caller, asset, amount);
  });
}

void LendingPool::withdraw(common::AccountId caller, common::AssetId asset, common::Amount amount) {
  run_atomic([&](Transaction& tx) {
    pause_.require_unpaused();
    registry_.require_active(asset);
    require_positive(amount);

    const common::Amount deposited = ledger_.deposit_of(caller, asset);
    if (deposited < amount) {
      throw LendingError(ErrorCode::kInsufficientDeposit,
                         "deposit " + std::to_string(deposited) + " < " + std::to_string(amount));
    }
    if (!calculator_.can_withdraw(caller, asset, amount)) {
      throw LendingError(ErrorCode::kUnsafeWithdrawal, "account " + std::to_string(caller));
    }

    ledger_.debit_deposit(caller, asset, amount, tx.now, tx.journal);
    registry_.debit_supply(asset, amount, tx.journal);

    vault_.push(asset, caller, amount);
    tx.emit(Notification{.kind = EventKind::kWithdraw, .account = caller, .asset = asset, .amount = amount});
  });
}

void LendingPool::borrow(common::AccountId caller, common::AssetId asset, common::Amount amount) {
  run_atomic([&](Transaction& tx) {
    pause_.require_unpaused();
    const auto& market = registry_.require_active(asset);
    require_positive(amount);

    if (market.total_supply < amount) {
      throw LendingError(ErrorCode::kInsufficientLiquidity,
                         "supply " + std::to_string(market.total_supply) + " < " + std::to_string(amount));
    }
    if (!calculator_.can_borrow(caller, asset, amount)) {
      throw LendingError(ErrorCode::kUnsafeBorrow, "account " + std::to_string(caller));
    }

    ledger_.credit_borrow(caller, asset, amount, tx.now, tx.journal);
    registry_.credit_borrow(asset, amount, tx.journal);

    vault_.push(asset, caller, amount);
    tx.emit(Notification{.kind = EventKind::kBorrow, .account = caller, .asset = asset, .amount = amount});
  });
}

void LendingPool::repay(common::AccountId caller, common::AssetId asset, common::Amount amount) {
  run_atomic([&](Transaction& tx) {
    pause_.require_unpaused();
    registry_.require_active(asset);
    require_positive(amount);

    const common::Amount borrowed = ledger_.borrow_of(caller, asset);
    if (borrowed < amount) {
      throw LendingError(ErrorCode::kInsufficientBorrow,
                         "borrow " + std::to_string(borrowed) + " < " + std::to_string(amount));
    }

    ledger_.debit_borrow(caller, asset, amount, tx.now, tx.journal);
    registry_.debit_borrow(asset, amount, tx.journal);

    pull_with_refund(tx, asset, caller, amount);
    tx.emit(Notification{.kind = EventKind::kRepay, .account = caller, .asset = asset, .amount = amount});
  });
}

risk::LiquidationPlan LendingPool::liquidate(common::AccountId caller, common::AccountId account,
                                             common::AssetId asset, common::Amount amount) {
  return run_atomic([&](Transaction& tx) {
    pause_.require_unpaused();
    const risk::LiquidationPlan plan = liquidation_.plan(account, asset, amount);

    ledger_.debit_borrow(account, plan.repay_asset, plan.repay_amount, tx.now, tx.journal);
    registry_.debit_borrow(plan.repay_asset, plan.repay_amount, tx.journal);
    ledger_.debit_deposit(account, plan.collateral_asset, plan.seize_amount, tx.now, tx.journal);
    registry_.debit_supply(plan.collateral_asset, plan.seize_amount, tx.journal);

    pull_with_refund(tx, plan.repay_asset, caller, plan.repay_amount);
    vault_.push(plan.collateral_asset, caller, plan.seize_amount);

    tx.emit(Notification{.kind = EventKind::kLiquidate,
                         .account = account,
                         .counterparty = caller,
                         .asset = plan.repay_asset,
                         .collateral_asset = plan.collateral_asset,
                         .amount = plan.repay_amount,
                         .seized = plan.seize_amount});
    return plan;
  });
}

void LendingPool::deposit_with_signature(common::AccountId caller, common::AssetId asset, common::Amount amount,
                                         const auth::DepositAuthorization& authorization) {
  run_atomic([&](Transaction& tx) {
    pause_.require_unpaused();
    authenticator_.verify_deposit(caller, asset, amount, authorization, tx.now, nonces_.current(caller));
    deposit_body(tx, caller, asset, amount);
    nonces_.advance(caller, tx.journal);
  });
}

// Queries

common::Ratio LendingPool::collateralization_ratio(common::AccountId account) const {
  return calculator_.collateralization_ratio(account);
}

bool LendingPool::can_withdraw(common::AccountId account, common::AssetId asset, common::Amount amount) const {
  return calculator_.can_withdraw(account, asset, amount);
}

bool LendingPool::can_borrow(common::AccountId account, common::AssetId asset, common::Amount amount) const {
  return calculator_.can_borrow(account, asset, amount);
}

bool LendingPool::is_liquidatable(common::AccountId account) const {
  return calculator_.is_liquidatable(account);
}

std::optional<market::Market> LendingPool::market_snapshot(common::AssetId asset) const {
  if (const auto* market = registry_.find(asset)) {
    return *market;
  }
  return std::nullopt;
}

ledger::User LendingPool::user(common::AccountId account) const {
  return ledger_.user(account);
}

common::Amount LendingPool::deposit_of(common::AccountId account, common::AssetId asset) const {
  return ledger_.deposit_of(account, asset);
}

common::Amount LendingPool::borrow_of(common::AccountId account, common::AssetId asset) const {
  return ledger_.borrow_of(account, asset);
}

const std::vector<common::AssetId>& LendingPool::supported_assets() const noexcept {
  return registry_.supported_assets();
}

common::Nonce LendingPool::nonce(common::AccountId account) const {
  return nonces_.current(account);
}

}  // namespace pool
}  // namespace lendcore
