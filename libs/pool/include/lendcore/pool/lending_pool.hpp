#pragma once

#include <optional>
#include <vector>

#include "lendcore/auth/authenticator.hpp"
#include "lendcore/auth/nonce_registry.hpp"
#include "lendcore/common/time_utils.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/custody/token_vault.hpp"
#include "lendcore/events/event_log.hpp"
#include "lendcore/ledger/position_ledger.hpp"
#include "lendcore/ledger/undo_journal.hpp"
#include "lendcore/market/market_registry.hpp"
#include "lendcore/pool/policies.hpp"
#include "lendcore/risk/collateral_calculator.hpp"
#include "lendcore/risk/liquidation_engine.hpp"

namespace lendcore {
namespace pool {

// Entry points of the lending protocol. Each call is atomic: it either
// completes and publishes its notifications, or throws common::LendingError
// and leaves ledger, registry, nonces and event log exactly as they were.
// If a compensating vault transfer fails during that rollback the call throws
// kRollbackIncomplete instead, with the original error nested.
class LendingPool {
 public:
  LendingPool(custody::TokenVault& vault, AccessPolicy access, common::Clock clock = common::system_clock());
  LendingPool(const LendingPool&) = delete;
  LendingPool& operator=(const LendingPool&) = delete;

  // Administration (owner only)
  void add_market(common::AccountId caller, common::AssetId asset, market::MarketParams params);
  void update_market(common::AccountId caller, common::AssetId asset, market::MarketParams params);
  void pause(common::AccountId caller);
  void unpause(common::AccountId caller);
  // Raw transfer out of custody; the ledger is not touched.
  void emergency_withdraw(common::AccountId caller, common::AssetId asset, common::AccountId to,
                          common::Amount amount);

  // Position operations
  void deposit(common::AccountId caller, common::AssetId asset, common::Amount amount);
  void withdraw(common::AccountId caller, common::AssetId asset, common::Amount amount);
  void borrow(common::AccountId caller, common::AssetId asset, common::Amount amount);
  void repay(common::AccountId caller, common::AssetId asset, common::Amount amount);
  risk::LiquidationPlan liquidate(common::AccountId caller, common::AccountId account, common::AssetId asset,
                                  common::Amount amount);
  void deposit_with_signature(common::AccountId caller, common::AssetId asset, common::Amount amount,
                              const auth::DepositAuthorization& authorization);

  // Queries
  [[nodiscard]] common::Ratio collateralization_ratio(common::AccountId account) const;
  [[nodiscard]] bool can_withdraw(common::AccountId account, common::AssetId asset, common::Amount amount) const;
  [[nodiscard]] bool can_borrow(common::AccountId account, common::AssetId asset, common::Amount amount) const;
  [[nodiscard]] bool is_liquidatable(common::AccountId account) const;
  [[nodiscard]] std::optional<market::Market> market_snapshot(common::AssetId asset) const;
  [[nodiscard]] ledger::User user(common::AccountId account) const;
  [[nodiscard]] common::Amount deposit_of(common::AccountId account, common::AssetId asset) const;
  [[nodiscard]] common::Amount borrow_of(common::AccountId account, common::AssetId asset) const;
  [[nodiscard]] const std::vector<common::AssetId>& supported_assets() const noexcept;
  [[nodiscard]] common::Nonce nonce(common::AccountId account) const;
  [[nodiscard]] common::AccountId owner() const noexcept { return access_.owner(); }
  [[nodiscard]] bool paused() const noexcept { return pause_.paused(); }

  [[nodiscard]] const market::MarketRegistry& registry() const noexcept { return registry_; }
  [[nodiscard]] const ledger::PositionLedger& ledger() const noexcept { return ledger_; }
  [[nodiscard]] const events::EventLog& events() const noexcept { return events_; }
  [[nodiscard]] events::EventLog& events() noexcept { return events_; }

 private:
  struct Transaction {
    common::TimestampSec now{0};
    ledger::UndoJournal journal{};
    std::vector<events::Notification> pending{};

    void emit(events::Notification notification) {
      notification.timestamp = now;
      pending.push_back(notification);
    }
  };

  custody::TokenVault& vault_;
  AccessPolicy access_;
  PausePolicy pause_{};
  common::Clock clock_;

  market::MarketRegistry registry_{};
  ledger::PositionLedger ledger_{};
  auth::NonceRegistry nonces_{};
  auth::Authenticator authenticator_{};
  risk::CollateralCalculator calculator_;
  risk::LiquidationManager liquidation_;
  events::EventLog events_{};

  bool entered_{false};

  template <typename Fn>
  auto run_atomic(Fn&& fn);
  void commit(Transaction& tx);
  // Undoes the transaction's mutations. Throws kRollbackIncomplete, with the
  // in-flight exception nested, if an undo step itself fails.
  void rollback(Transaction& tx);

  void deposit_body(Transaction& tx, common::AccountId caller, common::AssetId asset, common::Amount amount);
  // Pulls from the holder and records a refund in case a later step fails.
  void pull_with_refund(Transaction& tx, common::AssetId asset, common::AccountId from, common::Amount amount);
  static void require_positive(common::Amount amount);
};

}  // namespace pool
}  // namespace lendcore
