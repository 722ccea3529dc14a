#pragma once

#include <cstdint>
#include <string_view>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace events {

enum class EventKind : std::uint16_t {
  kMarketAdded = 1,
  kMarketUpdated = 2,
  kRatesUpdated = 3,
  kDeposit = 4,
  kWithdraw = 5,
  kBorrow = 6,
  kRepay = 7,
  kLiquidate = 8,
  kPaused = 9,
  kUnpaused = 10,
  kEmergencyWithdrawal = 11,
};

[[nodiscard]] std::string_view to_string(EventKind kind) noexcept;
[[nodiscard]] bool is_known_kind(std::uint16_t raw) noexcept;

// Flat record shared by every notification kind; unused fields stay zero.
//   Deposit/Withdraw/Borrow/Repay: account, asset, amount
//   Liquidate: account (liquidated), counterparty (liquidator), asset (repaid),
//              amount (repaid), collateral_asset, seized
//   MarketAdded/MarketUpdated: asset, collateral_factor, supply_rate, borrow_rate
//   RatesUpdated: asset, supply_rate, borrow_rate
//   Paused/Unpaused: account (owner)
//   EmergencyWithdrawal: account (owner), counterparty (recipient), asset, amount
struct Notification {
  std::uint64_t sequence{0};
  common::TimestampSec timestamp{0};
  EventKind kind{EventKind::kDeposit};
  common::AccountId account{common::kNullAccount};
  common::AccountId counterparty{common::kNullAccount};
  common::AssetId asset{common::kNullAsset};
  common::AssetId collateral_asset{common::kNullAsset};
  common::Amount amount{0};
  common::Amount seized{0};
  common::BasisPoints collateral_factor{0};
  common::BasisPoints supply_rate{0};
  common::BasisPoints borrow_rate{0};

  bool operator==(const Notification&) const = default;
};

}  // namespace events
}  // namespace lendcore
