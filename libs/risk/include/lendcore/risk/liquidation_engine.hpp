#pragma once

#include <cstdint>
#include <optional>

#include "lendcore/common/types.hpp"
#include "lendcore/risk/collateral_calculator.hpp"

namespace lendcore {
namespace risk {

struct LiquidationPlan {
  common::AccountId account{common::kNullAccount};
  common::AssetId repay_asset{common::kNullAsset};
  common::Amount repay_amount{0};
  common::AssetId collateral_asset{common::kNullAsset};
  common::Amount seize_amount{0};
};

class LiquidationManager {
 public:
  enum class Status : std::uint8_t {
    kHealthy,
    kLiquidatable,
  };

  struct Result {
    Status status{Status::kHealthy};
    common::Ratio ratio{common::kInfiniteRatio};
    PositionValues values{};
  };

  LiquidationManager(const CollateralCalculator& calculator, const market::MarketRegistry& registry,
                     const ledger::PositionLedger& ledger)
      : calculator_(calculator), registry_(registry), ledger_(ledger) {}

  [[nodiscard]] Result evaluate(common::AccountId account) const;

  // Validates a liquidation request against current state and sizes the seize.
  // Throws kInvalidAmount, kInsufficientBorrowToLiquidate, kNotLiquidatable,
  // kNoCollateral or kInsufficientCollateral.
  [[nodiscard]] LiquidationPlan plan(common::AccountId account, common::AssetId repay_asset,
                                     common::Amount repay_amount) const;

  // Active market holding the account's highest non-zero weighted deposit.
  // Ties go to the market registered first.
  [[nodiscard]] std::optional<common::AssetId> best_collateral(common::AccountId account) const;

  [[nodiscard]] static common::Amount seize_amount(common::Amount repay_amount);

 private:
  const CollateralCalculator& calculator_;
  const market::MarketRegistry& registry_;
  const ledger::PositionLedger& ledger_;
};

}  // namespace risk
}  // namespace lendcore
