#include "lendcore/risk/liquidation_engine.hpp"

#include <string>

#include "lendcore/common/checked_math.hpp"
#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace risk {

using common::ErrorCode;
using common::LendingError;

LiquidationManager::Result LiquidationManager::evaluate(common::AccountId account) const {
  Result result;
  result.values = calculator_.position_values(account);
  result.ratio = CollateralCalculator::ratio_of(result.values);
  result.status = result.ratio < common::kLiquidationThreshold ? Status::kLiquidatable : Status::kHealthy;
  return result;
}

LiquidationPlan LiquidationManager::plan(common::AccountId account, common::AssetId repay_asset,
                                         common::Amount repay_amount) const {
  if (repay_amount == 0) {
    throw LendingError(ErrorCode::kInvalidAmount);
  }

  const common::Amount outstanding = ledger_.borrow_of(account, repay_asset);
  if (outstanding < repay_amount) {
    throw LendingError(ErrorCode::kInsufficientBorrowToLiquidate,
                       "borrow " + std::to_string(outstanding) + " < " + std::to_string(repay_amount));
  }

  if (!calculator_.is_liquidatable(account)) {
    throw LendingError(ErrorCode::kNotLiquidatable, "account " + std::to_string(account));
  }

  const common::Amount seize = seize_amount(repay_amount);

  const auto collateral = best_collateral(account);
  if (!collateral.has_value()) {
    throw LendingError(ErrorCode::kNoCollateral, "account " + std::to_string(account));
  }

  // Seizing is all-or-nothing from one asset; value spread over other
  // markets is not combined.
  const common::Amount available = ledger_.deposit_of(account, *collateral);
  if (available < seize) {
    throw LendingError(ErrorCode::kInsufficientCollateral,
                       "deposit " + std::to_string(available) + " < seize " + std::to_string(seize));
  }

  return LiquidationPlan{
      .account = account,
      .repay_asset = repay_asset,
      .repay_amount = repay_amount,
      .collateral_asset = *collateral,
      .seize_amount = seize,
  };
}

std::optional<common::AssetId> LiquidationManager::best_collateral(common::AccountId account) const {
  std::optional<common::AssetId> best;
  common::Wide best_value = 0;

  for (const auto asset : registry_.supported_assets()) {
    const auto* market = registry_.find(asset);
    if (!market || !market->is_active) {
      continue;
    }
    const common::Amount deposit = ledger_.deposit_of(account, asset);
    if (deposit == 0) {
      continue;
    }
    const common::Wide value = common::apply_basis_points(deposit, market->params.collateral_factor);
    // Strict comparison from zero: an asset whose weighted value is zero is
    // never selected, and the first of equal candidates is kept.
    if (value > best_value) {
      best = asset;
      best_value = value;
    }
  }

  return best;
}

common::Amount LiquidationManager::seize_amount(common::Amount repay_amount) {
  return common::narrow_amount(
      common::apply_basis_points(repay_amount, common::kBasisPointDenominator + common::kLiquidationPenalty));
}

}  // namespace risk
}  // namespace lendcore
