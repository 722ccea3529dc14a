#include "lendcore/risk/collateral_calculator.hpp"

#include "lendcore/common/checked_math.hpp"

namespace lendcore {
namespace risk {

common::Ratio CollateralCalculator::collateralization_ratio(common::AccountId account) const {
  return ratio_of(position_values(account));
}

bool CollateralCalculator::can_withdraw(common::AccountId account, common::AssetId asset,
                                        common::Amount amount) const {
  if (collateralization_ratio(account) == common::kInfiniteRatio) {
    return true;
  }
  const PositionValues projected = position_values_with_delta(
      account, PositionDelta{.kind = PositionDelta::Kind::kWithdraw, .asset = asset, .amount = amount});
  return is_safe(ratio_of(projected));
}

bool CollateralCalculator::can_borrow(common::AccountId account, common::AssetId asset,
                                      common::Amount amount) const {
  // With no borrow outstanding the request is approved without valuing the
  // resulting position; liquidity is the only bound on a first borrow.
  if (collateralization_ratio(account) == common::kInfiniteRatio) {
    return true;
  }
  const PositionValues projected = position_values_with_delta(
      account, PositionDelta{.kind = PositionDelta::Kind::kBorrow, .asset = asset, .amount = amount});
  return is_safe(ratio_of(projected));
}

bool CollateralCalculator::is_liquidatable(common::AccountId account) const {
  return collateralization_ratio(account) < common::kLiquidationThreshold;
}

PositionValues CollateralCalculator::position_values(common::AccountId account) const {
  return position_values_with_delta(account, std::nullopt);
}

common::Ratio CollateralCalculator::ratio_of(const PositionValues& values) {
  if (values.borrow_value == 0) {
    return common::kInfiniteRatio;
  }
  const common::Wide ratio =
      common::checked_mul(values.collateral_value, common::kBasisPointDenominator) / values.borrow_value;
  // A finite ratio stays below kInfiniteRatio, which is reserved for zero debt.
  constexpr auto kMaxFiniteRatio = static_cast<common::Wide>(common::kInfiniteRatio - 1);
  return static_cast<common::Ratio>(ratio < kMaxFiniteRatio ? ratio : kMaxFiniteRatio);
}

PositionValues CollateralCalculator::position_values_with_delta(common::AccountId account,
                                                                std::optional<PositionDelta> delta) const {
  PositionValues values{};

  for (const auto asset : registry_.supported_assets()) {
    const auto* market = registry_.find(asset);
    if (!market || !market->is_active) {
      continue;
    }

    common::Amount deposit = ledger_.deposit_of(account, asset);
    common::Amount borrow = ledger_.borrow_of(account, asset);

    if (delta.has_value() && delta->asset == asset) {
      if (delta->kind == PositionDelta::Kind::kWithdraw) {
        deposit = deposit > delta->amount ? deposit - delta->amount : 0;
      } else {
        borrow = common::checked_add(borrow, delta->amount);
      }
    }

    values.collateral_value = common::checked_add(
        values.collateral_value, common::apply_basis_points(deposit, market->params.collateral_factor));
    values.borrow_value = common::checked_add(values.borrow_value, static_cast<common::Wide>(borrow));
  }

  return values;
}

bool CollateralCalculator::is_safe(common::Ratio ratio) noexcept {
  return ratio == common::kInfiniteRatio || ratio >= common::kLiquidationThreshold;
}

}  // namespace risk
}  // namespace lendcore
