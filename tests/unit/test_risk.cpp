#include "test_risk.hpp"

#include <cassert>

#include "lendcore/ledger/position_ledger.hpp"
#include "lendcore/ledger/undo_journal.hpp"
#include "lendcore/market/market_registry.hpp"
#include "lendcore/risk/collateral_calculator.hpp"
#include "lendcore/risk/liquidation_engine.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

namespace {

struct RiskFixture {
  market::MarketRegistry registry;
  ledger::PositionLedger ledger;
  ledger::UndoJournal journal;
  risk::CollateralCalculator calculator{registry, ledger};
  risk::LiquidationManager liquidation{calculator, registry, ledger};

  void add_market(common::AssetId asset, common::BasisPoints factor) {
    registry.add_market(asset, {.collateral_factor = factor, .supply_rate = 0, .borrow_rate = 0}, journal);
    journal.commit();
  }

  void deposit(common::AccountId account, common::AssetId asset, common::Amount amount) {
    ledger.credit_deposit(account, asset, amount, 0, journal);
    journal.commit();
  }

  void borrow(common::AccountId account, common::AssetId asset, common::Amount amount) {
    ledger.credit_borrow(account, asset, amount, 0, journal);
    journal.commit();
  }
};

}  // namespace

void test_collateral_calculator() {
  RiskFixture f;
  f.add_market(1, 8'000);

  // No borrow: infinite, and even a zero-collateral account is not liquidatable.
  assert(f.calculator.collateralization_ratio(10) == common::kInfiniteRatio);
  assert(!f.calculator.is_liquidatable(10));
  assert(f.calculator.can_borrow(10, 1, 1'000'000));
  assert(f.calculator.can_withdraw(10, 1, 5));

  f.deposit(10, 1, 1'000);
  f.borrow(10, 1, 800);
  // 1000 * 8000 / 10000 = 800 collateral; 800 * 10000 / 800 = 10000.
  assert(f.calculator.collateralization_ratio(10) == 10'000);
  const auto values = f.calculator.position_values(10);
  assert(values.collateral_value == 800);
  assert(values.borrow_value == 800);

  // Exactly at the threshold is allowed, one unit past it is not.
  assert(f.calculator.can_borrow(10, 1, 200));   // 800 * 10000 / 1000 = 8000
  assert(!f.calculator.can_borrow(10, 1, 201));  // 7992
  assert(f.calculator.can_withdraw(10, 1, 200));   // 640 * 10000 / 800 = 8000
  assert(!f.calculator.can_withdraw(10, 1, 201));  // 7987
  assert(!f.calculator.can_withdraw(10, 1, 5'000));

  f.borrow(10, 1, 200);
  assert(f.calculator.collateralization_ratio(10) == common::kLiquidationThreshold);
  assert(!f.calculator.is_liquidatable(10));
  f.borrow(10, 1, 1);
  assert(f.calculator.collateralization_ratio(10) == 7'992);
  assert(f.calculator.is_liquidatable(10));

  // Collateral-free debt has ratio 0.
  f.borrow(11, 1, 1);
  assert(f.calculator.collateralization_ratio(11) == 0);
  assert(f.calculator.is_liquidatable(11));
}

void test_collateral_calculator_large_collateral() {
  RiskFixture f;
  f.add_market(1, 8'000);

  // 1e18 units against a debt of 1: the quotient exceeds the ratio type and
  // saturates just below infinite instead of failing.
  f.deposit(10, 1, 1'000'000'000'000'000'000ULL);
  f.borrow(10, 1, 1);

  const auto ratio = f.calculator.collateralization_ratio(10);
  assert(ratio == common::kInfiniteRatio - 1);
  assert(!f.calculator.is_liquidatable(10));
  assert(f.calculator.can_withdraw(10, 1, 1));
  assert(f.calculator.can_borrow(10, 1, 1));
  assert(f.liquidation.evaluate(10).status == risk::LiquidationManager::Status::kHealthy);
  expect_error(common::ErrorCode::kNotLiquidatable, [&] { (void)f.liquidation.plan(10, 1, 1); });

  // Withdrawing everything leaves debt without collateral.
  assert(!f.calculator.can_withdraw(10, 1, 1'000'000'000'000'000'000ULL));
}

void test_collateral_calculator_multi_market() {
  RiskFixture f;
  f.add_market(1, 8'000);
  f.add_market(2, 5'000);
  f.add_market(3, 0);

  f.deposit(20, 1, 500);    // 400
  f.deposit(20, 2, 1'000);  // 500
  f.deposit(20, 3, 9'999);  // 0
  f.borrow(20, 2, 300);
  f.borrow(20, 3, 700);

  const auto values = f.calculator.position_values(20);
  assert(values.collateral_value == 900);
  assert(values.borrow_value == 1'000);
  assert(f.calculator.collateralization_ratio(20) == 9'000);

  // Withdrawing a zero-factor asset never changes the ratio.
  assert(f.calculator.can_withdraw(20, 3, 9'999));
  // Removing 500 of asset 2 drops 250 of value: 650 * 10000 / 1000 = 6500.
  assert(!f.calculator.can_withdraw(20, 2, 500));
  // Removing 200 drops 100: 8000 exactly.
  assert(f.calculator.can_withdraw(20, 2, 200));
  // A withdraw larger than the deposit is valued as withdrawing all of it.
  assert(!f.calculator.can_withdraw(20, 1, 10'000));
  // Borrow checks count the new debt against every market.
  assert(f.calculator.can_borrow(20, 1, 125));
  assert(!f.calculator.can_borrow(20, 1, 126));
}

void test_liquidation_plan() {
  RiskFixture f;
  f.add_market(1, 3'000);
  f.add_market(2, 8'000);

  f.deposit(30, 1, 1'000);  // 300
  f.borrow(30, 1, 900);     // ratio 3333

  assert(risk::LiquidationManager::seize_amount(900) == 945);
  assert(risk::LiquidationManager::seize_amount(1) == 1);
  assert(risk::LiquidationManager::seize_amount(19) == 19);
  assert(risk::LiquidationManager::seize_amount(20) == 21);

  const auto result = f.liquidation.evaluate(30);
  assert(result.status == risk::LiquidationManager::Status::kLiquidatable);
  assert(result.ratio == 3'333);

  expect_error(common::ErrorCode::kInvalidAmount, [&] { (void)f.liquidation.plan(30, 1, 0); });
  expect_error(common::ErrorCode::kInsufficientBorrowToLiquidate, [&] { (void)f.liquidation.plan(30, 1, 901); });
  expect_error(common::ErrorCode::kInsufficientBorrowToLiquidate, [&] { (void)f.liquidation.plan(30, 2, 1); });

  const auto plan = f.liquidation.plan(30, 1, 900);
  assert(plan.account == 30);
  assert(plan.repay_asset == 1);
  assert(plan.repay_amount == 900);
  assert(plan.collateral_asset == 1);
  assert(plan.seize_amount == 945);

  // Healthy accounts cannot be liquidated.
  f.deposit(31, 2, 1'000);
  f.borrow(31, 2, 100);
  assert(f.liquidation.evaluate(31).status == risk::LiquidationManager::Status::kHealthy);
  expect_error(common::ErrorCode::kNotLiquidatable, [&] { (void)f.liquidation.plan(31, 2, 100); });

  // Debt with nothing to seize.
  f.borrow(32, 2, 10);
  expect_error(common::ErrorCode::kNoCollateral, [&] { (void)f.liquidation.plan(32, 2, 10); });
}

void test_best_collateral() {
  RiskFixture f;
  f.add_market(1, 8'000);
  f.add_market(2, 4'000);
  f.add_market(3, 0);

  assert(!f.liquidation.best_collateral(40).has_value());

  // Only zero-weighted collateral: nothing is selectable.
  f.deposit(40, 3, 1'000);
  assert(!f.liquidation.best_collateral(40).has_value());

  // Equal weighted values: 500 * 0.8 == 1000 * 0.4. First registered wins.
  f.deposit(40, 2, 1'000);
  f.deposit(40, 1, 500);
  assert(f.liquidation.best_collateral(40) == common::AssetId{1});

  f.deposit(40, 2, 3);
  assert(f.liquidation.best_collateral(40) == common::AssetId{2});

  // Only the chosen asset is seized from, even when the total would cover it.
  f.borrow(40, 1, 2'000);  // collateral 801 -> ratio 4005
  assert(f.calculator.is_liquidatable(40));
  expect_error(common::ErrorCode::kInsufficientCollateral, [&] { (void)f.liquidation.plan(40, 1, 1'000); });
  const auto plan = f.liquidation.plan(40, 1, 900);
  assert(plan.collateral_asset == 2);
  assert(plan.seize_amount == 945);
}

}  // namespace lendcore::tests
