#pragma once

namespace lendcore::tests {

void test_collateral_calculator();
void test_collateral_calculator_large_collateral();
void test_collateral_calculator_multi_market();
void test_liquidation_plan();
void test_best_collateral();

}  // namespace lendcore::tests
