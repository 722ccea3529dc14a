#pragma once

namespace lendcore::tests {

void test_pool_deposit_withdraw_round_trip();
void test_pool_borrow_at_threshold();
void test_pool_unsafe_withdraw_then_repay();
void test_pool_liquidation_after_factor_cut();
void test_pool_liquidation_single_collateral_asset();
void test_pool_signed_deposit();
void test_pool_failed_operations_roll_back();
void test_pool_liquidation_refund_on_failed_seize();
void test_pool_rejects_reentrant_calls();
void test_pool_pause_and_access_control();
void test_pool_emergency_withdraw();
void test_pool_accounting_invariants();
void test_pool_failed_sink_keeps_commit();
void test_pool_incomplete_rollback_is_reported();

}  // namespace lendcore::tests
