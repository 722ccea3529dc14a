// Unit test runner - calls test functions from per-component test files

#include <iostream>

#include "test_auth.hpp"
#include "test_common.hpp"
#include "test_config.hpp"
#include "test_events.hpp"
#include "test_ledger.hpp"
#include "test_market.hpp"
#include "test_pool.hpp"
#include "test_risk.hpp"

int main() {
  using namespace lendcore::tests;

  // Common tests
  test_checked_math();
  test_error_codes();

  // Market tests
  test_market_registry();
  test_market_registry_rollback();

  // Ledger tests
  test_position_ledger();
  test_position_ledger_rollback();
  test_undo_journal_failed_entry();

  // Risk tests
  test_collateral_calculator();
  test_collateral_calculator_large_collateral();
  test_collateral_calculator_multi_market();
  test_liquidation_plan();
  test_best_collateral();

  // Auth tests
  test_canonical_deposit_message();
  test_signer_recovery();
  test_verify_deposit();
  test_nonce_registry();

  // Pool tests
  test_pool_deposit_withdraw_round_trip();
  test_pool_borrow_at_threshold();
  test_pool_unsafe_withdraw_then_repay();
  test_pool_liquidation_after_factor_cut();
  test_pool_liquidation_single_collateral_asset();
  test_pool_signed_deposit();
  test_pool_failed_operations_roll_back();
  test_pool_liquidation_refund_on_failed_seize();
  test_pool_rejects_reentrant_calls();
  test_pool_pause_and_access_control();
  test_pool_emergency_withdraw();
  test_pool_accounting_invariants();
  test_pool_failed_sink_keeps_commit();
  test_pool_incomplete_rollback_is_reported();

  // Events tests
  test_event_log();
  test_event_journal_round_trip();
  test_event_journal_detects_corruption();
  test_event_journal_paths();

  // Config tests
  test_config_defaults();
  test_config_parsing();
  test_config_validation();

  std::cout << "all unit tests passed\n";
  return 0;
}
