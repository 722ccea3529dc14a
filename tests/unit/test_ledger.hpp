#pragma once

namespace lendcore::tests {

void test_position_ledger();
void test_position_ledger_rollback();
void test_undo_journal_failed_entry();

}  // namespace lendcore::tests
