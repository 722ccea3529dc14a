#include "test_ledger.hpp"

#include <cassert>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "lendcore/ledger/position_ledger.hpp"
#include "lendcore/ledger/undo_journal.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

void test_position_ledger() {
  ledger::PositionLedger ledger;
  ledger::UndoJournal journal;

  assert(!ledger.user(5).is_active);
  assert(ledger.deposit_of(5, 1) == 0);

  ledger.credit_deposit(5, 1, 700, 100, journal);
  ledger.credit_deposit(5, 2, 300, 110, journal);
  ledger.credit_borrow(5, 1, 250, 120, journal);
  journal.commit();

  auto user = ledger.user(5);
  assert(user.total_deposited == 1'000);
  assert(user.total_borrowed == 250);
  assert(user.last_update_time == 120);
  assert(user.is_active);
  assert(ledger.deposit_of(5, 2) == 300);
  assert(ledger.borrow_of(5, 1) == 250);

  // Underflow is rejected before anything is written.
  expect_error(common::ErrorCode::kArithmeticOverflow, [&] { ledger.debit_deposit(5, 2, 301, 130, journal); });
  expect_error(common::ErrorCode::kArithmeticOverflow, [&] { ledger.debit_borrow(5, 2, 1, 130, journal); });
  assert(ledger.deposit_of(5, 2) == 300);
  assert(ledger.user(5).total_deposited == 1'000);
  assert(ledger.user(5).last_update_time == 120);

  ledger.debit_borrow(5, 1, 250, 140, journal);
  ledger.debit_deposit(5, 1, 700, 140, journal);
  assert(ledger.user(5).is_active);
  ledger.debit_deposit(5, 2, 300, 150, journal);
  journal.commit();

  user = ledger.user(5);
  assert(user.total_deposited == 0);
  assert(user.total_borrowed == 0);
  assert(!user.is_active);
  assert(user.last_update_time == 150);

  // Aggregates equal the per-asset sums for every user.
  ledger.credit_deposit(6, 1, 40, 160, journal);
  ledger.credit_deposit(6, 3, 2, 160, journal);
  ledger.credit_borrow(7, 3, 9, 160, journal);
  journal.commit();

  ledger.for_each_user([&](common::AccountId account, const ledger::User& u) {
    common::Amount deposits = 0;
    common::Amount borrows = 0;
    ledger.for_each_deposit([&](const ledger::BalanceKey& key, common::Amount amount) {
      if (key.account == account) {
        deposits += amount;
      }
    });
    ledger.for_each_borrow([&](const ledger::BalanceKey& key, common::Amount amount) {
      if (key.account == account) {
        borrows += amount;
      }
    });
    assert(u.total_deposited == deposits);
    assert(u.total_borrowed == borrows);
  });
}

void test_position_ledger_rollback() {
  ledger::PositionLedger ledger;
  ledger::UndoJournal journal;

  ledger.credit_deposit(9, 1, 500, 10, journal);
  journal.commit();

  ledger.credit_borrow(9, 1, 100, 20, journal);
  ledger.debit_deposit(9, 1, 500, 20, journal);
  ledger.credit_deposit(9, 4, 60, 20, journal);
  const auto failure = journal.rollback();
  assert(!failure);

  const auto user = ledger.user(9);
  assert(user.total_deposited == 500);
  assert(user.total_borrowed == 0);
  assert(user.last_update_time == 10);
  assert(user.is_active);
  assert(ledger.deposit_of(9, 1) == 500);
  assert(ledger.deposit_of(9, 4) == 0);
  assert(ledger.borrow_of(9, 1) == 0);
  assert(journal.size() == 0);
}

void test_undo_journal_failed_entry() {
  ledger::UndoJournal journal;
  std::vector<int> replayed;

  journal.record([&] { replayed.push_back(1); });
  journal.record([] { throw std::runtime_error("first undo failed"); });
  journal.record([&] { replayed.push_back(3); });
  journal.record([] { throw std::runtime_error("second undo failed"); });

  // A throwing entry does not stop the rest of the rollback.
  const auto failure = journal.rollback();
  assert(failure);
  assert((replayed == std::vector<int>{3, 1}));
  assert(journal.size() == 0);

  std::string message;
  try {
    std::rethrow_exception(failure);
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  // Newest-first: the later entry fails first.
  assert(message == "second undo failed");
}

}  // namespace lendcore::tests
