#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/undo_journal.hpp"

namespace lendcore {
namespace ledger {

// Cross-asset aggregates; always equal to the per-asset sums below.
struct User {
  common::Amount total_deposited{0};
  common::Amount total_borrowed{0};
  common::TimestampSec last_update_time{0};
  bool is_active{false};
};

struct BalanceKey {
  common::AccountId account{common::kNullAccount};
  common::AssetId asset{common::kNullAsset};

  bool operator==(const BalanceKey&) const = default;
};

struct BalanceKeyHash {
  std::size_t operator()(const BalanceKey& key) const noexcept {
    return std::hash<std::uint64_t>{}(key.account * 0x9e3779b97f4a7c15ULL ^ key.asset);
  }
};

class PositionLedger {
 public:
  void credit_deposit(common::AccountId account, common::AssetId asset, common::Amount amount,
                      common::TimestampSec now, UndoJournal& journal);
  void debit_deposit(common::AccountId account, common::AssetId asset, common::Amount amount,
                     common::TimestampSec now, UndoJournal& journal);
  void credit_borrow(common::AccountId account, common::AssetId asset, common::Amount amount,
                     common::TimestampSec now, UndoJournal& journal);
  void debit_borrow(common::AccountId account, common::AssetId asset, common::Amount amount,
                    common::TimestampSec now, UndoJournal& journal);

  [[nodiscard]] User user(common::AccountId account) const;
  [[nodiscard]] common::Amount deposit_of(common::AccountId account, common::AssetId asset) const;
  [[nodiscard]] common::Amount borrow_of(common::AccountId account, common::AssetId asset) const;

  // Visits every (account, asset) entry, including zero-valued ones.
  void for_each_deposit(const std::function<void(const BalanceKey&, common::Amount)>& visit) const;
  void for_each_borrow(const std::function<void(const BalanceKey&, common::Amount)>& visit) const;
  void for_each_user(const std::function<void(common::AccountId, const User&)>& visit) const;

 private:
  enum class Leg : std::uint8_t { kDeposit, kBorrow };

  std::unordered_map<common::AccountId, User> users_{};
  std::unordered_map<BalanceKey, common::Amount, BalanceKeyHash> deposits_{};
  std::unordered_map<BalanceKey, common::Amount, BalanceKeyHash> borrows_{};

  void apply(Leg leg, bool credit, common::AccountId account, common::AssetId asset, common::Amount amount,
             common::TimestampSec now, UndoJournal& journal);
  static void refresh_active(User& user) noexcept;
};

}  // namespace ledger
}  // namespace lendcore
