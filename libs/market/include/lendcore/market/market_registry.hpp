#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/undo_journal.hpp"

namespace lendcore {
namespace market {

struct MarketParams {
  common::BasisPoints collateral_factor{0};  // share of deposit value usable as collateral
  common::BasisPoints supply_rate{0};        // APY, informational only
  common::BasisPoints borrow_rate{0};        // APY, informational only
};

struct Market {
  common::AssetId asset{common::kNullAsset};
  common::Amount total_supply{0};
  common::Amount total_borrow{0};
  MarketParams params{};
  bool is_active{false};
};

class MarketRegistry {
 public:
  // Creates an active market and appends the asset to the supported list.
  // Throws kInvalidAsset, kInvalidCollateralFactor or kMarketExists.
  const Market& add_market(common::AssetId asset, MarketParams params, ledger::UndoJournal& journal);

  // Overwrites collateral factor and rates; totals are left alone.
  // Throws kMarketInactive or kInvalidCollateralFactor.
  const Market& update_market(common::AssetId asset, MarketParams params, ledger::UndoJournal& journal);

  void credit_supply(common::AssetId asset, common::Amount amount, ledger::UndoJournal& journal);
  void debit_supply(common::AssetId asset, common::Amount amount, ledger::UndoJournal& journal);
  void credit_borrow(common::AssetId asset, common::Amount amount, ledger::UndoJournal& journal);
  void debit_borrow(common::AssetId asset, common::Amount amount, ledger::UndoJournal& journal);

  [[nodiscard]] const Market* find(common::AssetId asset) const;
  // Throws kMarketInactive when the asset has no active market.
  const Market& require_active(common::AssetId asset) const;
  [[nodiscard]] bool is_active(common::AssetId asset) const;

  // Registry order: the order markets were added in.
  [[nodiscard]] const std::vector<common::AssetId>& supported_assets() const noexcept { return assets_; }

 private:
  std::unordered_map<common::AssetId, Market> markets_{};
  std::vector<common::AssetId> assets_{};

  Market& require_active_mut(common::AssetId asset);
  static void validate_params(const MarketParams& params);
};

}  // namespace market
}  // namespace lendcore
