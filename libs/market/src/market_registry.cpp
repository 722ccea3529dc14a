#include "lendcore/market/market_registry.hpp"

#include "lendcore/common/checked_math.hpp"
#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace market {

using common::ErrorCode;
using common::LendingError;

void MarketRegistry::validate_params(const MarketParams& params) {
  if (params.collateral_factor > common::kBasisPointDenominator) {
    throw LendingError(ErrorCode::kInvalidCollateralFactor,
                       "collateral factor " + std::to_string(params.collateral_factor) + " exceeds 10000");
  }
}

const Market& MarketRegistry::add_market(common::AssetId asset, MarketParams params, ledger::UndoJournal& journal) {
  if (asset == common::kNullAsset) {
    throw LendingError(ErrorCode::kInvalidAsset);
  }
  validate_params(params);
  if (is_active(asset)) {
    throw LendingError(ErrorCode::kMarketExists, "asset " + std::to_string(asset));
  }

  auto [it, inserted] = markets_.try_emplace(asset);
  it->second = Market{.asset = asset, .total_supply = 0, .total_borrow = 0, .params = params, .is_active = true};
  assets_.push_back(asset);

  journal.record([this, asset] {
    markets_.erase(asset);
    assets_.pop_back();
  });
  return it->second;
}

const Market& MarketRegistry::update_market(common::AssetId asset, MarketParams params, ledger::UndoJournal& journal) {
  auto& market = require_active_mut(asset);
  validate_params(params);

  const MarketParams previous = market.params;
  market.params = params;
  journal.record([&market, previous] { market.params = previous; });
  return market;
}

void MarketRegistry::credit_supply(common::AssetId asset, common::Amount amount, ledger::UndoJournal& journal) {
  auto& market = require_active_mut(asset);
  const common::Amount previous = market.total_supply;
  market.total_supply = common::checked_add(previous, amount);
  journal.record([&market, previous] { market.total_supply = previous; });
}

void MarketRegistry::debit_supply(common::AssetId asset, common::Amount amount, ledger::UndoJournal& journal) {
  auto& market = require_active_mut(asset);
  const common::Amount previous = market.total_supply;
  market.total_supply = common::checked_sub(previous, amount);
  journal.record([&market, previous] { market.total_supply = previous; });
}

void MarketRegistry::credit_borrow(common::AssetId asset, common::Amount amount, ledger::UndoJournal& journal) {
  auto& market = require_active_mut(asset);
  const common::Amount previous = market.total_borrow;
  market.total_borrow = common::checked_add(previous, amount);
  journal.record([&market, previous] { market.total_borrow = previous; });
}

void MarketRegistry::debit_borrow(common::AssetId asset, common::Amount amount, ledger::UndoJournal& journal) {
  auto& market = require_active_mut(asset);
  const common::Amount previous = market.total_borrow;
  market.total_borrow = common::checked_sub(previous, amount);
  journal.record([&market, previous] { market.total_borrow = previous; });
}

const Market* MarketRegistry::find(common::AssetId asset) const {
  auto it = markets_.find(asset);
  if (it == markets_.end()) {
    return nullptr;
  }
  return &it->second;
}

const Market& MarketRegistry::require_active(common::AssetId asset) const {
  const auto* market = find(asset);
  if (!market || !market->is_active) {
    throw LendingError(ErrorCode::kMarketInactive, "asset " + std::to_string(asset));
  }
  return *market;
}

bool MarketRegistry::is_active(common::AssetId asset) const {
  const auto* market = find(asset);
  return market && market->is_active;
}

Market& MarketRegistry::require_active_mut(common::AssetId asset) {
  auto it = markets_.find(asset);
  if (it == markets_.end() || !it->second.is_active) {
    throw LendingError(ErrorCode::kMarketInactive, "asset " + std::to_string(asset));
  }
  return it->second;
}

}  // namespace market
}  // namespace lendcore
