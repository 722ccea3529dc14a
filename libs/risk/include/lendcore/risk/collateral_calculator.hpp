#pragma once

#include <cstdint>
#include <optional>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/position_ledger.hpp"
#include "lendcore/market/market_registry.hpp"

namespace lendcore {
namespace risk {

struct PositionValues {
  common::Wide collateral_value{0};  // sum of deposit * collateral_factor / 10000
  common::Wide borrow_value{0};      // sum of raw borrows
};

// Hypothetical change applied to one asset leg while valuing a position.
struct PositionDelta {
  enum class Kind : std::uint8_t {
    kWithdraw,
    kBorrow,
  };

  Kind kind{Kind::kWithdraw};
  common::AssetId asset{common::kNullAsset};
  common::Amount amount{0};
};

// Read-only view over the registry and ledger. Never mutates either.
class CollateralCalculator {
 public:
  CollateralCalculator(const market::MarketRegistry& registry, const ledger::PositionLedger& ledger)
      : registry_(registry), ledger_(ledger) {}

  [[nodiscard]] common::Ratio collateralization_ratio(common::AccountId account) const;
  [[nodiscard]] bool can_withdraw(common::AccountId account, common::AssetId asset, common::Amount amount) const;
  [[nodiscard]] bool can_borrow(common::AccountId account, common::AssetId asset, common::Amount amount) const;
  [[nodiscard]] bool is_liquidatable(common::AccountId account) const;

  [[nodiscard]] PositionValues position_values(common::AccountId account) const;

  [[nodiscard]] static common::Ratio ratio_of(const PositionValues& values);

 private:
  const market::MarketRegistry& registry_;
  const ledger::PositionLedger& ledger_;

  [[nodiscard]] PositionValues position_values_with_delta(common::AccountId account,
                                                          std::optional<PositionDelta> delta) const;
  [[nodiscard]] static bool is_safe(common::Ratio ratio) noexcept;
};

}  // namespace risk
}  // namespace lendcore
