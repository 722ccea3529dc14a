#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "lendcore/common/types.hpp"
#include "lendcore/custody/token_vault.hpp"

namespace lendcore {
namespace custody {

struct HolderKey {
  common::AccountId holder{common::kNullAccount};
  common::AssetId asset{common::kNullAsset};

  bool operator==(const HolderKey&) const = default;
};

struct HolderKeyHash {
  std::size_t operator()(const HolderKey& key) const noexcept {
    return std::hash<std::uint64_t>{}(key.holder * 0x9e3779b97f4a7c15ULL ^ key.asset);
  }
};

// Simulator vault: keeps holder balances and pooled custody per asset.
class InMemoryVault : public TokenVault {
 public:
  void pull(common::AssetId asset, common::AccountId from, common::Amount amount) override;
  void push(common::AssetId asset, common::AccountId to, common::Amount amount) override;

  // Seeds a holder balance outside the pool.
  void credit(common::AccountId holder, common::AssetId asset, common::Amount amount);

  [[nodiscard]] common::Amount balance_of(common::AccountId holder, common::AssetId asset) const;
  [[nodiscard]] common::Amount custody_of(common::AssetId asset) const;

 private:
  std::unordered_map<HolderKey, common::Amount, HolderKeyHash> balances_{};
  std::unordered_map<common::AssetId, common::Amount> custody_{};
};

}  // namespace custody
}  // namespace lendcore
