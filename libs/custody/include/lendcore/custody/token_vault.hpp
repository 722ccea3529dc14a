#pragma once

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace custody {

// Moves fungible assets between holders and the pool's custody. Both calls
// either move the full amount or throw; they never short-transfer.
class TokenVault {
 public:
  virtual ~TokenVault() = default;

  // holder -> custody
  virtual void pull(common::AssetId asset, common::AccountId from, common::Amount amount) = 0;
  // custody -> holder
  virtual void push(common::AssetId asset, common::AccountId to, common::Amount amount) = 0;
};

}  // namespace custody
}  // namespace lendcore
