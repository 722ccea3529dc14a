#pragma once

#include <cstdint>
#include <limits>

namespace lendcore {
namespace common {

using AccountId = std::uint64_t;
using AssetId = std::uint32_t;
using Amount = std::uint64_t;
using TimestampSec = std::int64_t;
using BasisPoints = std::uint32_t;
using Nonce = std::uint64_t;

// Weighted values and ratios are accumulated in 128 bits so that
// amount * basis_points never wraps for any 64-bit amount.
using Wide = unsigned __int128;

inline constexpr AccountId kNullAccount = 0;
inline constexpr AssetId kNullAsset = 0;

inline constexpr BasisPoints kBasisPointDenominator = 10'000;
inline constexpr BasisPoints kLiquidationThreshold = 8'000;  // 80%
inline constexpr BasisPoints kLiquidationPenalty = 500;      // 5% liquidator bonus

// Collateralization ratio in basis points. kInfiniteRatio means no borrow.
using Ratio = std::uint64_t;
inline constexpr Ratio kInfiniteRatio = std::numeric_limits<Ratio>::max();

}  // namespace common
}  // namespace lendcore
