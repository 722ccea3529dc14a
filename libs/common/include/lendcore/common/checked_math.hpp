#pragma once

#include "lendcore/common/errors.hpp"
#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

// Ledger arithmetic never wraps: any overflow or underflow aborts the
// enclosing operation with kArithmeticOverflow.

inline Amount checked_add(Amount lhs, Amount rhs) {
  Amount out{};
  if (__builtin_add_overflow(lhs, rhs, &out)) {
    throw LendingError(ErrorCode::kArithmeticOverflow, "addition overflow");
  }
  return out;
}

inline Amount checked_sub(Amount lhs, Amount rhs) {
  Amount out{};
  if (__builtin_sub_overflow(lhs, rhs, &out)) {
    throw LendingError(ErrorCode::kArithmeticOverflow, "subtraction underflow");
  }
  return out;
}

inline Wide checked_add(Wide lhs, Wide rhs) {
  Wide out{};
  if (__builtin_add_overflow(lhs, rhs, &out)) {
    throw LendingError(ErrorCode::kArithmeticOverflow, "addition overflow");
  }
  return out;
}

inline Wide checked_mul(Wide lhs, Wide rhs) {
  Wide out{};
  if (__builtin_mul_overflow(lhs, rhs, &out)) {
    throw LendingError(ErrorCode::kArithmeticOverflow, "multiplication overflow");
  }
  return out;
}

// amount * basis_points / 10000, truncating.
inline Wide apply_basis_points(Amount amount, BasisPoints basis_points) {
  return checked_mul(static_cast<Wide>(amount), static_cast<Wide>(basis_points)) / kBasisPointDenominator;
}

inline Amount narrow_amount(Wide value) {
  if (value > static_cast<Wide>(std::numeric_limits<Amount>::max())) {
    throw LendingError(ErrorCode::kArithmeticOverflow, "value exceeds amount range");
  }
  return static_cast<Amount>(value);
}

}  // namespace common
}  // namespace lendcore
