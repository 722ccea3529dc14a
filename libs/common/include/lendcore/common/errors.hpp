#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lendcore {
namespace common {

enum class ErrorCode : std::uint16_t {
  // input validation
  kInvalidAmount = 1001,
  kInvalidAsset = 1002,
  kInvalidCollateralFactor = 1003,

  // state conflict
  kMarketExists = 2001,
  kMarketInactive = 2002,

  // insufficiency
  kInsufficientDeposit = 3001,
  kInsufficientBorrow = 3002,
  kInsufficientLiquidity = 3003,
  kInsufficientCollateral = 3004,
  kInsufficientBorrowToLiquidate = 3005,

  // safety gates
  kUnsafeWithdrawal = 4001,
  kUnsafeBorrow = 4002,
  kNotLiquidatable = 4003,

  // authorization
  kInvalidNonce = 5001,
  kSignatureExpired = 5002,
  kInvalidSignature = 5003,
  kNoCollateral = 5004,

  // operational
  kProtocolPaused = 6001,
  kUnauthorized = 6002,
  kReentrantCall = 6003,
  kTransferFailed = 6004,
  kArithmeticOverflow = 6005,
  kRollbackIncomplete = 6006,
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

class LendingError : public std::runtime_error {
 public:
  explicit LendingError(ErrorCode code);
  LendingError(ErrorCode code, const std::string& detail);

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace common
}  // namespace lendcore
