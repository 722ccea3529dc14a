#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace common {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kInvalidAmount:
      return "InvalidAmount";
    case ErrorCode::kInvalidAsset:
      return "InvalidAsset";
    case ErrorCode::kInvalidCollateralFactor:
      return "InvalidCollateralFactor";
    case ErrorCode::kMarketExists:
      return "MarketExists";
    case ErrorCode::kMarketInactive:
      return "MarketInactive";
    case ErrorCode::kInsufficientDeposit:
      return "InsufficientDeposit";
    case ErrorCode::kInsufficientBorrow:
      return "InsufficientBorrow";
    case ErrorCode::kInsufficientLiquidity:
      return "InsufficientLiquidity";
    case ErrorCode::kInsufficientCollateral:
      return "InsufficientCollateral";
    case ErrorCode::kInsufficientBorrowToLiquidate:
      return "InsufficientBorrowToLiquidate";
    case ErrorCode::kUnsafeWithdrawal:
      return "UnsafeWithdrawal";
    case ErrorCode::kUnsafeBorrow:
      return "UnsafeBorrow";
    case ErrorCode::kNotLiquidatable:
      return "NotLiquidatable";
    case ErrorCode::kInvalidNonce:
      return "InvalidNonce";
    case ErrorCode::kSignatureExpired:
      return "SignatureExpired";
    case ErrorCode::kInvalidSignature:
      return "InvalidSignature";
    case ErrorCode::kNoCollateral:
      return "NoCollateral";
    case ErrorCode::kProtocolPaused:
      return "ProtocolPaused";
    case ErrorCode::kUnauthorized:
      return "Unauthorized";
    case ErrorCode::kReentrantCall:
      return "ReentrantCall";
    case ErrorCode::kTransferFailed:
      return "TransferFailed";
    case ErrorCode::kArithmeticOverflow:
      return "ArithmeticOverflow";
    case ErrorCode::kRollbackIncomplete:
      return "RollbackIncomplete";
  }
  return "Unknown";
}

LendingError::LendingError(ErrorCode code)
    : std::runtime_error(std::string(to_string(code))), code_(code) {}

LendingError::LendingError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

}  // namespace common
}  // namespace lendcore
