#include "lendcore/events/notification.hpp"

namespace lendcore {
namespace events {

std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kMarketAdded:
      return "MarketAdded";
    case EventKind::kMarketUpdated:
      return "MarketUpdated";
    case EventKind::kRatesUpdated:
      return "RatesUpdated";
    case EventKind::kDeposit:
      return "Deposit";
    case EventKind::kWithdraw:
      return "Withdraw";
    case EventKind::kBorrow:
      return "Borrow";
    case EventKind::kRepay:
      return "Repay";
    case EventKind::kLiquidate:
      return "Liquidate";
    case EventKind::kPaused:
      return "Paused";
    case EventKind::kUnpaused:
      return "Unpaused";
    case EventKind::kEmergencyWithdrawal:
      return "EmergencyWithdrawal";
  }
  return "Unknown";
}

bool is_known_kind(std::uint16_t raw) noexcept {
  return raw >= static_cast<std::uint16_t>(EventKind::kMarketAdded) &&
         raw <= static_cast<std::uint16_t>(EventKind::kEmergencyWithdrawal);
}

}  // namespace events
}  // namespace lendcore
