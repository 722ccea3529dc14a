#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace config {

struct PoolConfig {
  common::AccountId owner{1};
  bool paused{false};
};

struct EventsConfig {
  std::filesystem::path journal_path{};  // empty: notifications stay in memory
  std::size_t flush_threshold{4096};
};

struct MarketConfig {
  common::AssetId asset{1};
  std::string symbol{"USDC"};
  common::BasisPoints collateral_factor{8000};
  common::BasisPoints supply_rate{300};
  common::BasisPoints borrow_rate{500};
};

// Opening holder balance in the simulator vault.
struct BalanceConfig {
  common::AccountId account{0};
  common::AssetId asset{0};
  common::Amount amount{0};
};

struct EngineConfig {
  PoolConfig pool;
  EventsConfig events;
  std::vector<MarketConfig> markets;
  std::vector<BalanceConfig> balances;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace lendcore
