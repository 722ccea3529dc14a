#include "lendcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <limits>
#include <sstream>
#include <unordered_set>

namespace lendcore {
namespace config {

namespace {

// Collects range problems found while reading values; they are reported
// together with the semantic validation errors.
class Parser {
 public:
  template <typename T>
  T get_unsigned_or(const toml::table& tbl, std::string_view key, T default_val, const std::string& field) {
    auto val = tbl[key].value<std::int64_t>();
    if (!val) {
      return default_val;
    }
    if (*val < 0) {
      errors_.push_back({field, "must not be negative"});
      return default_val;
    }
    if (static_cast<std::uint64_t>(*val) > std::numeric_limits<T>::max()) {
      errors_.push_back({field, "value out of range"});
      return default_val;
    }
    return static_cast<T>(*val);
  }

  static std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
    if (auto val = tbl[key].value<std::string_view>()) {
      return std::string(*val);
    }
    return std::string(default_val);
  }

  PoolConfig parse_pool(const toml::table& root) {
    PoolConfig cfg;
    if (auto* pool = root["pool"].as_table()) {
      cfg.owner = get_unsigned_or<common::AccountId>(*pool, "owner", cfg.owner, "pool.owner");
      if (auto val = (*pool)["paused"].value<bool>()) {
        cfg.paused = *val;
      }
    }
    return cfg;
  }

  EventsConfig parse_events(const toml::table& root) {
    EventsConfig cfg;
    if (auto* events = root["events"].as_table()) {
      cfg.journal_path = get_str_or(*events, "journal_path", cfg.journal_path.string());
      cfg.flush_threshold =
          get_unsigned_or<std::size_t>(*events, "flush_threshold", cfg.flush_threshold, "events.flush_threshold");
    }
    return cfg;
  }

  std::vector<MarketConfig> parse_markets(const toml::table& root) {
    std::vector<MarketConfig> markets;
    if (auto* arr = root["markets"].as_array()) {
      for (std::size_t i = 0; i < arr->size(); ++i) {
        auto* market_tbl = arr->get(i)->as_table();
        if (!market_tbl) {
          continue;
        }
        const std::string prefix = "markets[" + std::to_string(i) + "]";
        MarketConfig market;
        market.asset = get_unsigned_or<common::AssetId>(*market_tbl, "asset", market.asset, prefix + ".asset");
        market.symbol = get_str_or(*market_tbl, "symbol", market.symbol);
        market.collateral_factor = get_unsigned_or<common::BasisPoints>(
            *market_tbl, "collateral_factor_bp", market.collateral_factor, prefix + ".collateral_factor_bp");
        market.supply_rate = get_unsigned_or<common::BasisPoints>(*market_tbl, "supply_rate_bp", market.supply_rate,
                                                                  prefix + ".supply_rate_bp");
        market.borrow_rate = get_unsigned_or<common::BasisPoints>(*market_tbl, "borrow_rate_bp", market.borrow_rate,
                                                                  prefix + ".borrow_rate_bp");
        markets.push_back(std::move(market));
      }
    }

    if (markets.empty()) {
      markets.push_back(MarketConfig{});
    }

    return markets;
  }

  std::vector<BalanceConfig> parse_balances(const toml::table& root) {
    std::vector<BalanceConfig> balances;
    if (auto* arr = root["balances"].as_array()) {
      for (std::size_t i = 0; i < arr->size(); ++i) {
        auto* balance_tbl = arr->get(i)->as_table();
        if (!balance_tbl) {
          continue;
        }
        const std::string prefix = "balances[" + std::to_string(i) + "]";
        BalanceConfig balance;
        balance.account = get_unsigned_or<common::AccountId>(*balance_tbl, "account", balance.account,
                                                             prefix + ".account");
        balance.asset = get_unsigned_or<common::AssetId>(*balance_tbl, "asset", balance.asset, prefix + ".asset");
        balance.amount = get_unsigned_or<common::Amount>(*balance_tbl, "amount", balance.amount, prefix + ".amount");
        balances.push_back(balance);
      }
    }
    return balances;
  }

  EngineConfig parse_config(const toml::table& root) {
    EngineConfig cfg;
    cfg.pool = parse_pool(root);
    cfg.events = parse_events(root);
    cfg.markets = parse_markets(root);
    cfg.balances = parse_balances(root);
    return cfg;
  }

  std::vector<ValidationError> take_errors() { return std::move(errors_); }

 private:
  std::vector<ValidationError> errors_{};
};

LoadResult finish(const toml::table& table) {
  LoadResult result;
  Parser parser;
  result.config = parser.parse_config(table);
  result.errors = parser.take_errors();
  auto semantic = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), semantic.begin(), semantic.end());
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.pool.owner == common::kNullAccount) {
    errors.push_back({"pool.owner", "owner must be a non-null account"});
  }

  if (!config.events.journal_path.empty() && config.events.flush_threshold == 0) {
    errors.push_back({"events.flush_threshold", "must be greater than 0"});
  }

  std::unordered_set<common::AssetId> assets;
  for (std::size_t i = 0; i < config.markets.size(); ++i) {
    const auto& market = config.markets[i];
    std::string prefix = "markets[" + std::to_string(i) + "]";

    if (market.asset == common::kNullAsset) {
      errors.push_back({prefix + ".asset", "asset id must be greater than 0"});
    } else if (!assets.insert(market.asset).second) {
      errors.push_back({prefix + ".asset", "duplicate market for asset " + std::to_string(market.asset)});
    }

    if (market.symbol.empty()) {
      errors.push_back({prefix + ".symbol", "symbol cannot be empty"});
    }

    if (market.collateral_factor > common::kBasisPointDenominator) {
      errors.push_back({prefix + ".collateral_factor_bp", "must be <= 10000"});
    }
  }

  for (std::size_t i = 0; i < config.balances.size(); ++i) {
    const auto& balance = config.balances[i];
    std::string prefix = "balances[" + std::to_string(i) + "]";

    if (balance.account == common::kNullAccount) {
      errors.push_back({prefix + ".account", "account must be greater than 0"});
    }

    if (assets.find(balance.asset) == assets.end()) {
      errors.push_back({prefix + ".asset", "asset has no configured market"});
    }

    if (balance.amount == 0) {
      errors.push_back({prefix + ".amount", "must be positive"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# lendcore configuration
# Generated default configuration

[pool]
owner = 1
paused = false

[events]
# journal_path = "/var/lib/lendcore/events.journal"
flush_threshold = 4096

[[markets]]
asset = 1
symbol = "USDC"
collateral_factor_bp = 8000  # 80%
supply_rate_bp = 300         # 3% APY
borrow_rate_bp = 500         # 5% APY

[[markets]]
asset = 2
symbol = "WETH"
collateral_factor_bp = 7500  # 75%
supply_rate_bp = 200
borrow_rate_bp = 400

[[balances]]
account = 100
asset = 1
amount = 1000000

[[balances]]
account = 101
asset = 2
amount = 500
)";
}

}  // namespace config
}  // namespace lendcore
