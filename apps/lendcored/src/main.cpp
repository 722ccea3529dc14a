#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "lendcore/common/errors.hpp"
#include "lendcore/common/time_utils.hpp"
#include "lendcore/config/config_loader.hpp"
#include "lendcore/custody/in_memory_vault.hpp"
#include "lendcore/events/event_journal.hpp"
#include "lendcore/pool/lending_pool.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./lendcore.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  std::filesystem::path default_paths[] = {
      "./lendcore.toml",
      "/etc/lendcore/lendcore.toml",
      std::filesystem::path{getenv("HOME") ? getenv("HOME") : ""} / ".config/lendcore/lendcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

std::size_t count_journal_records(const std::filesystem::path& path) {
  lendcore::events::JournalReader reader(path);
  lendcore::events::Notification notification;
  std::size_t count = 0;
  while (reader.next(notification)) {
    ++count;
  }
  return count;
}

// Verifies any existing records before appending to the journal.
std::unique_ptr<lendcore::events::JournalWriter> open_journal(const lendcore::config::EventsConfig& cfg) {
  if (std::filesystem::exists(cfg.journal_path)) {
    std::cout << "  Existing journal records: " << count_journal_records(cfg.journal_path) << "\n";
  }
  auto writer = std::make_unique<lendcore::events::JournalWriter>(cfg.journal_path, cfg.flush_threshold);
  std::cout << "  Event journal: " << cfg.journal_path << "\n";
  return writer;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace lendcore;

  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::EngineConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Owner: " << cfg.pool.owner << "\n";
  std::cout << "  Markets: " << cfg.markets.size() << "\n";
  std::cout << "  Seeded balances: " << cfg.balances.size() << "\n";

  std::unique_ptr<events::JournalWriter> journal;
  if (!cfg.events.journal_path.empty()) {
    try {
      journal = open_journal(cfg.events);
    } catch (const std::runtime_error& e) {
      std::cerr << "Cannot open event journal: " << e.what() << "\n";
      return 1;
    }
  }

  custody::InMemoryVault vault;
  for (const auto& balance : cfg.balances) {
    vault.credit(balance.account, balance.asset, balance.amount);
  }

  pool::LendingPool pool{vault, pool::AccessPolicy{cfg.pool.owner}, common::system_clock()};
  if (journal) {
    pool.events().set_sink([&journal](const events::Notification& notification) { journal->append(notification); });
  }

  try {
    for (const auto& market_cfg : cfg.markets) {
      std::cout << "  Configuring market " << market_cfg.asset << " (" << market_cfg.symbol << ")"
                << " collateral factor " << market_cfg.collateral_factor << "bp\n";
      pool.add_market(cfg.pool.owner, market_cfg.asset,
                      market::MarketParams{
                          .collateral_factor = market_cfg.collateral_factor,
                          .supply_rate = market_cfg.supply_rate,
                          .borrow_rate = market_cfg.borrow_rate,
                      });
    }

    if (cfg.pool.paused) {
      pool.pause(cfg.pool.owner);
      std::cout << "  Protocol starts paused\n";
    }
  } catch (const common::LendingError& e) {
    std::cerr << "Bootstrap failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "lendcored bootstrapped successfully\n";
  std::cout << "Supported assets: " << pool.supported_assets().size() << "\n";
  std::cout << "Notifications published: " << pool.events().size() << "\n";

  if (const auto& sink_error = pool.events().sink_error()) {
    std::cerr << "Event journal write failed: " << *sink_error << "\n";
    return 1;
  }

  if (journal) {
    try {
      journal->sync();
    } catch (const std::exception& e) {
      std::cerr << "Event journal sync failed: " << e.what() << "\n";
      return 1;
    }
    std::cout << "Journal records written: " << journal->records_written() << "\n";
  }

  return 0;
}
