#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>

#include "payledger/config/config_loader.hpp"
#include "payledger/ledger/ledger_state.hpp"
#include "payledger/ledger/tx_status.hpp"
#include "payledger/replay/replay_driver.hpp"
#include "payledger/report/account_writer.hpp"
#include "payledger/report/state_digest.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv>\n"
            << "  transactions.csv: type,client,tx,amount records to replay\n"
            << "  Config is read from $PAYLEDGER_CONFIG, ./payledger.toml,\n"
            << "  /etc/payledger/payledger.toml or ~/.config/payledger/payledger.toml\n";
}

std::filesystem::path find_config_path() {
  if (const char* env = std::getenv("PAYLEDGER_CONFIG"); env && *env) {
    return std::filesystem::path{env};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./payledger.toml",
      "/etc/payledger/payledger.toml",
      home ? std::filesystem::path{home} / ".config/payledger/payledger.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(payledger::config::AppConfig& cfg) {
  using payledger::config::ConfigLoader;

  const auto config_path = find_config_path();
  const auto result = config_path.empty()
                          ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                          : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = result.config;
  return true;
}

void print_summary(const payledger::replay::ReplayStats& stats) {
  using payledger::ledger::TxStatus;
  std::cerr << "Replay completed records=" << stats.records
            << " applied=" << stats.applied
            << " conversion_failures=" << stats.conversion_failures
            << " rejected=" << stats.rejected
            << " insufficient_funds=" << stats.count(TxStatus::kInsufficientFunds)
            << " locked=" << stats.count(TxStatus::kLockedAccount)
            << " no_such_tx=" << stats.count(TxStatus::kNoSuchTransaction)
            << " overflow=" << stats.count(TxStatus::kOverflow) << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace payledger;

  if (argc != 2) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    config::AppConfig cfg;
    if (!load_config(cfg)) {
      return 1;
    }

    replay::Driver driver;
    driver.configure(cfg.input);
    if (cfg.report.warnings) {
      driver.set_warning_handler([](const replay::Warning& warning) {
        std::cerr << "warning: " << warning.message << "\n";
      });
    }

    ledger::LedgerState ledger;
    const auto stats = driver.execute(std::filesystem::path{argv[1]}, ledger);

    const auto records = report::snapshot(ledger, cfg.output.sort_by_client);
    report::AccountWriter writer(std::cout);
    writer.write_all(records);
    std::cout.flush();
    if (!std::cout) {
      std::cerr << "error: failed writing account report\n";
      return 1;
    }

    if (cfg.report.summary) {
      print_summary(stats);
    }
    if (cfg.report.state_digest) {
      std::cerr << "State digest: " << report::to_hex(report::compute_state_digest(records)) << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
