#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <string_view>

#include "payledger/config/config_loader.hpp"
#include "payledger/ledger/ledger_state.hpp"
#include "payledger/ledger/tx_status.hpp"

namespace payledger {
namespace replay {

struct Warning {
  std::uint64_t record{0};  // 1-based, header excluded
  std::string message{};
};

struct ReplayStats {
  std::uint64_t records{0};
  std::uint64_t applied{0};
  std::uint64_t conversion_failures{0};
  std::uint64_t rejected{0};
  std::array<std::uint64_t, ledger::kTxStatusCount> by_status{};

  [[nodiscard]] std::uint64_t count(ledger::TxStatus status) const noexcept {
    return by_status[static_cast<std::size_t>(status)];
  }
};

// Feeds every record of a transaction CSV through a ledger in input order.
// Per-record failures go to the warning handler and the run continues;
// unreadable input or a malformed record throws std::runtime_error.
class Driver {
 public:
  using WarningHandler = std::function<void(const Warning&)>;

  Driver();

  void configure(config::InputConfig input);
  void set_warning_handler(WarningHandler handler);

  ReplayStats execute(const std::filesystem::path& input_path, ledger::LedgerState& ledger);
  ReplayStats execute(std::istream& input, ledger::LedgerState& ledger);

 private:
  config::InputConfig input_{};
  WarningHandler warning_handler_{};

  void warn(std::uint64_t record, std::string_view reason);
};

}  // namespace replay
}  // namespace payledger
