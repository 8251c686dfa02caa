#pragma once

#include <ostream>
#include <span>
#include <vector>

#include "payledger/common/types.hpp"
#include "payledger/ledger/account.hpp"
#include "payledger/ledger/ledger_state.hpp"
#include "payledger/money/money.hpp"

namespace payledger {
namespace report {

struct AccountRecord {
  common::ClientId client{};
  money::Money available{};
  money::Money held{};
  money::Money total{};
  bool locked{false};

  [[nodiscard]] static AccountRecord from(const ledger::Account& account) noexcept;
};

// One record per account the ledger has seen. Without sorting the order is
// whatever the ledger's map yields.
[[nodiscard]] std::vector<AccountRecord> snapshot(const ledger::LedgerState& ledger,
                                                  bool sort_by_client = true);

class AccountWriter {
 public:
  explicit AccountWriter(std::ostream& out, char delimiter = ',');

  void write_header();
  void write(const AccountRecord& record);
  void write_all(std::span<const AccountRecord> records);

 private:
  std::ostream& out_;
  char delimiter_;
  bool header_written_{false};
};

}  // namespace report
}  // namespace payledger
