#include "payledger/report/account_writer.hpp"

#include <algorithm>

namespace payledger {
namespace report {

AccountRecord AccountRecord::from(const ledger::Account& account) noexcept {
  return AccountRecord{
      .client = account.client(),
      .available = account.available(),
      .held = account.held(),
      .total = account.total(),
      .locked = account.locked(),
  };
}

std::vector<AccountRecord> snapshot(const ledger::LedgerState& ledger, bool sort_by_client) {
  std::vector<AccountRecord> records;
  records.reserve(ledger.account_count());
  for (const auto* account : ledger.accounts()) {
    records.push_back(AccountRecord::from(*account));
  }
  if (sort_by_client) {
    std::sort(records.begin(), records.end(), [](const AccountRecord& a, const AccountRecord& b) {
      return a.client < b.client;
    });
  }
  return records;
}

AccountWriter::AccountWriter(std::ostream& out, char delimiter)
    : out_(out), delimiter_(delimiter) {}

void AccountWriter::write_header() {
  out_ << "client" << delimiter_ << "available" << delimiter_ << "held" << delimiter_
       << "total" << delimiter_ << "locked" << '\n';
  header_written_ = true;
}

void AccountWriter::write(const AccountRecord& record) {
  if (!header_written_) {
    write_header();
  }
  out_ << record.client << delimiter_ << record.available << delimiter_ << record.held
       << delimiter_ << record.total << delimiter_ << (record.locked ? "true" : "false") << '\n';
}

// Nothing at all is written for an empty ledger.
void AccountWriter::write_all(std::span<const AccountRecord> records) {
  if (records.empty()) {
    return;
  }
  if (!header_written_) {
    write_header();
  }
  for (const auto& record : records) {
    write(record);
  }
}

}  // namespace report
}  // namespace payledger
