#include "test_replay.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "payledger/ledger/ledger_state.hpp"
#include "payledger/replay/replay_driver.hpp"

namespace payledger::tests {

namespace {

money::Money m(std::int64_t scaled) {
  return money::Money::from_scaled(scaled);
}

bool replay_throws(const std::string& text) {
  replay::Driver driver;
  ledger::LedgerState ledger;
  std::istringstream input(text);
  try {
    (void)driver.execute(input, ledger);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

}  // namespace

void test_replay_warnings() {
  std::istringstream input(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "deposit,2,2,3.0\n"
      "withdrawal,1,3,1.5\n"
      "dispute,1,1,\n"
      "withdrawal,2,4,10.0\n"
      "deposit,2,5\n"
      "refund,2,6,1.0\n"
      "chargeback,3,99\n");

  replay::Driver driver;
  std::vector<replay::Warning> warnings;
  driver.set_warning_handler([&](const replay::Warning& warning) { warnings.push_back(warning); });

  ledger::LedgerState ledger;
  const auto stats = driver.execute(input, ledger);

  assert(stats.records == 8);
  assert(stats.applied == 4);
  assert(stats.conversion_failures == 2);
  assert(stats.rejected == 2);
  assert(stats.count(ledger::TxStatus::kOk) == 4);
  assert(stats.count(ledger::TxStatus::kInsufficientFunds) == 1);
  assert(stats.count(ledger::TxStatus::kNoSuchTransaction) == 1);

  assert(warnings.size() == 4);
  assert(warnings[0].record == 5);
  assert(warnings[0].message == "transaction 5 failed: Insufficient funds");
  assert(warnings[1].message == "transaction 6 failed: Amount missing in transaction CSV");
  assert(warnings[2].message == "transaction 7 failed: Unknown transaction type");
  assert(warnings[3].message == "transaction 8 failed: Referenced transaction not found");

  assert(ledger.account_count() == 2);
  assert(ledger.find(1)->available() == m(-15'000));
  assert(ledger.find(1)->held() == m(50'000));
  assert(ledger.find(1)->total() == m(35'000));
  assert(ledger.find(2)->available() == m(30'000));
  assert(ledger.find(3) == nullptr);

  // Quoted cells are trimmed after unquoting; a BOM before the header is dropped.
  std::istringstream quoted(
      "\xEF\xBB\xBFtype,client,tx,amount\n"
      "\" deposit \",1,1,\" 5.0 \"\n");
  ledger::LedgerState quoted_ledger;
  const auto quoted_stats = driver.execute(quoted, quoted_ledger);
  assert(quoted_stats.applied == 1);
  assert(quoted_stats.conversion_failures == 0);
  assert(quoted_ledger.find(1)->available() == m(50'000));

  // Alternate delimiter, read from a file.
  const auto path = std::filesystem::temp_directory_path() / "payledger_replay_test.csv";
  {
    std::ofstream out(path);
    out << "type;client;tx;amount\ndeposit;7;1;2.5\n";
  }
  replay::Driver semicolon;
  semicolon.configure({.delimiter = ";", .trim = true});
  ledger::LedgerState other;
  const auto file_stats = semicolon.execute(path, other);
  assert(file_stats.applied == 1);
  assert(other.find(7)->available() == m(25'000));
  std::filesystem::remove(path);
}

void test_replay_fatal_errors() {
  assert(replay_throws(""));
  assert(replay_throws("client,tx,amount\n1,1,1.0\n"));
  assert(replay_throws("type,client,tx,amount\ndeposit,x,1,1.0\n"));
  assert(replay_throws("type,client,tx,amount\ndeposit,1,1,1.0.0\n"));
  assert(replay_throws("type,client,tx,amount\n\"deposit,1,1,1.0\n"));
  assert(!replay_throws("type,client,tx,amount\n"));

  replay::Driver driver;
  ledger::LedgerState ledger;
  bool missing_file = false;
  try {
    (void)driver.execute(std::filesystem::path{"/nonexistent/transactions.csv"}, ledger);
  } catch (const std::runtime_error&) {
    missing_file = true;
  }
  assert(missing_file);

  bool bad_delimiter = false;
  try {
    driver.configure({.delimiter = "", .trim = true});
  } catch (const std::invalid_argument&) {
    bad_delimiter = true;
  }
  assert(bad_delimiter);
}

}  // namespace payledger::tests
