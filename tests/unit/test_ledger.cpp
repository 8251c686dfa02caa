#include "test_ledger.hpp"

#include <cassert>

#include "payledger/ledger/ledger_state.hpp"

namespace payledger::tests {

namespace {
money::Money m(std::int64_t scaled) {
  return money::Money::from_scaled(scaled);
}
}  // namespace

void test_ledger_end_to_end() {
  ledger::LedgerState ledger;
  assert(ledger.process(ledger::Deposit{.client = 1, .id = 1, .amount = m(50'000)}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Deposit{.client = 2, .id = 2, .amount = m(30'000)}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Withdrawal{.client = 1, .id = 3, .amount = m(15'000)}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Dispute{.client = 1, .id = 1}) == ledger::TxStatus::kOk);

  assert(ledger.account_count() == 2);

  const auto* first = ledger.find(1);
  assert(first != nullptr);
  assert(first->available() == m(-15'000));
  assert(first->held() == m(50'000));
  assert(first->total() == m(35'000));
  assert(!first->locked());

  const auto* second = ledger.find(2);
  assert(second != nullptr);
  assert(second->available() == m(30'000));
  assert(second->held() == m(0));
  assert(second->total() == m(30'000));
  assert(!second->locked());

  assert(ledger.find(3) == nullptr);
  assert(ledger.accounts().size() == 2);
}

void test_ledger_history_policy() {
  ledger::LedgerState ledger;

  // Unknown ids fail without creating the account.
  assert(ledger.process(ledger::Dispute{.client = 9, .id = 42}) == ledger::TxStatus::kNoSuchTransaction);
  assert(ledger.process(ledger::Resolve{.client = 9, .id = 42}) == ledger::TxStatus::kNoSuchTransaction);
  assert(ledger.process(ledger::Chargeback{.client = 9, .id = 42}) == ledger::TxStatus::kNoSuchTransaction);
  assert(ledger.account_count() == 0);

  // Withdrawals never enter the history.
  assert(ledger.process(ledger::Deposit{.client = 1, .id = 1, .amount = m(20'000)}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Withdrawal{.client = 1, .id = 2, .amount = m(5'000)}) == ledger::TxStatus::kOk);
  assert(!ledger.recorded_amount(2));
  assert(ledger.process(ledger::Dispute{.client = 1, .id = 2}) == ledger::TxStatus::kNoSuchTransaction);
  assert(ledger.find(1)->available() == m(15'000));
  assert(ledger.find(1)->held() == m(0));

  // A failed withdrawal still creates the account.
  assert(ledger.process(ledger::Withdrawal{.client = 5, .id = 3, .amount = m(1)}) == ledger::TxStatus::kInsufficientFunds);
  assert(ledger.find(5) != nullptr);
  assert(ledger.find(5)->total() == m(0));

  // Disputes may repeat; nothing tracks per-transaction dispute state.
  assert(ledger.process(ledger::Dispute{.client = 1, .id = 1}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Resolve{.client = 1, .id = 1}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Dispute{.client = 1, .id = 1}) == ledger::TxStatus::kOk);
  assert(ledger.find(1)->available() == m(-5'000));
  assert(ledger.find(1)->held() == m(20'000));

  // The referenced client is trusted; another client's dispute creates its account.
  assert(ledger.process(ledger::Dispute{.client = 6, .id = 1}) == ledger::TxStatus::kOk);
  assert(ledger.find(6)->available() == m(-20'000));
  assert(ledger.find(6)->held() == m(20'000));

  // A repeated deposit id replaces the recorded amount.
  assert(ledger.process(ledger::Deposit{.client = 1, .id = 1, .amount = m(7'000)}) == ledger::TxStatus::kOk);
  assert(ledger.recorded_amount(1) == m(7'000));
}

void test_ledger_chargeback_locks() {
  ledger::LedgerState ledger;
  assert(ledger.process(ledger::Deposit{.client = 4, .id = 10, .amount = m(25'000)}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Deposit{.client = 4, .id = 11, .amount = m(5'000)}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Dispute{.client = 4, .id = 10}) == ledger::TxStatus::kOk);
  assert(ledger.process(ledger::Chargeback{.client = 4, .id = 10}) == ledger::TxStatus::kOk);

  const auto* account = ledger.find(4);
  assert(account->locked());
  assert(account->available() == m(5'000));
  assert(account->held() == m(0));
  assert(account->total() == m(5'000));

  assert(ledger.process(ledger::Deposit{.client = 4, .id = 12, .amount = m(1)}) == ledger::TxStatus::kLockedAccount);
  assert(ledger.process(ledger::Withdrawal{.client = 4, .id = 13, .amount = m(1)}) == ledger::TxStatus::kLockedAccount);
  // A rejected deposit is not recorded.
  assert(!ledger.recorded_amount(12));
  assert(account->available() == m(5'000));
}

}  // namespace payledger::tests
