#include "payledger/ledger/ledger_state.hpp"

namespace payledger {
namespace ledger {

TxStatus LedgerState::process(const Tx& tx) {
  return std::visit([this](const auto& variant) { return apply(variant); }, tx);
}

const Account* LedgerState::find(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

std::vector<const Account*> LedgerState::accounts() const {
  std::vector<const Account*> out;
  out.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    out.push_back(&account);
  }
  return out;
}

std::optional<money::Money> LedgerState::recorded_amount(common::TxId id) const {
  if (auto it = amounts_.find(id); it != amounts_.end()) {
    return it->second;
  }
  return std::nullopt;
}

Account& LedgerState::ensure_account(common::ClientId client) {
  return accounts_.try_emplace(client, client).first->second;
}

TxStatus LedgerState::apply(const Deposit& tx) {
  const auto status = ensure_account(tx.client).deposit(tx.amount);
  if (status == TxStatus::kOk) {
    // Ids are unique by contract; a repeated id simply replaces the amount.
    amounts_.insert_or_assign(tx.id, tx.amount);
  }
  return status;
}

TxStatus LedgerState::apply(const Withdrawal& tx) {
  return ensure_account(tx.client).withdraw(tx.amount);
}

// The history lookup comes first so an unknown id never creates an account.
TxStatus LedgerState::apply(const Dispute& tx) {
  const auto amount = recorded_amount(tx.id);
  if (!amount) {
    return TxStatus::kNoSuchTransaction;
  }
  return ensure_account(tx.client).dispute(*amount);
}

TxStatus LedgerState::apply(const Resolve& tx) {
  const auto amount = recorded_amount(tx.id);
  if (!amount) {
    return TxStatus::kNoSuchTransaction;
  }
  return ensure_account(tx.client).resolve(*amount);
}

TxStatus LedgerState::apply(const Chargeback& tx) {
  const auto amount = recorded_amount(tx.id);
  if (!amount) {
    return TxStatus::kNoSuchTransaction;
  }
  return ensure_account(tx.client).chargeback(*amount);
}

}  // namespace ledger
}  // namespace payledger
