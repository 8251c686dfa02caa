#include "payledger/ledger/account.hpp"

namespace payledger {
namespace ledger {

Account::Account(common::ClientId client) noexcept : client_(client) {}

TxStatus Account::commit(money::Money available, money::Money held) {
  const auto total = available.checked_add(held);
  if (!total) {
    return TxStatus::kOverflow;
  }
  available_ = available;
  held_ = held;
  total_ = *total;
  return TxStatus::kOk;
}

TxStatus Account::deposit(money::Money amount) {
  if (locked_) {
    return TxStatus::kLockedAccount;
  }
  const auto available = available_.checked_add(amount);
  if (!available) {
    return TxStatus::kOverflow;
  }
  return commit(*available, held_);
}

TxStatus Account::withdraw(money::Money amount) {
  if (locked_) {
    return TxStatus::kLockedAccount;
  }
  const auto available = available_.checked_sub(amount);
  if (!available) {
    return TxStatus::kOverflow;
  }
  if (available->is_negative()) {
    return TxStatus::kInsufficientFunds;
  }
  return commit(*available, held_);
}

TxStatus Account::dispute(money::Money amount) {
  const auto available = available_.checked_sub(amount);
  const auto held = held_.checked_add(amount);
  if (!available || !held) {
    return TxStatus::kOverflow;
  }
  return commit(*available, *held);
}

TxStatus Account::resolve(money::Money amount) {
  const auto available = available_.checked_add(amount);
  const auto held = held_.checked_sub(amount);
  if (!available || !held) {
    return TxStatus::kOverflow;
  }
  return commit(*available, *held);
}

TxStatus Account::chargeback(money::Money amount) {
  const auto held = held_.checked_sub(amount);
  if (!held) {
    return TxStatus::kOverflow;
  }
  const auto status = commit(available_, *held);
  if (status == TxStatus::kOk) {
    locked_ = true;
  }
  return status;
}

}  // namespace ledger
}  // namespace payledger
