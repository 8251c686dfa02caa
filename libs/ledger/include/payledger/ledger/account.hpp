#pragma once

#include "payledger/common/types.hpp"
#include "payledger/ledger/tx_status.hpp"
#include "payledger/money/money.hpp"

namespace payledger {
namespace ledger {

// Balance state of one client. Every operation validates all of its arithmetic
// before writing, so a failed operation leaves the account untouched.
class Account {
 public:
  explicit Account(common::ClientId client) noexcept;

  [[nodiscard]] TxStatus deposit(money::Money amount);
  [[nodiscard]] TxStatus withdraw(money::Money amount);

  // Not gated on the locked flag: a chargeback is what sets it.
  [[nodiscard]] TxStatus dispute(money::Money amount);
  [[nodiscard]] TxStatus resolve(money::Money amount);
  [[nodiscard]] TxStatus chargeback(money::Money amount);

  [[nodiscard]] common::ClientId client() const noexcept { return client_; }
  [[nodiscard]] money::Money available() const noexcept { return available_; }
  [[nodiscard]] money::Money held() const noexcept { return held_; }
  [[nodiscard]] money::Money total() const noexcept { return total_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }

 private:
  common::ClientId client_;
  money::Money available_{};
  money::Money held_{};
  money::Money total_{};
  bool locked_{false};

  // Stores the new balances if available + held is representable.
  TxStatus commit(money::Money available, money::Money held);
};

}  // namespace ledger
}  // namespace payledger
