#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "payledger/common/types.hpp"
#include "payledger/ledger/account.hpp"
#include "payledger/ledger/transaction.hpp"
#include "payledger/ledger/tx_status.hpp"
#include "payledger/money/money.hpp"

namespace payledger {
namespace ledger {

// Owns every account and the amounts of past deposits. Only deposits are
// remembered, so only deposits can be disputed, resolved or charged back.
class LedgerState {
 public:
  [[nodiscard]] TxStatus process(const Tx& tx);

  [[nodiscard]] const Account* find(common::ClientId client) const;
  [[nodiscard]] std::vector<const Account*> accounts() const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }
  [[nodiscard]] std::optional<money::Money> recorded_amount(common::TxId id) const;

 private:
  std::unordered_map<common::ClientId, Account> accounts_{};
  std::unordered_map<common::TxId, money::Money> amounts_{};

  Account& ensure_account(common::ClientId client);

  TxStatus apply(const Deposit& tx);
  TxStatus apply(const Withdrawal& tx);
  TxStatus apply(const Dispute& tx);
  TxStatus apply(const Resolve& tx);
  TxStatus apply(const Chargeback& tx);
};

}  // namespace ledger
}  // namespace payledger
