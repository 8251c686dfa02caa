#pragma once

#include <string_view>
#include <variant>

#include "payledger/common/types.hpp"
#include "payledger/money/money.hpp"

namespace payledger {
namespace ledger {

struct Deposit {
  common::ClientId client{};
  common::TxId id{};
  money::Money amount{};
};

struct Withdrawal {
  common::ClientId client{};
  common::TxId id{};
  money::Money amount{};
};

// Dispute, Resolve and Chargeback reference the id of an earlier deposit.
struct Dispute {
  common::ClientId client{};
  common::TxId id{};
};

struct Resolve {
  common::ClientId client{};
  common::TxId id{};
};

struct Chargeback {
  common::ClientId client{};
  common::TxId id{};
};

using Tx = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

[[nodiscard]] common::ClientId client_of(const Tx& tx) noexcept;
[[nodiscard]] common::TxId id_of(const Tx& tx) noexcept;
[[nodiscard]] std::string_view kind_name(const Tx& tx) noexcept;

}  // namespace ledger
}  // namespace payledger
