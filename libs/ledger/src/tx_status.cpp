#include "payledger/ledger/tx_status.hpp"

namespace payledger {
namespace ledger {

std::string_view describe(TxStatus status) noexcept {
  switch (status) {
    case TxStatus::kOk:
      return "Ok";
    case TxStatus::kInsufficientFunds:
      return "Insufficient funds";
    case TxStatus::kLockedAccount:
      return "Locked account";
    case TxStatus::kNoSuchTransaction:
      return "Referenced transaction not found";
    case TxStatus::kOverflow:
      return "Numerical overflow";
  }
  return "Unknown status";
}

}  // namespace ledger
}  // namespace payledger
