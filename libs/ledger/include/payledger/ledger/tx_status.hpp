#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace payledger {
namespace ledger {

enum class TxStatus : std::uint8_t {
  kOk,
  kInsufficientFunds,
  kLockedAccount,
  kNoSuchTransaction,
  kOverflow,
};

inline constexpr std::size_t kTxStatusCount = 5;

[[nodiscard]] std::string_view describe(TxStatus status) noexcept;

}  // namespace ledger
}  // namespace payledger
