#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "payledger/common/types.hpp"
#include "payledger/ingest/csv_reader.hpp"
#include "payledger/ledger/transaction.hpp"
#include "payledger/money/money.hpp"

namespace payledger {
namespace ingest {

// One decoded input row, before its type has been checked.
struct TxRecord {
  std::string kind{};
  common::ClientId client{};
  common::TxId tx{};
  std::optional<money::Money> amount{};
};

enum class RecordError : std::uint8_t {
  kNone,
  kMissingAmount,
  kUnknownType,
};

[[nodiscard]] std::string_view describe(RecordError error) noexcept;

// Parses decimal text directly into a scaled amount. Digits past the fourth
// fractional place are rounded half away from zero. Returns nullopt on bad
// syntax or overflow.
[[nodiscard]] std::optional<money::Money> parse_amount(std::string_view text);

// Maps header names to column positions and turns rows into TxRecords.
class RecordDecoder {
 public:
  // Throws std::runtime_error when type, client or tx is not in the header.
  explicit RecordDecoder(const CsvRow& header);

  // Throws std::runtime_error on a malformed or out-of-range field.
  [[nodiscard]] TxRecord decode(const CsvRow& row) const;

 private:
  static constexpr std::size_t kNoColumn = static_cast<std::size_t>(-1);

  std::size_t type_column_{kNoColumn};
  std::size_t client_column_{kNoColumn};
  std::size_t tx_column_{kNoColumn};
  std::size_t amount_column_{kNoColumn};
};

// Builds the typed transaction. MissingAmount and UnknownType are the only
// failures; any amount on dispute, resolve or chargeback rows is ignored.
[[nodiscard]] RecordError to_tx(const TxRecord& record, ledger::Tx& out_tx);

}  // namespace ingest
}  // namespace payledger
