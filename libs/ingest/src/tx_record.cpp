#include "payledger/ingest/tx_record.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>
#include <utility>

namespace payledger {
namespace ingest {

namespace {

constexpr std::uint64_t kPositiveLimit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
constexpr std::uint64_t kNegativeLimit = kPositiveLimit + 1;

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

std::string where(const CsvRow& row) {
  return "line " + std::to_string(row.line) + ": ";
}

const std::string* cell(const CsvRow& row, std::size_t column) {
  if (column >= row.fields.size()) {
    return nullptr;
  }
  return &row.fields[column];
}

const std::string& required_cell(const CsvRow& row, std::size_t column, std::string_view name) {
  const auto* value = cell(row, column);
  if (!value) {
    throw std::runtime_error(where(row) + "missing field '" + std::string(name) + "'");
  }
  return *value;
}

template <typename T>
T parse_unsigned(const CsvRow& row, const std::string& text, std::string_view name) {
  T value{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    throw std::runtime_error(where(row) + "invalid " + std::string(name) + " '" + text + "'");
  }
  return value;
}

}  // namespace

std::string_view describe(RecordError error) noexcept {
  switch (error) {
    case RecordError::kNone:
      return "Ok";
    case RecordError::kMissingAmount:
      return "Amount missing in transaction CSV";
    case RecordError::kUnknownType:
      return "Unknown transaction type";
  }
  return "Unknown record error";
}

std::optional<money::Money> parse_amount(std::string_view text) {
  std::size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }

  const std::uint64_t limit = negative ? kNegativeLimit : kPositiveLimit;
  std::uint64_t magnitude = 0;
  auto push_digit = [&](std::uint64_t digit) {
    if (magnitude > (limit - digit) / 10) {
      return false;
    }
    magnitude = magnitude * 10 + digit;
    return true;
  };

  std::size_t digits = 0;
  for (; pos < text.size() && is_digit(text[pos]); ++pos, ++digits) {
    if (!push_digit(static_cast<std::uint64_t>(text[pos] - '0'))) {
      return std::nullopt;
    }
  }

  int fraction_digits = 0;
  bool round_up = false;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    for (; pos < text.size() && is_digit(text[pos]); ++pos, ++digits) {
      const auto digit = static_cast<std::uint64_t>(text[pos] - '0');
      if (fraction_digits < money::Money::kFractionDigits) {
        if (!push_digit(digit)) {
          return std::nullopt;
        }
        ++fraction_digits;
      } else if (fraction_digits == money::Money::kFractionDigits) {
        round_up = digit >= 5;
        ++fraction_digits;
      }
    }
  }

  if (digits == 0 || pos != text.size()) {
    return std::nullopt;
  }

  for (; fraction_digits < money::Money::kFractionDigits; ++fraction_digits) {
    if (!push_digit(0)) {
      return std::nullopt;
    }
  }
  if (round_up) {
    if (magnitude == limit) {
      return std::nullopt;
    }
    ++magnitude;
  }

  if (!negative) {
    return money::Money::from_scaled(static_cast<std::int64_t>(magnitude));
  }
  if (magnitude == kNegativeLimit) {
    return money::Money::from_scaled(std::numeric_limits<std::int64_t>::min());
  }
  return money::Money::from_scaled(-static_cast<std::int64_t>(magnitude));
}

RecordDecoder::RecordDecoder(const CsvRow& header) {
  for (std::size_t column = 0; column < header.fields.size(); ++column) {
    const auto& name = header.fields[column];
    if (name == "type") {
      type_column_ = column;
    } else if (name == "client") {
      client_column_ = column;
    } else if (name == "tx") {
      tx_column_ = column;
    } else if (name == "amount") {
      amount_column_ = column;
    }
  }

  for (const auto& [column, name] : {std::pair{type_column_, "type"},
                                     std::pair{client_column_, "client"},
                                     std::pair{tx_column_, "tx"}}) {
    if (column == kNoColumn) {
      throw std::runtime_error(where(header) + "header is missing column '" + name + "'");
    }
  }
}

TxRecord RecordDecoder::decode(const CsvRow& row) const {
  TxRecord record;
  record.kind = required_cell(row, type_column_, "type");
  record.client = parse_unsigned<common::ClientId>(row, required_cell(row, client_column_, "client"), "client");
  record.tx = parse_unsigned<common::TxId>(row, required_cell(row, tx_column_, "tx"), "tx");

  if (const auto* amount = cell(row, amount_column_); amount && !amount->empty()) {
    record.amount = parse_amount(*amount);
    if (!record.amount) {
      throw std::runtime_error(where(row) + "invalid amount '" + *amount + "'");
    }
  }
  return record;
}

RecordError to_tx(const TxRecord& record, ledger::Tx& out_tx) {
  if (record.kind == "deposit") {
    if (!record.amount) {
      return RecordError::kMissingAmount;
    }
    out_tx = ledger::Deposit{.client = record.client, .id = record.tx, .amount = *record.amount};
  } else if (record.kind == "withdrawal") {
    if (!record.amount) {
      return RecordError::kMissingAmount;
    }
    out_tx = ledger::Withdrawal{.client = record.client, .id = record.tx, .amount = *record.amount};
  } else if (record.kind == "dispute") {
    out_tx = ledger::Dispute{.client = record.client, .id = record.tx};
  } else if (record.kind == "resolve") {
    out_tx = ledger::Resolve{.client = record.client, .id = record.tx};
  } else if (record.kind == "chargeback") {
    out_tx = ledger::Chargeback{.client = record.client, .id = record.tx};
  } else {
    return RecordError::kUnknownType;
  }
  return RecordError::kNone;
}

}  // namespace ingest
}  // namespace payledger
