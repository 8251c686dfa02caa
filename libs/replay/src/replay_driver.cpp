#include "payledger/replay/replay_driver.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include "payledger/ingest/csv_reader.hpp"
#include "payledger/ingest/tx_record.hpp"
#include "payledger/ledger/transaction.hpp"

namespace payledger {
namespace replay {

Driver::Driver() = default;

void Driver::configure(config::InputConfig input) {
  if (input.delimiter.size() != 1) {
    throw std::invalid_argument("replay delimiter must be a single character");
  }
  input_ = std::move(input);
}

void Driver::set_warning_handler(WarningHandler handler) {
  warning_handler_ = std::move(handler);
}

ReplayStats Driver::execute(const std::filesystem::path& input_path, ledger::LedgerState& ledger) {
  std::ifstream input(input_path, std::ios::binary);
  if (!input) {
    throw std::runtime_error("failed to open transactions file: " + input_path.string());
  }
  return execute(input, ledger);
}

ReplayStats Driver::execute(std::istream& input, ledger::LedgerState& ledger) {
  ingest::CsvReader reader(input, {.delimiter = input_.delimiter.front(), .trim = input_.trim});

  ingest::CsvRow row;
  if (!reader.next(row)) {
    throw std::runtime_error("transactions input is empty, expected a header row");
  }
  const ingest::RecordDecoder decoder(row);

  ReplayStats stats;
  while (reader.next(row)) {
    const auto record_number = ++stats.records;
    const auto record = decoder.decode(row);

    ledger::Tx tx;
    if (const auto error = ingest::to_tx(record, tx); error != ingest::RecordError::kNone) {
      ++stats.conversion_failures;
      warn(record_number, ingest::describe(error));
      continue;
    }

    const auto status = ledger.process(tx);
    ++stats.by_status[static_cast<std::size_t>(status)];
    if (status == ledger::TxStatus::kOk) {
      ++stats.applied;
    } else {
      ++stats.rejected;
      warn(record_number, ledger::describe(status));
    }
  }

  if (input.bad()) {
    throw std::runtime_error("failed reading transactions input");
  }
  return stats;
}

void Driver::warn(std::uint64_t record, std::string_view reason) {
  if (!warning_handler_) {
    return;
  }
  warning_handler_(Warning{
      .record = record,
      .message = "transaction " + std::to_string(record) + " failed: " + std::string(reason),
  });
}

}  // namespace replay
}  // namespace payledger
