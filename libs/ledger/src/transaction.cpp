#include "payledger/ledger/transaction.hpp"

namespace payledger {
namespace ledger {

namespace {

struct KindName {
  std::string_view operator()(const Deposit&) const noexcept { return "deposit"; }
  std::string_view operator()(const Withdrawal&) const noexcept { return "withdrawal"; }
  std::string_view operator()(const Dispute&) const noexcept { return "dispute"; }
  std::string_view operator()(const Resolve&) const noexcept { return "resolve"; }
  std::string_view operator()(const Chargeback&) const noexcept { return "chargeback"; }
};

}  // namespace

common::ClientId client_of(const Tx& tx) noexcept {
  return std::visit([](const auto& variant) { return variant.client; }, tx);
}

common::TxId id_of(const Tx& tx) noexcept {
  return std::visit([](const auto& variant) { return variant.id; }, tx);
}

std::string_view kind_name(const Tx& tx) noexcept {
  return std::visit(KindName{}, tx);
}

}  // namespace ledger
}  // namespace payledger
