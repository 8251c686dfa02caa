#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "payledger/report/account_writer.hpp"

namespace payledger {
namespace report {

// BLAKE2b-256 digest size
constexpr std::size_t kStateDigestSize = 32;

using StateDigest = std::array<std::uint8_t, kStateDigestSize>;

// Hashes the canonical CSV rendering of the records in ascending client
// order, so equal final states hash equally regardless of input order.
[[nodiscard]] StateDigest compute_state_digest(std::span<const AccountRecord> records);

// Lowercase hex, two characters per byte
[[nodiscard]] std::string to_hex(const StateDigest& digest);

}  // namespace report
}  // namespace payledger
