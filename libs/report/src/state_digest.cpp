#include "payledger/report/state_digest.hpp"

#include <sodium.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace payledger {
namespace report {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace

StateDigest compute_state_digest(std::span<const AccountRecord> records) {
  ensure_sodium_init();

  std::vector<AccountRecord> ordered(records.begin(), records.end());
  std::sort(ordered.begin(), ordered.end(), [](const AccountRecord& a, const AccountRecord& b) {
    return a.client < b.client;
  });

  std::ostringstream canonical;
  AccountWriter writer(canonical);
  writer.write_all(ordered);
  const std::string bytes = canonical.str();

  StateDigest digest{};
  if (crypto_generichash(digest.data(), digest.size(),
                         reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                         nullptr, 0) != 0) {
    throw std::runtime_error("state digest computation failed");
  }
  return digest;
}

std::string to_hex(const StateDigest& digest) {
  std::string hex(digest.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
  hex.pop_back();
  return hex;
}

}  // namespace report
}  // namespace payledger
