#include "payledger/money/money.hpp"

#include <limits>

namespace payledger {
namespace money {

namespace {
constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
}  // namespace

std::optional<Money> Money::checked_add(Money rhs) const noexcept {
  if ((rhs.scaled_ > 0 && scaled_ > kMax - rhs.scaled_) ||
      (rhs.scaled_ < 0 && scaled_ < kMin - rhs.scaled_)) {
    return std::nullopt;
  }
  return Money{scaled_ + rhs.scaled_};
}

std::optional<Money> Money::checked_sub(Money rhs) const noexcept {
  if ((rhs.scaled_ < 0 && scaled_ > kMax + rhs.scaled_) ||
      (rhs.scaled_ > 0 && scaled_ < kMin + rhs.scaled_)) {
    return std::nullopt;
  }
  return Money{scaled_ - rhs.scaled_};
}

std::string Money::to_string() const {
  // Unsigned magnitude so that the minimum value negates cleanly.
  const auto magnitude = scaled_ < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(scaled_)
                                     : static_cast<std::uint64_t>(scaled_);
  const auto scale = static_cast<std::uint64_t>(kScale);

  std::string fraction = std::to_string(magnitude % scale);
  fraction.insert(0, static_cast<std::size_t>(kFractionDigits) - fraction.size(), '0');

  std::string out;
  if (scaled_ < 0) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / scale);
  out.push_back('.');
  out += fraction;
  return out;
}

std::ostream& operator<<(std::ostream& out, const Money& value) {
  return out << value.to_string();
}

}  // namespace money
}  // namespace payledger
