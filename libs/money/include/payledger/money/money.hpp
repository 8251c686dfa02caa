#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace payledger {
namespace money {

// Fixed-point amount: a signed integer count of 1/10'000 units.
class Money {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kFractionDigits = 4;

  constexpr Money() noexcept = default;

  [[nodiscard]] static constexpr Money from_scaled(std::int64_t scaled) noexcept {
    return Money{scaled};
  }
  [[nodiscard]] static constexpr Money zero() noexcept { return Money{}; }

  [[nodiscard]] constexpr std::int64_t scaled() const noexcept { return scaled_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return scaled_ < 0; }

  // Empty when the exact result does not fit in the representable range.
  [[nodiscard]] std::optional<Money> checked_add(Money rhs) const noexcept;
  [[nodiscard]] std::optional<Money> checked_sub(Money rhs) const noexcept;

  // Canonical form: [-]<integer>.<4 digits>, no sign on zero.
  [[nodiscard]] std::string to_string() const;

  friend constexpr auto operator<=>(const Money&, const Money&) noexcept = default;

 private:
  explicit constexpr Money(std::int64_t scaled) noexcept : scaled_(scaled) {}

  std::int64_t scaled_{0};
};

std::ostream& operator<<(std::ostream& out, const Money& value);

}  // namespace money
}  // namespace payledger
