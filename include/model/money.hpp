#ifndef MONEY_HPP_
#define MONEY_HPP_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace payments {
namespace model {

/**
 * Fixed-point monetary amount with four fractional digits.
 * Stored as a signed count of 1/10000 units, so every operation is exact.
 */
class Money {
 public:
  static constexpr int kScale = 4;
  static constexpr std::int64_t kUnitsPerWhole = 10000;

  constexpr Money() = default;

  static constexpr Money zero() { return Money(); }
  static constexpr Money fromUnits(std::int64_t units) { return Money(units); }

  /**
   * Parses decimal text such as "12", "-0.5" or "3.14159".
   * Digits past the fourth fractional place are truncated toward zero.
   * Returns nullopt for empty or malformed text and for values too large to hold.
   */
  static std::optional<Money> parse(std::string_view text);

  constexpr std::int64_t units() const { return units_; }
  constexpr bool isNegative() const { return units_ < 0; }

  // Normalized decimal text: "100", "1.5", "-0.0001".
  std::string toString() const;

  // nullopt when the result does not fit in the underlying int64.
  std::optional<Money> checkedAdd(Money other) const;
  std::optional<Money> checkedSub(Money other) const;

  constexpr Money operator+(Money other) const { return Money(units_ + other.units_); }
  constexpr Money operator-(Money other) const { return Money(units_ - other.units_); }
  constexpr Money operator-() const { return Money(-units_); }

  Money& operator+=(Money other) {
    units_ += other.units_;
    return *this;
  }

  Money& operator-=(Money other) {
    units_ -= other.units_;
    return *this;
  }

  constexpr bool operator==(Money other) const { return units_ == other.units_; }
  constexpr bool operator!=(Money other) const { return units_ != other.units_; }
  constexpr bool operator<(Money other) const { return units_ < other.units_; }
  constexpr bool operator<=(Money other) const { return units_ <= other.units_; }
  constexpr bool operator>(Money other) const { return units_ > other.units_; }
  constexpr bool operator>=(Money other) const { return units_ >= other.units_; }

 private:
  explicit constexpr Money(std::int64_t units) : units_(units) {}

  std::int64_t units_ = 0;
};

std::ostream& operator<<(std::ostream& os, Money money);

}  // namespace model
}  // namespace payments

#endif  // MONEY_HPP_
