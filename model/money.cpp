#include "model/money.hpp"

#include <cctype>
#include <limits>

namespace payments {
namespace model {

namespace {

// Keeps whole * kUnitsPerWhole well inside int64.
constexpr std::size_t kMaxWholeDigits = 14;

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

std::optional<Money> Money::parse(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '+' || text.front() == '-') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  std::string_view whole = text;
  std::string_view fraction;
  if (auto dot = text.find('.'); dot != std::string_view::npos) {
    whole = text.substr(0, dot);
    fraction = text.substr(dot + 1);
  }
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }

  std::int64_t whole_value = 0;
  std::size_t significant = 0;
  for (char c : whole) {
    if (!isDigit(c)) {
      return std::nullopt;
    }
    if (significant == 0 && c == '0') {
      continue;
    }
    if (++significant > kMaxWholeDigits) {
      return std::nullopt;
    }
    whole_value = whole_value * 10 + (c - '0');
  }

  std::int64_t fraction_value = 0;
  for (std::size_t i = 0; i < fraction.size(); ++i) {
    if (!isDigit(fraction[i])) {
      return std::nullopt;
    }
    if (i < static_cast<std::size_t>(kScale)) {
      fraction_value = fraction_value * 10 + (fraction[i] - '0');
    }
  }
  for (std::size_t i = fraction.size(); i < static_cast<std::size_t>(kScale); ++i) {
    fraction_value *= 10;
  }

  std::int64_t units = whole_value * kUnitsPerWhole + fraction_value;
  return Money(negative ? -units : units);
}

std::string Money::toString() const {
  const std::uint64_t magnitude = units_ < 0
      ? 0 - static_cast<std::uint64_t>(units_)
      : static_cast<std::uint64_t>(units_);
  const std::uint64_t whole = magnitude / kUnitsPerWhole;
  std::uint64_t fraction = magnitude % kUnitsPerWhole;

  std::string result;
  if (units_ < 0) {
    result += '-';
  }
  result += std::to_string(whole);
  if (fraction == 0) {
    return result;
  }

  std::string digits(kScale, '0');
  for (int i = kScale - 1; i >= 0; --i) {
    digits[i] = static_cast<char>('0' + fraction % 10);
    fraction /= 10;
  }
  digits.erase(digits.find_last_not_of('0') + 1);
  result += '.';
  result += digits;
  return result;
}

std::optional<Money> Money::checkedAdd(Money other) const {
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
  if (other.units_ > 0 && units_ > kMax - other.units_) return std::nullopt;
  if (other.units_ < 0 && units_ < kMin - other.units_) return std::nullopt;
  return Money(units_ + other.units_);
}

std::optional<Money> Money::checkedSub(Money other) const {
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
  if (other.units_ < 0 && units_ > kMax + other.units_) return std::nullopt;
  if (other.units_ > 0 && units_ < kMin + other.units_) return std::nullopt;
  return Money(units_ - other.units_);
}

std::ostream& operator<<(std::ostream& os, Money money) {
  return os << money.toString();
}

}  // namespace model
}  // namespace payments
