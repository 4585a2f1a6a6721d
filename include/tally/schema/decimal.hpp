#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace tally::schema {

/// Signed fixed-point decimal with four fractional digits.
///
/// Values are stored as integral units of 0.0001 in a checked 128-bit
/// integer; any arithmetic overflow throws `std::overflow_error`.
class decimal final {
 public:
  using units_t = boost::multiprecision::checked_int128_t;

  static constexpr uint32_t kScale = 4;
  static constexpr int64_t kUnitsPerWhole = 10'000;

  decimal() = default;

  static decimal from_units(const units_t& units);
  static decimal from_whole(int64_t whole);

  /// Parse `[-]digits[.digits]`. Fractional digits past the fourth are
  /// accepted only when they are zeros.
  static std::optional<decimal> try_parse(std::string_view text);

  const units_t& units() const { return units_; }
  bool is_negative() const { return units_ < 0; }
  bool is_zero() const { return units_ == 0; }

  /// Render with exactly four fractional digits, e.g. `-1.5000`.
  std::string to_string() const;

  decimal& operator+=(const decimal& other);
  decimal& operator-=(const decimal& other);

  friend decimal operator+(decimal lhs, const decimal& rhs) {
    lhs += rhs;
    return lhs;
  }
  friend decimal operator-(decimal lhs, const decimal& rhs) {
    lhs -= rhs;
    return lhs;
  }

  friend bool operator==(const decimal& lhs, const decimal& rhs) {
    return lhs.units_ == rhs.units_;
  }
  friend bool operator!=(const decimal& lhs, const decimal& rhs) {
    return !(lhs == rhs);
  }
  friend bool operator<(const decimal& lhs, const decimal& rhs) {
    return lhs.units_ < rhs.units_;
  }
  friend bool operator>(const decimal& lhs, const decimal& rhs) {
    return rhs < lhs;
  }
  friend bool operator<=(const decimal& lhs, const decimal& rhs) {
    return !(rhs < lhs);
  }
  friend bool operator>=(const decimal& lhs, const decimal& rhs) {
    return !(lhs < rhs);
  }

 private:
  explicit decimal(units_t units) : units_{std::move(units)} {}

  units_t units_{0};
};

std::ostream& operator<<(std::ostream& out, const decimal& value);

}  // namespace tally::schema
