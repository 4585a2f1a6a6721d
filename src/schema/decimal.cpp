#include <tally/schema/decimal.hpp>

#include <stdexcept>

namespace tally::schema {

namespace {

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

decimal decimal::from_units(const units_t& units) {
  return decimal{units};
}

decimal decimal::from_whole(const int64_t whole) {
  return decimal{units_t{whole} * kUnitsPerWhole};
}

std::optional<decimal> decimal::try_parse(std::string_view text) {
  auto negative = false;
  if (!text.empty() && text.front() == '-') {
    negative = true;
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  auto whole = text;
  auto fraction = std::string_view{};
  if (auto dot = text.find('.'); dot != std::string_view::npos) {
    whole = text.substr(0, dot);
    fraction = text.substr(dot + 1);
  }
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }

  try {
    auto units = units_t{0};
    for (const auto c : whole) {
      if (!is_digit(c)) {
        return std::nullopt;
      }
      units = units * 10 + (c - '0');
    }

    auto digits = uint32_t{0};
    for (const auto c : fraction) {
      if (!is_digit(c)) {
        return std::nullopt;
      }
      if (digits < kScale) {
        units = units * 10 + (c - '0');
        ++digits;
      } else if (c != '0') {
        return std::nullopt;
      }
    }
    for (; digits < kScale; ++digits) {
      units *= 10;
    }

    if (negative) {
      units = -units;
    }
    return decimal{units};
  } catch (const std::overflow_error&) {
    return std::nullopt;
  }
}

std::string decimal::to_string() const {
  auto magnitude = units_ < 0 ? units_t{-units_} : units_;
  auto whole = units_t{magnitude / kUnitsPerWhole};
  auto fraction = (magnitude % kUnitsPerWhole).convert_to<int64_t>();

  auto out = std::string{};
  if (units_ < 0) {
    out.push_back('-');
  }
  out += whole.str();
  out.push_back('.');
  auto digits = std::to_string(fraction);
  out.append(kScale - digits.size(), '0');
  out += digits;
  return out;
}

decimal& decimal::operator+=(const decimal& other) {
  units_ += other.units_;
  return *this;
}

decimal& decimal::operator-=(const decimal& other) {
  units_ -= other.units_;
  return *this;
}

std::ostream& operator<<(std::ostream& out, const decimal& value) {
  return out << value.to_string();
}

}  // namespace tally::schema
