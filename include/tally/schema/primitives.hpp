#pragma once
#include <cstdint>
#include <string>
#include <tally/schema/decimal.hpp>
#include <vector>

namespace tally::schema {

using client_id_t = uint16_t;
using transaction_id_t = uint32_t;
using amount_t = decimal;

/// One input row split into trimmed fields, before validation.
struct raw_record_t final {
  uint64_t line{};
  std::vector<std::string> fields;
};

}  // namespace tally::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
