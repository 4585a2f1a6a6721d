#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
};

using transaction_result_t = transaction_result<1>;

}  // namespace tally::schema
