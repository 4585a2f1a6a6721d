#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct withdrawal;

template <>
struct withdrawal<1> final {
  uint16_t version{1};
  client_id_t client_id{};
  transaction_id_t tx_id{};
  amount_t amount;
};

using withdrawal_t = withdrawal<1>;

}  // namespace tally::schema
