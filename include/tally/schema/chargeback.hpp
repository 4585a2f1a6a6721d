#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct chargeback;

template <>
struct chargeback<1> final {
  uint16_t version{1};
  client_id_t client_id{};
  transaction_id_t reference_id{};
};

using chargeback_t = chargeback<1>;

}  // namespace tally::schema
