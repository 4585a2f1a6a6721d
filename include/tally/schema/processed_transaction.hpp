#pragma once
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_kind.hpp>

// Schema type: processed transaction.
// Bookkeeping kept for every applied deposit/withdrawal so dispute-family
// records can find the original amount and owner.
namespace tally::schema {

template <uint16_t Version>
struct processed_transaction;

template <>
struct processed_transaction<1> final {
  uint16_t version{1};
  transaction_id_t tx_id{};
  client_id_t client_id{};
  amount_t amount;
  transaction_kind_t kind{transaction_kind_t::deposit};
  bool disputed{};
  bool charged_back{};
};

using processed_transaction_t = processed_transaction<1>;

}  // namespace tally::schema
