#include <tally/schema/transaction.hpp>

namespace tally::schema {

transaction_kind_t kind(const transaction_t& tx) {
  return std::visit(
      overloaded{
          [](const deposit_t&) { return transaction_kind_t::deposit; },
          [](const withdrawal_t&) { return transaction_kind_t::withdrawal; },
          [](const dispute_t&) { return transaction_kind_t::dispute; },
          [](const resolve_t&) { return transaction_kind_t::resolve; },
          [](const chargeback_t&) { return transaction_kind_t::chargeback; }},
      tx.payload);
}

client_id_t client_id(const transaction_t& tx) {
  return std::visit([](const auto& payload) { return payload.client_id; },
                    tx.payload);
}

transaction_id_t reference_id(const transaction_t& tx) {
  return std::visit(
      overloaded{[](const deposit_t& value) { return value.tx_id; },
                 [](const withdrawal_t& value) { return value.tx_id; },
                 [](const dispute_t& value) { return value.reference_id; },
                 [](const resolve_t& value) { return value.reference_id; },
                 [](const chargeback_t& value) { return value.reference_id; }},
      tx.payload);
}

std::optional<amount_t> amount(const transaction_t& tx) {
  return std::visit(
      overloaded{
          [](const deposit_t& value) -> std::optional<amount_t> {
            return value.amount;
          },
          [](const withdrawal_t& value) -> std::optional<amount_t> {
            return value.amount;
          },
          [](const auto&) -> std::optional<amount_t> { return std::nullopt; }},
      tx.payload);
}

}  // namespace tally::schema
