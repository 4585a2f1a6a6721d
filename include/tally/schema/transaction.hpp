#pragma once
#include <tally/schema/chargeback.hpp>
#include <tally/schema/deposit.hpp>
#include <tally/schema/dispute.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/resolve.hpp>
#include <tally/schema/transaction_kind.hpp>
#include <tally/schema/withdrawal.hpp>
#include <optional>
#include <variant>

namespace tally::schema {

using transaction_payload_t = std::variant<deposit_t,
                                           withdrawal_t,
                                           dispute_t,
                                           resolve_t,
                                           chargeback_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

transaction_kind_t kind(const transaction_t& tx);
client_id_t client_id(const transaction_t& tx);

/// Own id for deposit/withdrawal, target id for dispute-family records.
transaction_id_t reference_id(const transaction_t& tx);

/// Present only for deposit/withdrawal.
std::optional<amount_t> amount(const transaction_t& tx);

}  // namespace tally::schema
