#pragma once
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>
#include <optional>
#include <string>

namespace tally::schema {

/// Validate a raw `type, client, tx[, amount]` tuple.
///
/// Returns std::nullopt for a malformed record; `error` then holds the
/// reason. Pure transform, `error` is left untouched on success.
std::optional<transaction_t> parse_transaction(const raw_record_t& record,
                                               std::string& error);

}  // namespace tally::schema
