#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction kind.
// Closed set of record types accepted in the `type` column.
namespace tally::schema {

enum class transaction_kind_t : uint8_t {
  deposit = 0,
  withdrawal = 1,
  dispute = 2,
  resolve = 3,
  chargeback = 4
};

inline constexpr auto kTransactionKindMappings = std::array{
    std::pair<std::string_view, transaction_kind_t>{
        "deposit", transaction_kind_t::deposit},
    std::pair<std::string_view, transaction_kind_t>{
        "withdrawal", transaction_kind_t::withdrawal},
    std::pair<std::string_view, transaction_kind_t>{
        "dispute", transaction_kind_t::dispute},
    std::pair<std::string_view, transaction_kind_t>{
        "resolve", transaction_kind_t::resolve},
    std::pair<std::string_view, transaction_kind_t>{
        "chargeback", transaction_kind_t::chargeback}};

inline std::optional<transaction_kind_t> try_parse_transaction_kind(
    const std::string_view value) {
  return from_string(value, kTransactionKindMappings);
}

inline constexpr std::string_view to_string(const transaction_kind_t value) {
  return to_string(value, kTransactionKindMappings).value_or("unknown");
}

}  // namespace tally::schema
