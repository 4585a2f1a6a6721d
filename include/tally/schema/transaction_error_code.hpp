#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace tally::schema {

enum class transaction_error_code : uint32_t {
  malformed_record = 1,
  duplicate_transaction = 2,
  account_locked = 3,
  insufficient_funds = 4,
  reference_missing = 5,
  client_mismatch = 6,
  already_disputed = 7,
  not_disputed = 8,
  already_charged_back = 9,
  balance_overflow = 10,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "malformed_record", transaction_error_code::malformed_record},
    std::pair<std::string_view, transaction_error_code>{
        "duplicate_transaction", transaction_error_code::duplicate_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "account_locked", transaction_error_code::account_locked},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_funds", transaction_error_code::insufficient_funds},
    std::pair<std::string_view, transaction_error_code>{
        "reference_missing", transaction_error_code::reference_missing},
    std::pair<std::string_view, transaction_error_code>{
        "client_mismatch", transaction_error_code::client_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "already_disputed", transaction_error_code::already_disputed},
    std::pair<std::string_view, transaction_error_code>{
        "not_disputed", transaction_error_code::not_disputed},
    std::pair<std::string_view, transaction_error_code>{
        "already_charged_back", transaction_error_code::already_charged_back},
    std::pair<std::string_view, transaction_error_code>{
        "balance_overflow", transaction_error_code::balance_overflow}};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace tally::schema
