#include <tally/schema/transaction_parser.hpp>

#include <charconv>
#include <limits>
#include <string_view>
#include <system_error>

namespace tally::schema {

namespace {

template <typename T>
std::optional<T> parse_id(const std::string_view text) {
  auto value = uint64_t{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last ||
      value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(value);
}

std::optional<amount_t> parse_amount(const raw_record_t& record,
                                     std::string& error) {
  if (record.fields.size() < 4 || record.fields[3].empty()) {
    error = "amount is required";
    return std::nullopt;
  }
  auto value = amount_t::try_parse(record.fields[3]);
  if (!value) {
    error = "amount '" + record.fields[3] + "' is not a 4-place decimal";
    return std::nullopt;
  }
  if (value->is_negative()) {
    error = "amount '" + record.fields[3] + "' is negative";
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<transaction_t> parse_transaction(const raw_record_t& record,
                                               std::string& error) {
  if (record.fields.size() < 3 || record.fields.size() > 4) {
    error = "expected 3 or 4 fields, found " +
            std::to_string(record.fields.size());
    return std::nullopt;
  }

  auto maybe_kind = try_parse_transaction_kind(record.fields[0]);
  if (!maybe_kind) {
    error = "unknown transaction type '" + record.fields[0] + "'";
    return std::nullopt;
  }
  auto client = parse_id<client_id_t>(record.fields[1]);
  if (!client) {
    error = "invalid client id '" + record.fields[1] + "'";
    return std::nullopt;
  }
  auto tx_id = parse_id<transaction_id_t>(record.fields[2]);
  if (!tx_id) {
    error = "invalid transaction id '" + record.fields[2] + "'";
    return std::nullopt;
  }

  auto tx = transaction_t{.version = 1, .sequence = record.line};
  switch (*maybe_kind) {
    case transaction_kind_t::deposit: {
      auto value = parse_amount(record, error);
      if (!value) {
        return std::nullopt;
      }
      tx.payload =
          deposit_t{.client_id = *client, .tx_id = *tx_id, .amount = *value};
      return tx;
    }
    case transaction_kind_t::withdrawal: {
      auto value = parse_amount(record, error);
      if (!value) {
        return std::nullopt;
      }
      tx.payload = withdrawal_t{
          .client_id = *client, .tx_id = *tx_id, .amount = *value};
      return tx;
    }
    case transaction_kind_t::dispute:
      tx.payload = dispute_t{.client_id = *client, .reference_id = *tx_id};
      break;
    case transaction_kind_t::resolve:
      tx.payload = resolve_t{.client_id = *client, .reference_id = *tx_id};
      break;
    case transaction_kind_t::chargeback:
      tx.payload = chargeback_t{.client_id = *client, .reference_id = *tx_id};
      break;
  }

  if (record.fields.size() == 4 && !record.fields[3].empty()) {
    error = std::string{to_string(*maybe_kind)} + " must not carry an amount";
    return std::nullopt;
  }
  return tx;
}

}  // namespace tally::schema
