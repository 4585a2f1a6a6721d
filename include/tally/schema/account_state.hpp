#pragma once
#include <tally/schema/primitives.hpp>

// Schema type: account state.
// Per-client balances; `total` is derived and never stored.
namespace tally::schema {

template <uint16_t Version>
struct account_state;

template <>
struct account_state<1> final {
  uint16_t version{1};
  client_id_t client_id{};
  amount_t available;
  amount_t held;
  bool locked{};

  amount_t total() const { return available + held; }
};

using account_state_t = account_state<1>;

}  // namespace tally::schema
