#pragma once
#include <tally/schema/primitives.hpp>

// Schema type: dispute.
// Dispute-family records carry no amount; `reference_id` names the applied
// deposit or withdrawal they act on.
namespace tally::schema {

template <uint16_t Version>
struct dispute;

template <>
struct dispute<1> final {
  uint16_t version{1};
  client_id_t client_id{};
  transaction_id_t reference_id{};
};

using dispute_t = dispute<1>;

}  // namespace tally::schema
