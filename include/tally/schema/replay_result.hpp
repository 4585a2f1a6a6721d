#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: replay result.
// Summary of one pass over an input stream: row counts per outcome plus the
// reason the pass stopped early, if it did.
namespace tally::schema {

template <uint16_t Version>
struct replay_result;

template <>
struct replay_result<1> final {
  uint16_t version{1};
  bool ok{};
  uint64_t row_count{};
  uint64_t applied_count{};
  uint64_t rejected_count{};
  uint64_t malformed_count{};
  std::string error;
};

using replay_result_t = replay_result<1>;

}  // namespace tally::schema
