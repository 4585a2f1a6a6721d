#pragma once

#include <tally/execution/engine.hpp>
#include <tally/io/csv_reader.hpp>
#include <tally/schema/replay_result.hpp>
#include <cstdint>

namespace tally::execution {

/// What to do with a row that does not parse into a transaction.
enum class malformed_policy : uint8_t {
  abort = 0,
  skip = 1,
};

/// Stream every row of `reader` through `ledger` in input order.
///
/// Rejected transactions never stop the replay. A malformed row stops it
/// under `malformed_policy::abort`, as does a reader failure; `ok` is then
/// false and `error` says why.
tally::schema::replay_result_t replay(io::csv_reader& reader,
                                      engine& ledger,
                                      malformed_policy policy);

}  // namespace tally::execution
