#pragma once
#include <ostream>
#include <tally/schema/account_state.hpp>
#include <vector>

namespace tally::io {

/// Write `client,available,held,total,locked` rows, decimals at 4 places.
///
/// Throws `std::runtime_error` if the stream enters a failed state.
void write_accounts(std::ostream& out,
                    const std::vector<tally::schema::account_state_t>& accounts);

}  // namespace tally::io
