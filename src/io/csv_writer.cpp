#include <tally/io/csv_writer.hpp>

#include <stdexcept>

namespace tally::io {

void write_accounts(
    std::ostream& out,
    const std::vector<tally::schema::account_state_t>& accounts) {
  out << "client,available,held,total,locked\n";
  for (const auto& account : accounts) {
    out << account.client_id << ',' << account.available.to_string() << ','
        << account.held.to_string() << ',' << account.total().to_string()
        << ',' << (account.locked ? "true" : "false") << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed writing account table");
  }
}

}  // namespace tally::io
