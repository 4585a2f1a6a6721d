#include <spdlog/spdlog.h>
#include <stdexcept>
#include <tally/execution/replay.hpp>
#include <tally/schema/transaction_parser.hpp>

namespace tally::execution {

tally::schema::replay_result_t replay(io::csv_reader& reader,
                                      engine& ledger,
                                      const malformed_policy policy) {
  auto result = tally::schema::replay_result_t{};
  auto record = tally::schema::raw_record_t{};

  try {
    while (reader.next(record)) {
      ++result.row_count;

      auto error = std::string{};
      auto maybe_tx = tally::schema::parse_transaction(record, error);
      if (!maybe_tx) {
        ++result.malformed_count;
        if (policy == malformed_policy::abort) {
          result.error =
              "malformed record at line " + std::to_string(record.line) +
              ": " + error;
          return result;
        }
        spdlog::warn("Skipping malformed record at line {}: {}", record.line,
                     error);
        continue;
      }

      auto tx_result = ledger.apply(*maybe_tx);
      if (tx_result.code == 0) {
        ++result.applied_count;
      } else {
        ++result.rejected_count;
      }
    }
  } catch (const std::runtime_error& ex) {
    result.error = ex.what();
    return result;
  }

  result.ok = true;
  spdlog::debug("Replay complete: rows={}, applied={}, rejected={}, "
                "malformed={}",
                result.row_count, result.applied_count, result.rejected_count,
                result.malformed_count);
  return result;
}

}  // namespace tally::execution
