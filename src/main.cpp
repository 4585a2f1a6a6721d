#include <spdlog/spdlog.h>
#include <tally/common/critical.hpp>
#include <tally/common/logging.hpp>
#include <tally/config/options.hpp>
#include <tally/execution/engine.hpp>
#include <tally/execution/replay.hpp>
#include <tally/io/csv_reader.hpp>
#include <tally/io/csv_writer.hpp>

#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
  auto parsed = tally::config::parse_options(argc, argv);
  if (parsed.show_help) {
    std::cout << parsed.usage << std::endl;
    return 0;
  }
  if (!parsed.ok) {
    std::cerr << "tally: " << parsed.error << "\n\n" << parsed.usage << std::endl;
    return 1;
  }
  const auto& options = parsed.options;

  try {
    tally::common::configure_logging(options.verbose, options.log_file);
  } catch (const std::exception& ex) {
    std::cerr << "tally: cannot set up logging: " << ex.what() << std::endl;
    spdlog::shutdown();
    return 1;
  }

  auto reader = std::unique_ptr<tally::io::csv_reader>{};
  try {
    reader = std::make_unique<tally::io::csv_reader>(options.input);
  } catch (const std::exception& ex) {
    tally::common::critical(ex.what());
  }

  auto ledger = tally::execution::engine{};
  auto result = tally::execution::replay(*reader, ledger, options.on_malformed);
  if (!result.ok) {
    tally::common::critical(result.error);
  }

  try {
    tally::io::write_accounts(std::cout, ledger.snapshot());
  } catch (const std::exception& ex) {
    tally::common::critical(ex.what());
  }

  spdlog::info("Settled {} account(s): rows={}, applied={}, rejected={}, "
               "malformed={}",
               ledger.account_count(), result.row_count, result.applied_count,
               result.rejected_count, result.malformed_count);
  spdlog::shutdown();
  return 0;
}
