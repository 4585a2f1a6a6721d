#include <boost/program_options.hpp>
#include <tally/config/options.hpp>

#include <sstream>

namespace tally::config {

namespace po = boost::program_options;

parse_result_t parse_options(const int argc, const char* const* argv) {
  auto result = parse_result_t{};
  auto input = std::string{};

  auto description = po::options_description{"tally options"};
  description.add_options()("help,h", "show this help message")(
      "verbose,v", "log every rejected transaction")(
      "skip-malformed", "skip rows that fail to parse instead of aborting")(
      "log-file", po::value<std::string>(), "also write diagnostics to file")(
      "input", po::value<std::string>(&input), "transactions CSV file");

  auto positional = po::positional_options_description{};
  positional.add("input", 1);

  auto usage = std::ostringstream{};
  usage << "Usage: tally [options] <transactions.csv>\n\n" << description;
  result.usage = usage.str();

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    result.error = ex.what();
    return result;
  }

  if (vm.contains("help")) {
    result.ok = true;
    result.show_help = true;
    return result;
  }
  if (input.empty()) {
    result.error = "missing transactions CSV path";
    return result;
  }

  result.options.input = input;
  result.options.verbose = vm.contains("verbose");
  if (vm.contains("skip-malformed")) {
    result.options.on_malformed = tally::execution::malformed_policy::skip;
  }
  if (vm.contains("log-file")) {
    result.options.log_file = vm["log-file"].as<std::string>();
  }
  result.ok = true;
  return result;
}

}  // namespace tally::config
