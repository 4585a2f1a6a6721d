#pragma once

#include <tally/execution/replay.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace tally::config {

/// Settings for one `tally` run, taken from the command line.
struct options_t final {
  std::filesystem::path input;
  bool verbose{false};
  tally::execution::malformed_policy on_malformed{
      tally::execution::malformed_policy::abort};
  std::optional<std::string> log_file;
};

struct parse_result_t final {
  bool ok{false};
  bool show_help{false};
  options_t options;
  std::string error;
  std::string usage;
};

/// Parse `argv`. `usage` is always filled so callers can print it on error.
parse_result_t parse_options(int argc, const char* const* argv);

}  // namespace tally::config
